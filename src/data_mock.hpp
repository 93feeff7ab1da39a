#pragma once

#include <string_view>
#include <vector>

#include <gmock/gmock.h>

#include "data.hpp"
#include "error.hpp"
#include "post.hpp"

class DataSourceMock : public DataSourceInterface
{
public:
    ~DataSourceMock() override = default;

    MOCK_METHOD(E<int64_t>, createPost, (Post&& draft), (override));
    MOCK_METHOD(E<Post>, getPost, (int64_t id), (const override));
    MOCK_METHOD(E<std::vector<Post>>, getPosts, (std::string_view term),
                (const override));
    MOCK_METHOD(E<Post>, updatePost, (int64_t id, Post&& draft), (override));
    MOCK_METHOD(E<void>, deletePost, (int64_t id), (override));
};
