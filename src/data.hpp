#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "post.hpp"
#include "error.hpp"

// Storage of posts. All methods are safe to call from multiple
// threads. A post that does not exist is reported as a
// NotFoundError; anything else that goes wrong is a RuntimeError.
class DataSourceInterface
{
public:
    virtual ~DataSourceInterface() = default;

    // Store a new post and return its ID. The ID and the times of
    // the draft are ignored; the data source assigns them. IDs start
    // from 1 and are never reused.
    virtual E<int64_t> createPost(Post&& draft) = 0;
    // Get one post by ID.
    virtual E<Post> getPost(int64_t id) const = 0;
    // Get all posts whose title, content, or category contains
    // “term”, ignoring case, in no particular order. An empty term
    // matches every post.
    virtual E<std::vector<Post>> getPosts(std::string_view term) const = 0;
    // Replace the title, content, category and tags of an existing
    // post, and set its update time to now. Return the updated post.
    virtual E<Post> updatePost(int64_t id, Post&& draft) = 0;
    // Delete a post by ID.
    virtual E<void> deletePost(int64_t id) = 0;
};

class DataSourceMemory : public DataSourceInterface
{
public:
    DataSourceMemory() = default;
    ~DataSourceMemory() override = default;
    DataSourceMemory(const DataSourceMemory&) = delete;
    DataSourceMemory& operator=(const DataSourceMemory&) = delete;

    E<int64_t> createPost(Post&& draft) override;
    E<Post> getPost(int64_t id) const override;
    E<std::vector<Post>> getPosts(std::string_view term) const override;
    E<Post> updatePost(int64_t id, Post&& draft) override;
    E<void> deletePost(int64_t id) override;

private:
    // Guards both “posts” and “next_id”. Writers take it exclusively.
    mutable std::shared_mutex lock;
    std::unordered_map<int64_t, Post> posts;
    int64_t next_id = 1;
};
