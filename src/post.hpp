#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "utils.hpp"

class Post
{
public:
    // Drafts do not have ID and times. They are assigned by the data
    // source.
    std::optional<int64_t> id;
    std::string title;
    std::string content;
    std::string category;
    std::vector<std::string> tags;
    std::optional<Time> create_time;
    std::optional<Time> update_time;

    bool operator==(const Post& rhs) const = default;

    // Names of the required fields that are empty. An empty result
    // means the post can be saved.
    std::vector<std::string> missingFields() const;

    // The wire representation. Missing times are written as null.
    nlohmann::json toJson() const;
    // Build a draft out of a request body. Only title, content,
    // category and tags are read; everything else is ignored. Fails
    // if the body is not an object or a known field has the wrong
    // type.
    static E<Post> fromJson(const nlohmann::json& j);
};

std::ostream& operator<<(std::ostream& stream, const Post& p);
