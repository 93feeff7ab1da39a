#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "post.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace {

// Read an optional string field. Null is the same as absent.
E<void> readString(const nlohmann::json& j, const char* key,
                   std::string& result)
{
    auto it = j.find(key);
    if(it == j.end() || it->is_null())
    {
        return {};
    }
    if(!it->is_string())
    {
        return std::unexpected(runtimeError(
            std::format("Field {} should be a string", key)));
    }
    result = it->get<std::string>();
    return {};
}

nlohmann::json timeToJson(const std::optional<Time>& t)
{
    if(t.has_value())
    {
        return timeToISO8601(*t);
    }
    return nullptr;
}

} // namespace

std::vector<std::string> Post::missingFields() const
{
    std::vector<std::string> fields;
    if(title.empty())
    {
        fields.push_back("title");
    }
    if(content.empty())
    {
        fields.push_back("content");
    }
    return fields;
}

nlohmann::json Post::toJson() const
{
    nlohmann::json result;
    if(id.has_value())
    {
        result["id"] = *id;
    }
    else
    {
        result["id"] = 0;
    }
    result["title"] = title;
    result["content"] = content;
    result["category"] = category;
    result["tags"] = tags;
    result["createdAt"] = timeToJson(create_time);
    result["updatedAt"] = timeToJson(update_time);
    return result;
}

E<Post> Post::fromJson(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(runtimeError("Post should be a JSON object"));
    }

    Post p;
    DO_OR_RETURN(readString(j, "title", p.title));
    DO_OR_RETURN(readString(j, "content", p.content));
    DO_OR_RETURN(readString(j, "category", p.category));

    auto tags = j.find("tags");
    if(tags != j.end() && !tags->is_null())
    {
        if(!tags->is_array())
        {
            return std::unexpected(runtimeError("Tags should be an array"));
        }
        for(const nlohmann::json& tag: *tags)
        {
            if(!tag.is_string())
            {
                return std::unexpected(runtimeError(
                    "Every tag should be a string"));
            }
            p.tags.push_back(tag.get<std::string>());
        }
    }
    return p;
}

std::ostream& operator<<(std::ostream& stream, const Post& p)
{
    stream << "ID: ";
    if(p.id.has_value())
    {
        stream << *p.id;
    }
    else
    {
        stream << "none";
    }
    stream << "\n"
           << "Title: " << p.title << "\n"
           << "Content: " << p.content << "\n"
           << "Category: " << p.category << "\n"
           << "Tags:";
    for(const std::string& tag: p.tags)
    {
        stream << " " << tag;
    }
    return stream;
}
