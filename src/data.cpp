#include <format>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

#include "data.hpp"
#include "error.hpp"
#include "utils.hpp"
#include "post.hpp"

namespace {

Error postNotFound(int64_t id)
{
    return notFoundError(std::format("Post with id {} not found", id));
}

bool postMatches(const Post& p, std::string_view term)
{
    return containsIgnoreCase(p.title, term) ||
        containsIgnoreCase(p.content, term) ||
        containsIgnoreCase(p.category, term);
}

} // namespace

E<int64_t> DataSourceMemory::createPost(Post&& draft)
{
    const Time now = Clock::now();
    std::unique_lock guard(lock);

    int64_t id = next_id++;
    draft.id = id;
    draft.create_time = now;
    draft.update_time = now;
    posts.emplace(id, std::move(draft));
    return id;
}

E<Post> DataSourceMemory::getPost(int64_t id) const
{
    std::shared_lock guard(lock);
    auto it = posts.find(id);
    if(it == std::end(posts))
    {
        return std::unexpected(postNotFound(id));
    }
    return it->second;
}

E<std::vector<Post>> DataSourceMemory::getPosts(std::string_view term) const
{
    std::shared_lock guard(lock);
    std::vector<Post> result;
    result.reserve(posts.size());
    for(const auto& [id, p]: posts)
    {
        if(postMatches(p, term))
        {
            result.push_back(p);
        }
    }
    return result;
}

E<Post> DataSourceMemory::updatePost(int64_t id, Post&& draft)
{
    std::unique_lock guard(lock);
    auto it = posts.find(id);
    if(it == std::end(posts))
    {
        return std::unexpected(postNotFound(id));
    }

    Post& p = it->second;
    p.title = std::move(draft.title);
    p.content = std::move(draft.content);
    p.category = std::move(draft.category);
    p.tags = std::move(draft.tags);
    // Update time never goes backwards, even if the system clock
    // does.
    Time now = Clock::now();
    if(p.update_time.has_value() && now < *p.update_time)
    {
        now = *p.update_time;
    }
    p.update_time = now;
    return p;
}

E<void> DataSourceMemory::deletePost(int64_t id)
{
    std::unique_lock guard(lock);
    if(posts.erase(id) == 0)
    {
        return std::unexpected(postNotFound(id));
    }
    return {};
}
