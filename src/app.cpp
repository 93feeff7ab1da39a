#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "config.hpp"
#include "data.hpp"
#include "error.hpp"
#include "post.hpp"
#include "utils.hpp"

#define _ASSIGN_OR_RESPOND_ERROR(tmp, var, val, res)                    \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        respondError(tmp.error(), res);                                 \
        return;                                                         \
    }                                                                   \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RESPOND_ERROR(var, val, res)                          \
    _ASSIGN_OR_RESPOND_ERROR(_CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), \
                            var, val, res)

namespace {

constexpr std::string_view POSTS_PATH = "/posts";
constexpr char JSON_TYPE[] = "application/json";

void setJSON(const nlohmann::json& body, int status, httplib::Response& res)
{
    res.status = status;
    res.set_content(body.dump(), JSON_TYPE);
}

void respondError(int status, std::string_view msg, httplib::Response& res)
{
    if(status >= 500)
    {
        spdlog::warn("Responding {}: {}", status, msg);
    }
    setJSON({{"error", std::string(msg)}}, status, res);
}

void respondError(const Error& e, httplib::Response& res)
{
    int status = 500;
    if(std::holds_alternative<HTTPError>(e))
    {
        status = std::get<HTTPError>(e).code;
    }
    else if(std::holds_alternative<NotFoundError>(e))
    {
        status = 404;
    }
    respondError(status, errorMsg(e), res);
}

void respondMethodNotAllowed(std::string_view allowed, httplib::Response& res)
{
    res.set_header("Allow", std::string(allowed));
    respondError(405, "Method not allowed", res);
}

// Set a 400 response naming the missing fields, if there are any.
bool checkRequiredFields(const Post& draft, httplib::Response& res)
{
    std::vector<std::string> missing = draft.missingFields();
    if(missing.empty())
    {
        return true;
    }
    setJSON({{"error", "title and content are required"},
             {"fields", std::move(missing)}}, 400, res);
    return false;
}

// An ID is decimal digits with an optional leading “+”, so “-1”,
// “1/2” and “1.0” are all rejected.
E<int64_t> idFromStr(std::string_view s)
{
    const Error invalid = httpError(400, "Invalid post ID");
    if(s.starts_with('+'))
    {
        s.remove_prefix(1);
    }
    if(!std::all_of(s.begin(), s.end(),
                    [](unsigned char c) { return std::isdigit(c); }))
    {
        return std::unexpected(invalid);
    }
    return strToNumber<int64_t>(s).or_else(
        [&]([[maybe_unused]] auto _) -> E<int64_t>
        {
            return std::unexpected(invalid);
        });
}

} // namespace

App::App(const Configuration& conf,
         std::unique_ptr<DataSourceInterface> data_source)
        : config(conf),
          data(std::move(data_source))
{
    setup();
}

App::~App()
{
    if(server_thread.joinable())
    {
        stop();
        wait();
    }
}

void App::handlePosts(const httplib::Request& req, httplib::Response& res)
{
    std::string_view path = req.path;
    if(!path.starts_with(POSTS_PATH))
    {
        respondError(404, "Not found", res);
        return;
    }
    std::string_view rest = path.substr(POSTS_PATH.size());

    if(rest.empty() || rest == "/")
    {
        if(req.method == "GET")
        {
            handleListPosts(req, res);
        }
        else if(req.method == "POST")
        {
            handleCreatePost(req, res);
        }
        else
        {
            respondMethodNotAllowed("GET, POST", res);
        }
        return;
    }

    if(rest.front() != '/')
    {
        respondError(404, "Not found", res);
        return;
    }

    ASSIGN_OR_RESPOND_ERROR(int64_t id, idFromStr(rest.substr(1)), res);
    if(req.method == "GET")
    {
        handleGetPost(id, res);
    }
    else if(req.method == "PUT")
    {
        handleUpdatePost(id, req, res);
    }
    else if(req.method == "DELETE")
    {
        handleDeletePost(id, res);
    }
    else
    {
        respondMethodNotAllowed("GET, PUT, DELETE", res);
    }
}

void App::handleCreatePost(const httplib::Request& req, httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(Post draft, requestToPost(req), res);
    if(!checkRequiredFields(draft, res))
    {
        return;
    }

    ASSIGN_OR_RESPOND_ERROR(int64_t id, data->createPost(std::move(draft)),
                            res);
    spdlog::debug("Created post {}.", id);
    // Respond with what is actually stored, which has the ID and
    // times filled in.
    ASSIGN_OR_RESPOND_ERROR(
        Post p, data->getPost(id).or_else(
            [id](const Error& e) -> E<Post>
            {
                return std::unexpected(runtimeError(std::format(
                    "Failed to retrieve created post {}: {}", id,
                    errorMsg(e))));
            }), res);
    setJSON(p.toJson(), 201, res);
}

void App::handleListPosts(const httplib::Request& req, httplib::Response& res)
    const
{
    std::string term = req.get_param_value("term");
    ASSIGN_OR_RESPOND_ERROR(std::vector<Post> posts, data->getPosts(term), res);
    nlohmann::json posts_json = nlohmann::json::array();
    for(const Post& p: posts)
    {
        posts_json.push_back(p.toJson());
    }
    setJSON(posts_json, 200, res);
}

void App::handleGetPost(int64_t id, httplib::Response& res) const
{
    ASSIGN_OR_RESPOND_ERROR(Post p, data->getPost(id), res);
    setJSON(p.toJson(), 200, res);
}

void App::handleUpdatePost(int64_t id, const httplib::Request& req,
                           httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(Post draft, requestToPost(req), res);
    if(!checkRequiredFields(draft, res))
    {
        return;
    }

    ASSIGN_OR_RESPOND_ERROR(Post p, data->updatePost(id, std::move(draft)),
                            res);
    spdlog::debug("Updated post {}.", id);
    setJSON(p.toJson(), 200, res);
}

void App::handleDeletePost(int64_t id, httplib::Response& res)
{
    auto ok_maybe = data->deletePost(id);
    if(!ok_maybe)
    {
        respondError(ok_maybe.error(), res);
        return;
    }
    spdlog::debug("Deleted post {}.", id);
    res.status = 204;
}

void App::handleHealth(httplib::Response& res) const
{
    setJSON({{"status", "ok"}}, 200, res);
}

E<Post> App::requestToPost(const httplib::Request& req) const
{
    nlohmann::json body = parseJSON(req.body);
    if(body.is_discarded())
    {
        return std::unexpected(httpError(400, "Invalid request body"));
    }
    return Post::fromJson(body).or_else([](const Error& e) -> E<Post>
    {
        spdlog::debug("Rejecting request body: {}", errorMsg(e));
        return std::unexpected(httpError(400, "Invalid request body"));
    });
}

void App::setup()
{
    server.new_task_queue = [threads = config.worker_threads]
    {
        return new httplib::ThreadPool(threads);
    };
    server.set_logger([](const httplib::Request& req,
                         const httplib::Response& res)
    {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });

    // The ID part is matched loosely here; handlePosts() rejects bad
    // IDs with a 400.
    const std::string posts_pattern = std::format("{}(/.*)?", POSTS_PATH);
    auto posts_handler = [&](const httplib::Request& req,
                             httplib::Response& res)
    {
        handlePosts(req, res);
    };
    server.Get(posts_pattern, posts_handler);
    server.Post(posts_pattern, posts_handler);
    server.Put(posts_pattern, posts_handler);
    server.Patch(posts_pattern, posts_handler);
    server.Delete(posts_pattern, posts_handler);
    server.Options(posts_pattern, posts_handler);

    server.Get("/health", [&]([[maybe_unused]] const httplib::Request& req,
                              httplib::Response& res)
    {
        handleHealth(res);
    });
}

E<void> App::start()
{
    if(!server.bind_to_port(config.listen_address, config.listen_port))
    {
        return std::unexpected(runtimeError(std::format(
            "Failed to listen at {}:{}", config.listen_address,
            config.listen_port)));
    }
    spdlog::info("Listening at http://{}:{}/...", config.listen_address,
                 config.listen_port);
    server_thread = std::thread([&]
    {
        if(!server.listen_after_bind())
        {
            spdlog::error("Server stopped with an error.");
        }
    });
    server.wait_until_ready();
    return {};
}

void App::stop()
{
    server.stop();
}

void App::wait()
{
    if(server_thread.joinable())
    {
        server_thread.join();
    }
}
