#pragma once

#include <cstdint>
#include <memory>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "data.hpp"
#include "error.hpp"
#include "post.hpp"

class App
{
public:
    App() = delete;
    App(const Configuration& conf,
        std::unique_ptr<DataSourceInterface> data_source);
    ~App();
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Entry point of everything under /posts. Work out the operation
    // from the method and the path, and call one of the handlers
    // below.
    void handlePosts(const httplib::Request& req, httplib::Response& res);

    void handleCreatePost(const httplib::Request& req, httplib::Response& res);
    void handleListPosts(const httplib::Request& req, httplib::Response& res)
        const;
    void handleGetPost(int64_t id, httplib::Response& res) const;
    void handleUpdatePost(int64_t id, const httplib::Request& req,
                          httplib::Response& res);
    void handleDeletePost(int64_t id, httplib::Response& res);
    void handleHealth(httplib::Response& res) const;

    // Bind to the configured address and serve in a background
    // thread. Return when the server is ready to take requests.
    E<void> start();
    void stop();
    // Block until the server stops.
    void wait();

private:
    // Decode a post draft from a JSON request body.
    E<Post> requestToPost(const httplib::Request& req) const;

    void setup();

    const Configuration config;
    std::unique_ptr<DataSourceInterface> data;
    std::thread server_thread;
    httplib::Server server;
};
