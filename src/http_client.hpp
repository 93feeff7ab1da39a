#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <unordered_map>

#include <curl/curl.h>

#include "error.hpp"

struct HTTPRequest
{
    std::string url;
    std::string request_data;
    std::unordered_map<std::string, std::string> header;

    HTTPRequest() = default;
    explicit HTTPRequest(std::string_view uri) : url(uri) {}
    HTTPRequest& setPayload(std::string_view data);
    HTTPRequest& addHeader(std::string_view key, std::string_view value);
    HTTPRequest& setContentType(std::string_view type);
    bool operator==(const HTTPRequest& rhs) const = default;
};

struct HTTPResponse
{
    int status = 0;
    std::vector<std::byte> payload;
    std::unordered_map<std::string, std::string> header;

    HTTPResponse() = default;
    HTTPResponse(int status_code, std::string_view payload_str);
    void clear();
    std::string_view payloadAsStr() const;
};

// An HTTP client using libcurl, used to talk to a running server.
// Threads should not share session.
//
// Note that libcurl reuses HTTP connections by default. If you stop
// a server while a session still holds a connection to it, the
// server may wait for a while before shutting down. Destroy the
// session before stopping the server, preferably with RAII.
class HTTPSession
{
public:
    HTTPSession();
    ~HTTPSession();
    HTTPSession(const HTTPSession&) = delete;
    HTTPSession& operator=(const HTTPSession&) = delete;

    E<const HTTPResponse*> get(const std::string& uri)
    {
        return this->get(HTTPRequest(uri));
    }
    // The returned pointer is garenteed to be non-null, and is valid
    // until the next request.
    E<const HTTPResponse*> get(const HTTPRequest& req);
    E<const HTTPResponse*> post(const HTTPRequest& req);
    E<const HTTPResponse*> put(const HTTPRequest& req);
    E<const HTTPResponse*> del(const HTTPRequest& req);

private:
    CURL* handle = nullptr;
    HTTPResponse res;

    E<const HTTPResponse*> perform(const HTTPRequest& req,
                                   const char* method);

    static size_t writeResponse(char *ptr, size_t size, size_t nmemb,
                                void *res_buffer);
    static size_t writeHeaders(char *buffer, size_t size, size_t nitems,
                               void *userdata);
};
