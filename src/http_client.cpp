#include <cstddef>
#include <cstring>
#include <format>
#include <string>
#include <string_view>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "http_client.hpp"
#include "error.hpp"

namespace {

std::string_view trimSpaces(std::string_view s)
{
    constexpr std::string_view SPACES = " \t\r\n";
    size_t begin = s.find_first_not_of(SPACES);
    if(begin == std::string_view::npos)
    {
        return {};
    }
    size_t end = s.find_last_not_of(SPACES);
    return s.substr(begin, end - begin + 1);
}

} // namespace

HTTPRequest& HTTPRequest::setPayload(std::string_view data)
{
    request_data = data;
    return *this;
}

HTTPRequest& HTTPRequest::addHeader(std::string_view key,
                                    std::string_view value)
{
    header.emplace(key, value);
    return *this;
}

HTTPRequest& HTTPRequest::setContentType(std::string_view type)
{
    return addHeader("Content-Type", type);
}

HTTPResponse::HTTPResponse(int status_code, std::string_view payload_str)
        : status(status_code)
{
    payload.resize(payload_str.size());
    std::memcpy(payload.data(), payload_str.data(), payload_str.size());
}

void HTTPResponse::clear()
{
    status = 0;
    payload.clear();
    header.clear();
}

std::string_view HTTPResponse::payloadAsStr() const
{
    return {reinterpret_cast<const char*>(payload.data()), payload.size()};
}

HTTPSession::HTTPSession()
{
    handle = curl_easy_init();
}

HTTPSession::~HTTPSession()
{
    if(handle != nullptr)
    {
        curl_easy_cleanup(handle);
    }
}

E<const HTTPResponse*> HTTPSession::get(const HTTPRequest& req)
{
    return perform(req, "GET");
}

E<const HTTPResponse*> HTTPSession::post(const HTTPRequest& req)
{
    return perform(req, "POST");
}

E<const HTTPResponse*> HTTPSession::put(const HTTPRequest& req)
{
    return perform(req, "PUT");
}

E<const HTTPResponse*> HTTPSession::del(const HTTPRequest& req)
{
    return perform(req, "DELETE");
}

E<const HTTPResponse*> HTTPSession::perform(const HTTPRequest& req,
                                            const char* method)
{
    if(handle == nullptr)
    {
        return std::unexpected(runtimeError("Failed to initialize libcurl"));
    }
    curl_easy_reset(handle);
    res.clear();

    curl_easy_setopt(handle, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method);
    if(std::string_view(method) == "POST" || std::string_view(method) == "PUT")
    {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, req.request_data.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(req.request_data.size()));
    }
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &writeResponse);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &res);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &writeHeaders);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &res);

    curl_slist* headers = nullptr;
    for(const auto& [key, value]: req.header)
    {
        headers = curl_slist_append(
            headers, std::format("{}: {}", key, value).c_str());
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);

    spdlog::debug("{} {}...", method, req.url);
    CURLcode code = curl_easy_perform(handle);
    curl_slist_free_all(headers);
    if(code != CURLE_OK)
    {
        return std::unexpected(runtimeError(std::format(
            "{} {} failed: {}", method, req.url, curl_easy_strerror(code))));
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    res.status = static_cast<int>(status);
    return &res;
}

size_t HTTPSession::writeResponse(char *ptr, size_t size, size_t nmemb,
                                  void *res_buffer)
{
    auto* response = static_cast<HTTPResponse*>(res_buffer);
    const auto* begin = reinterpret_cast<const std::byte*>(ptr);
    response->payload.insert(response->payload.end(), begin,
                             begin + size * nmemb);
    return size * nmemb;
}

size_t HTTPSession::writeHeaders(char *buffer, size_t size, size_t nitems,
                                 void *userdata)
{
    auto* response = static_cast<HTTPResponse*>(userdata);
    std::string_view line(buffer, size * nitems);
    size_t colon = line.find(':');
    if(colon != std::string_view::npos)
    {
        response->header[std::string(trimSpaces(line.substr(0, colon)))] =
            std::string(trimSpaces(line.substr(colon + 1)));
    }
    return size * nitems;
}
