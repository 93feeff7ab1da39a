#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

#include "error.hpp"

#define _CONCAT_NAMES_INNER(a, b) a##b
#define _CONCAT_NAMES(a, b) _CONCAT_NAMES_INNER(a, b)
#define _ASSIGN_OR_RETURN_INNER(tmp, var, val)  \
    auto tmp = val;                             \
    if(!tmp.has_value()) {                      \
        return std::unexpected(tmp.error());    \
    }                                           \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RETURN(var, val)                                      \
    _ASSIGN_OR_RETURN_INNER(_CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), var, val)

// Val should be a rvalue.
#define DO_OR_RETURN(val)                               \
    if(auto rt = val; !rt.has_value())                  \
    {                                                   \
        return std::unexpected(std::move(rt).error());  \
    }

using Clock = std::chrono::system_clock;
using Time = std::chrono::time_point<Clock>;

template <typename Bytes>
nlohmann::json parseJSON(Bytes&& bs)
{
    return nlohmann::json::parse(bs, nullptr, false);
}

inline std::string urlEncode(std::string_view s)
{
    char* url_raw = curl_easy_escape(nullptr, s.data(), s.size());
    std::string url(url_raw);
    curl_free(url_raw);
    return url;
}

inline Time secondsToTime(const int64_t t)
{
    return Time(std::chrono::seconds(t));
}

// RFC 3339 in UTC with microseconds, e.g. 2024-05-01T08:30:00.123456Z.
inline std::string timeToISO8601(const Time& t)
{
    return std::format("{:%FT%TZ}",
                       std::chrono::floor<std::chrono::microseconds>(t));
}

template<typename NumType>
E<NumType> strToNumber(std::string_view s)
{
    NumType x{};
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto rt = std::from_chars(begin, end, x);
    if(rt.ec == std::errc::result_out_of_range)
    {
        return std::unexpected(runtimeError("out of range"));
    }
    if(rt.ptr == end && rt.ec == std::errc())
    {
        return x;
    }
    if(rt.ptr > begin)
    {
        return std::unexpected(runtimeError(
            "Only part of the string can be converted to number"));
    }
    return std::unexpected(runtimeError("Failed to convert string to number"));
}

// Lower case a string in-place.
inline std::string& toLower(std::string& s)
{
    std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Whether “needle” appears in “haystack”, both UTF-8, under full
// Unicode case folding. An empty needle is found everywhere.
inline bool containsIgnoreCase(std::string_view haystack,
                               std::string_view needle)
{
    if(needle.empty())
    {
        return true;
    }
    icu::UnicodeString h = icu::UnicodeString::fromUTF8(icu::StringPiece(
        haystack.data(), static_cast<int32_t>(haystack.size())));
    icu::UnicodeString n = icu::UnicodeString::fromUTF8(icu::StringPiece(
        needle.data(), static_cast<int32_t>(needle.size())));
    return h.foldCase().indexOf(n.foldCase()) >= 0;
}
