#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>

struct RuntimeError
{
    std::string msg;
};

// An error that already knows which HTTP status it should become.
struct HTTPError
{
    int code;
    std::string msg;
};

// The requested entity does not exist.
struct NotFoundError
{
    std::string msg;
};

using Error = std::variant<RuntimeError, HTTPError, NotFoundError>;

template<typename T>
using E = std::expected<T, Error>;

inline Error runtimeError(std::string_view msg)
{
    return RuntimeError{std::string(msg)};
}

inline Error httpError(int code, std::string_view msg)
{
    return HTTPError{code, std::string(msg)};
}

inline Error notFoundError(std::string_view msg)
{
    return NotFoundError{std::string(msg)};
}

inline std::string errorMsg(const Error& err)
{
    return std::visit([](const auto& e) { return e.msg; }, err);
}

inline bool isNotFound(const Error& err)
{
    return std::holds_alternative<NotFoundError>(err);
}
