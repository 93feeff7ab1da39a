#pragma once

#include <string>
#include <expected>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "error.hpp"

struct Configuration
{
    std::string listen_address = "0.0.0.0";
    int listen_port = 8080;
    spdlog::level::level_enum log_level = spdlog::level::info;
    // Number of threads serving requests.
    int worker_threads = 8;

    // Keys missing from the file keep their default values.
    static E<Configuration> fromYaml(const std::filesystem::path& path);
};
