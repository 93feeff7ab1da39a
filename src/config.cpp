#include <charconv>
#include <string>
#include <expected>
#include <filesystem>
#include <fstream>
#include <format>
#include <iterator>
#include <utility>
#include <vector>

#include <ryml.hpp>
#include <ryml_std.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "error.hpp"

namespace {

E<std::vector<char>> readFile(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    std::vector<char> content;
    content.assign(std::istreambuf_iterator<char>(f),
                   std::istreambuf_iterator<char>());
    if(f.bad() || !f.is_open())
    {
        return std::unexpected(runtimeError(
            std::format("Failed to read file {}", path.string())));
    }

    return content;
}

template<class T>
bool getYamlValue(ryml::ConstNodeRef node, T& result)
{
    auto value = node.val();
    auto status = std::from_chars(value.begin(), value.end(), result);
    return status.ec == std::errc() && status.ptr == value.end();
}

E<spdlog::level::level_enum> logLevelFromStr(const std::string& name)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str() gives “off” for anything it does not know.
    if(level == spdlog::level::off && name != "off")
    {
        return std::unexpected(runtimeError(
            std::format("Invalid log level: {}", name)));
    }
    return level;
}

} // namespace

E<Configuration> Configuration::fromYaml(const std::filesystem::path& path)
{
    auto buffer = readFile(path);
    if(!buffer.has_value())
    {
        return std::unexpected(buffer.error());
    }

    ryml::Tree tree = ryml::parse_in_place(ryml::to_substr(*buffer));
    Configuration config;
    if(!tree.rootref().is_map())
    {
        // An empty file is fine; it just means all defaults.
        if(tree.rootref().has_val() || tree.rootref().is_seq())
        {
            return std::unexpected(runtimeError(
                "Configuration should be a YAML map"));
        }
        return config;
    }

    if(tree["listen-address"].readable())
    {
        tree["listen-address"] >> config.listen_address;
    }
    if(tree["listen-port"].readable())
    {
        if(!getYamlValue(tree["listen-port"], config.listen_port) ||
           config.listen_port <= 0 || config.listen_port > 65535)
        {
            return std::unexpected(runtimeError("Invalid port"));
        }
    }
    if(tree["log-level"].readable())
    {
        std::string level;
        tree["log-level"] >> level;
        auto parsed = logLevelFromStr(level);
        if(!parsed.has_value())
        {
            return std::unexpected(parsed.error());
        }
        config.log_level = *parsed;
    }
    if(tree["worker-threads"].readable())
    {
        if(!getYamlValue(tree["worker-threads"], config.worker_threads) ||
           config.worker_threads <= 0)
        {
            return std::unexpected(runtimeError("Invalid worker thread count"));
        }
    }

    return E<Configuration>{std::in_place, std::move(config)};
}
