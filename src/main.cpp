#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "config.hpp"
#include "data.hpp"
#include "error.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options(
        "post-service", "An in-memory CRUD service of posts over HTTP");
    cmd_options.add_options()
        ("c,config", "Config file. Built-in defaults are used if not given.",
         cxxopts::value<std::string>())
        ("h,help", "Print this message.");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        spdlog::error("Invalid command line: {}", e.what());
        std::cerr << cmd_options.help() << std::endl;
        return 1;
    }

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    Configuration conf;
    if(opts.count("config") == 1)
    {
        const std::string config_file = opts["config"].as<std::string>();
        auto conf_maybe = Configuration::fromYaml(config_file);
        if(!conf_maybe.has_value())
        {
            spdlog::error("Failed to load configuration: {}",
                          errorMsg(conf_maybe.error()));
            return 3;
        }
        conf = *std::move(conf_maybe);
    }
    spdlog::set_level(conf.log_level);

    App app(conf, std::make_unique<DataSourceMemory>());
    if(auto ok_maybe = app.start(); !ok_maybe)
    {
        spdlog::error(errorMsg(ok_maybe.error()));
        return 4;
    }
    app.wait();

    return 0;
}
