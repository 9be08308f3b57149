#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../logger/logger.hpp"

namespace Ar5iv {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["download_dir"])
            config.download_dir = yaml["download_dir"].as<std::string>();
        if (yaml["output"])
            config.download_dir = yaml["output"].as<std::string>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["jobs"])
            config.jobs = yaml["jobs"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

int Config::log_level() const {
    if (quiet)
        return LOG_ERROR;
    if (verbose)
        return LOG_ALL;
    return LOG_WARN | LOG_ERROR;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"ar5iv2md - Convert ar5iv papers to Markdown with local assets"};

    app.add_option("source", config.source, "arXiv identifier, file name or ar5iv URL")
        ->required();
    app.add_option("-d,--download-dir", config.download_dir, "Output base directory");
    app.add_option("-t,--timeout", config.timeout, "Request timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("-j,--jobs", config.jobs, "Parallel image downloads")
        ->check(CLI::PositiveNumber);
    app.add_option("--user-agent", config.user_agent, "HTTP User-Agent header");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("-v,--verbose", config.verbose, "Log progress information");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");
    app.set_version_flag("--version", Constants::VERSION);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command line values win over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

}  // namespace Core
}  // namespace Ar5iv
