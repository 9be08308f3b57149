#pragma once
#include <string>

#include "../types/constants.hpp"

namespace Ar5iv {
namespace Core {

struct Config {
    std::string source;
    std::string download_dir = Constants::DEFAULT_DOWNLOAD_DIR;
    std::string config_path;
    std::string user_agent = Constants::USER_AGENT;
    int         timeout    = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    int         jobs       = Constants::DEFAULT_JOBS;
    bool        verbose    = false;
    bool        quiet      = false;

    int log_level() const;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Ar5iv
