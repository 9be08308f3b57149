#include <curl/curl.h>
#include <iostream>
#include <stdexcept>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/pipeline/pipeline.hpp"

namespace {

Ar5iv::Engine::RunResult run_pipeline(const Ar5iv::Core::Config& config) {
    curl_global_init(CURL_GLOBAL_ALL);

    Ar5iv::Engine::RunResult result;
    {
        Ar5iv::Engine::PipelineConfig pipeline_config;
        pipeline_config.download_dir = config.download_dir;
        pipeline_config.timeout      = config.timeout;
        pipeline_config.jobs         = config.jobs;
        pipeline_config.user_agent   = config.user_agent;

        Ar5iv::Engine::Pipeline pipeline(pipeline_config);
        result = pipeline.run(config.source);
    }

    curl_global_cleanup();
    return result;
}

}  // namespace

int main(int argc, char* argv[]) {
    Ar5iv::Core::Config config;
    try {
        config = Ar5iv::Core::Config::parse(argc, argv);
    } catch (const std::runtime_error& e) {
        Ar5iv::Core::Logger::error(e.what());
        return 2;
    }
    Ar5iv::Core::Logger::set_level(config.log_level());

    auto result = run_pipeline(config);

    switch (result.status) {
        case Ar5iv::Engine::RunStatus::Written:
        case Ar5iv::Engine::RunStatus::Skipped:
            std::cout << result.output_path << std::endl;
            break;
        case Ar5iv::Engine::RunStatus::FetchFailed:
        case Ar5iv::Engine::RunStatus::WriteFailed:
            break;
    }

    return Ar5iv::Engine::exit_code(result.status);
}
