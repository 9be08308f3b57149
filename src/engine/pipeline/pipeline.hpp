#pragma once
#include <optional>
#include <string>
#include <system_error>

#include "../../core/types/constants.hpp"
#include "../../dom/document.hpp"
#include "../../storage/storage.hpp"
#include "../stages/asset_localizer.hpp"

#ifndef CPPCHECK
class PipelineTest_OutputLayout_Test;
#endif

namespace Ar5iv {
namespace Engine {

struct PipelineConfig {
    std::string download_dir = Core::Constants::DEFAULT_DOWNLOAD_DIR;
    int         timeout      = Core::Constants::REQUEST_TIMEOUT_SECONDS;
    int         jobs         = Core::Constants::DEFAULT_JOBS;
    std::string user_agent   = Core::Constants::USER_AGENT;
};

enum class RunStatus {
    Written,      // README.md produced, possibly with some remote images left
    Skipped,      // output directory already populated
    FetchFailed,  // document could not be fetched
    WriteFailed,  // README.md could not be written
};

struct RunResult {
    RunStatus   status = RunStatus::FetchFailed;
    std::string output_path;
    size_t      assets         = 0;
    size_t      asset_failures = 0;
};

int exit_code(RunStatus status);

struct FetchedDocument {
    std::string html;
    std::string base_url;  // after redirects
};

// Sanitize, localize assets, normalize math, convert, restore bibliography anchors.
class Pipeline {
#ifndef CPPCHECK
    friend class ::PipelineTest_OutputLayout_Test;
#endif

public:
    explicit Pipeline(const PipelineConfig& config);
    Pipeline(const PipelineConfig& config, ClientFactory factory);

    RunResult run(const std::string& source);

    // Runs every DOM and text stage; assets are written through `storage`.
    std::string
    transform(Dom::Document& document, const std::string& base_url, Storage::Storage& storage,
              LocalizeReport& report) const;

#ifdef CPPCHECK
public:
#else
private:
#endif
    std::string   download_dir_;
    int           timeout_;
    int           jobs_;
    std::string   user_agent_;
    ClientFactory factory_;

    ClientFactory                  configured_factory() const;
    std::optional<FetchedDocument> fetch_document(const std::string& url) const;

    std::string output_dir(const std::string& url) const;
    // A missing directory is not populated; `ec` is set when the answer is unknown.
    static bool is_populated(const std::string& dir, std::error_code& ec);
};

}  // namespace Engine
}  // namespace Ar5iv
