#include "pipeline.hpp"
#include <filesystem>

#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../storage/disk_storage.hpp"
#include "../../utils/text/converter.hpp"
#include "../../utils/url/url.hpp"
#include "../stages/bibliography.hpp"
#include "../stages/math_normalizer.hpp"
#include "../stages/sanitizer.hpp"

namespace Ar5iv {
namespace Engine {

using namespace Ar5iv::Core;
using namespace Ar5iv::Network::Http;

namespace fs = std::filesystem;

int exit_code(RunStatus status) {
    switch (status) {
        case RunStatus::Written:
        case RunStatus::Skipped:
            return 0;
        case RunStatus::FetchFailed:
        case RunStatus::WriteFailed:
            return 1;
    }
    return 1;
}

Pipeline::Pipeline(const PipelineConfig& config)
    : Pipeline(config, []() { return std::make_unique<CurlClient>(); }) {
}

Pipeline::Pipeline(const PipelineConfig& config, ClientFactory factory)
    : download_dir_(config.download_dir),
      timeout_(config.timeout),
      jobs_(config.jobs),
      user_agent_(config.user_agent),
      factory_(std::move(factory)) {
}

ClientFactory Pipeline::configured_factory() const {
    return [factory = factory_, timeout = timeout_, agent = user_agent_]() {
        auto client = factory();
        client->set_timeout(timeout);
        client->set_user_agent(agent);
        return client;
    };
}

std::string Pipeline::transform(Dom::Document&     document,
                                const std::string& base_url,
                                Storage::Storage&  storage,
                                LocalizeReport&    report) const {
    size_t footers = Sanitizer::sanitize(document);
    Logger::info("Removed " + std::to_string(footers) + " footer region(s)");

    AssetLocalizer localizer(configured_factory(), storage, jobs_);
    report = localizer.localize(document, base_url);
    Logger::info("Localized " + std::to_string(report.assets.size()) + " image(s), "
                 + std::to_string(report.failures) + " failed");

    size_t formulas = MathNormalizer::normalize(document);
    Logger::info("Converted " + std::to_string(formulas) + " formula(s) to TeX");

    // Ids have to be taken before html2md drops them.
    std::vector<std::string> ids = Bibliography::harvest_ids(document);

    std::string markdown = Utils::Text::Converter::to_markdown(document.serialize());
    return Bibliography::restore_anchors(markdown, ids);
}

RunResult Pipeline::run(const std::string& source) {
    RunResult result;

    const std::string url = Utils::Url::to_document_url(source);
    const std::string dir = output_dir(url);
    result.output_path = (fs::path(dir) / Constants::README_FILENAME).lexically_normal().string();

    std::error_code ec;
    bool            populated = is_populated(dir, ec);
    if (ec) {
        Logger::error("cannot inspect output directory: " + dir + " (" + ec.message() + ")");
        result.status = RunStatus::WriteFailed;
        return result;
    }
    if (populated) {
        Logger::warn("output directory is not empty, skipping: " + dir);
        result.status = RunStatus::Skipped;
        return result;
    }

    auto fetched = fetch_document(url);
    if (!fetched) {
        result.status = RunStatus::FetchFailed;
        return result;
    }

    Dom::Document        document = Dom::Document::parse(fetched->html);
    Storage::DiskStorage storage(dir);
    LocalizeReport       report;
    std::string          markdown = transform(document, fetched->base_url, storage, report);

    result.assets         = report.assets.size();
    result.asset_failures = report.failures;

    if (!storage.save(Constants::README_FILENAME, markdown)) {
        Logger::error("failed to write: " + result.output_path);
        result.status = RunStatus::WriteFailed;
        return result;
    }

    result.status = RunStatus::Written;
    return result;
}

}  // namespace Engine
}  // namespace Ar5iv
