#include "asset_localizer.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <unordered_map>

#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Ar5iv {
namespace Engine {

using namespace Ar5iv::Core;
using namespace Ar5iv::Network::Http;

namespace {

constexpr const char* IMAGE_TAG = "img";
constexpr const char* SRC_ATTR  = "src";

// Leading dots belong to the stem: ".hidden" has no extension.
std::pair<std::string, std::string> split_extension(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || filename.find_first_not_of('.') >= dot)
        return {filename, ""};
    return {filename.substr(0, dot), filename.substr(dot)};
}

}  // namespace

AssetLocalizer::AssetLocalizer(ClientFactory factory, Storage::Storage& storage, int jobs)
    : factory_(std::move(factory)), storage_(storage), jobs_(jobs > 0 ? jobs : 1) {
}

std::string AssetLocalizer::unique_name(const Storage::Storage& storage,
                                        const std::string&      dir,
                                        const std::string&      filename,
                                        const std::string&      fallback_extension) {
    auto [stem, ext] = split_extension(filename);
    if (ext.empty())
        ext = fallback_extension;

    std::string candidate = stem + ext;
    for (int i = 1; storage.exists(dir + "/" + candidate); ++i)
        candidate = stem + "-" + std::to_string(i) + ext;
    return candidate;
}

std::vector<AssetLocalizer::PendingAsset> AssetLocalizer::collect(Dom::Document& document,
                                                                  const std::string& base_url) {
    std::vector<PendingAsset>               pending;
    std::unordered_map<std::string, size_t> index_by_url;

    auto images =
        document.find_all([](const Dom::Node& node) { return node.is_element(IMAGE_TAG); });
    for (Dom::Node* image : images) {
        const std::string* raw = image->attribute(SRC_ATTR);
        if (!raw)
            continue;

        std::string src = Utils::Text::trim(*raw);
        if (src.empty() || Utils::Url::is_data_url(src))
            continue;

        std::string url = Utils::Url::resolve(base_url, src);
        if (url.empty())
            continue;

        auto [it, inserted] = index_by_url.emplace(url, pending.size());
        if (inserted)
            pending.push_back({url, {}, {}});
        pending[it->second].nodes.push_back(image);
    }
    return pending;
}

void AssetLocalizer::fetch_one(HttpClient& client, PendingAsset& asset) const {
    Logger::info("Downloading: " + asset.url);
    asset.response = client.get(asset.url);
}

void AssetLocalizer::fetch_all(std::vector<PendingAsset>& pending) {
    if (jobs_ == 1 || pending.size() < 2) {
        auto client = factory_();
        for (auto& asset : pending)
            fetch_one(*client, asset);
        return;
    }

    // Every job owns its slot, so the pool needs no locking; results are applied afterwards.
    boost::asio::thread_pool pool(static_cast<size_t>(jobs_));
    for (auto& asset : pending) {
        boost::asio::post(pool, [this, &asset]() {
            auto client = factory_();
            fetch_one(*client, asset);
        });
    }
    pool.join();
}

bool AssetLocalizer::store(PendingAsset& asset, LocalizeReport& report) {
    const Response& res = asset.response;
    if (!res.success) {
        std::string reason = res.error.empty() ? "unknown error" : res.error;
        Logger::warn("failed to download image: " + asset.url + " (" + reason + ")");
        return false;
    }

    std::string filename = Utils::Url::path_filename(asset.url);
    if (filename.empty())
        filename = Constants::DEFAULT_ASSET;

    std::string fallback = get_file_extension(res.content_type);
    if (fallback.empty())
        fallback = Constants::SYNTHETIC_ASSET_EXTENSION;

    const std::string dir  = Constants::ASSETS_DIRNAME;
    std::string       name = unique_name(storage_, dir, filename, fallback);
    std::string       path = dir + "/" + name;
    if (!storage_.save(path, res.body, true)) {
        Logger::warn("failed to store image: " + asset.url + " (" + path + ")");
        return false;
    }

    for (Dom::Node* node : asset.nodes)
        node->set_attribute(SRC_ATTR, path);
    report.assets.push_back({asset.url, path});
    return true;
}

LocalizeReport AssetLocalizer::localize(Dom::Document& document, const std::string& base_url) {
    LocalizeReport report;

    std::vector<PendingAsset> pending = collect(document, base_url);
    fetch_all(pending);

    // Document order of first occurrence keeps names reproducible for any job count.
    for (auto& asset : pending) {
        if (!store(asset, report))
            ++report.failures;
    }
    return report;
}

}  // namespace Engine
}  // namespace Ar5iv
