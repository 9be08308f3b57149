#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../../dom/document.hpp"
#include "../../network/http/http_client.hpp"
#include "../../storage/storage.hpp"

namespace Ar5iv {
namespace Engine {

using ClientFactory = std::function<std::unique_ptr<Network::Http::HttpClient>()>;

struct AssetReference {
    std::string original_url;  // absolute
    std::string local_path;    // "assets/<name>"
};

struct LocalizeReport {
    std::vector<AssetReference> assets;
    size_t                      failures = 0;
};

// Downloads every distinct image of a document once and points its nodes at the local copy.
class AssetLocalizer {
public:
    AssetLocalizer(ClientFactory factory, Storage::Storage& storage, int jobs = 1);

    LocalizeReport localize(Dom::Document& document, const std::string& base_url);

    // "x.png" -> "x.png", "x-1.png", "x-2.png", ... first name not present in `dir`.
    static std::string unique_name(const Storage::Storage& storage,
                                   const std::string&      dir,
                                   const std::string&      filename,
                                   const std::string&      fallback_extension);

private:
    struct PendingAsset {
        std::string             url;
        std::vector<Dom::Node*> nodes;
        Network::Http::Response response;
    };

    ClientFactory     factory_;
    Storage::Storage& storage_;
    int               jobs_;

    static std::vector<PendingAsset> collect(Dom::Document& document, const std::string& base_url);

    void fetch_all(std::vector<PendingAsset>& pending);
    void fetch_one(Network::Http::HttpClient& client, PendingAsset& asset) const;
    bool store(PendingAsset& asset, LocalizeReport& report);
};

}  // namespace Engine
}  // namespace Ar5iv
