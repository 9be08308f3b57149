#include "../../../core/logger/logger.hpp"
#include "../../../core/types/constants.hpp"
#include "../../../utils/text/charset.hpp"
#include "../pipeline.hpp"

namespace Ar5iv {
namespace Engine {

using namespace Ar5iv::Core;
using namespace Ar5iv::Utils::Text;

std::optional<FetchedDocument> Pipeline::fetch_document(const std::string& url) const {
    Logger::info("Fetching: " + url);

    auto client   = configured_factory()();
    auto response = client->get(url);
    if (!response.success) {
        Logger::error("failed to fetch: " + url + " (" + response.error + ")");
        return std::nullopt;
    }

    std::string charset = charset_from_content_type(response.content_type);
    if (charset.empty()) {
        charset = Constants::DEFAULT_CHARSET;
    }
    else if (!is_supported_charset(charset)) {
        Logger::warn("unsupported charset " + charset + ", decoding as "
                     + Constants::DEFAULT_CHARSET);
    }

    FetchedDocument document;
    document.html     = decode_to_utf8(response.body, charset);
    document.base_url = response.effective_url.empty() ? url : response.effective_url;
    return document;
}

}  // namespace Engine
}  // namespace Ar5iv
