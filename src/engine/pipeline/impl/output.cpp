#include <filesystem>

#include "../../../utils/url/url.hpp"
#include "../pipeline.hpp"

namespace Ar5iv {
namespace Engine {

namespace fs = std::filesystem;

std::string Pipeline::output_dir(const std::string& url) const {
    return (fs::path(download_dir_) / Utils::Url::to_basename(url)).string();
}

bool Pipeline::is_populated(const std::string& dir, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(dir, ec))
        return false;
    return !fs::is_empty(dir, ec);
}

}  // namespace Engine
}  // namespace Ar5iv
