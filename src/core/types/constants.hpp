#pragma once
#include <cctype>
#include <map>
#include <string>
#include <vector>

namespace Ar5iv {
namespace Core {

struct Constants {
    static constexpr const char* VERSION              = "0.1.0";
    static constexpr const char* USER_AGENT           = "ar5iv2md/0.1";
    static constexpr const char* DEFAULT_DOWNLOAD_DIR = ".";
    static constexpr const char* DOCUMENT_BASE_URL    = "https://ar5iv.org/html/";
    static constexpr const char* DEFAULT_BASENAME     = "ar5iv";
    static constexpr const char* DEFAULT_CHARSET      = "utf-8";

    static constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    static constexpr int DEFAULT_JOBS            = 1;

    static constexpr const char* README_FILENAME   = "README.md";
    static constexpr const char* ASSETS_DIRNAME    = "assets";
    static constexpr const char* DEFAULT_ASSET     = "image";
    static constexpr const char* SYNTHETIC_ASSET_EXTENSION = ".bin";
};

inline const std::map<std::string, std::string>& get_mime_map() {
    static const std::map<std::string, std::string> map = {{"image/jpeg", ".jpg"},
                                                           {"image/png", ".png"},
                                                           {"image/gif", ".gif"},
                                                           {"image/webp", ".webp"},
                                                           {"image/svg+xml", ".svg"},
                                                           {"image/x-icon", ".ico"},
                                                           {"image/bmp", ".bmp"},
                                                           {"image/tiff", ".tiff"},
                                                           {"image/avif", ".avif"},
                                                           {"application/pdf", ".pdf"}};
    return map;
}

inline std::string get_file_extension(const std::string& content_type) {
    std::string lower = content_type;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& [mime, extension] : get_mime_map()) {
        if (lower.find(mime) != std::string::npos) {
            return extension;
        }
    }
    return "";
}

}  // namespace Core
}  // namespace Ar5iv
