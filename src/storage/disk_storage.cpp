#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>

#include "../core/logger/logger.hpp"

namespace Ar5iv {
namespace Storage {

namespace fs = std::filesystem;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
}

bool DiskStorage::exists(const std::string& key) const {
    std::error_code ec;
    return fs::exists(fs::path(base_path_) / key, ec);
}

bool DiskStorage::save(const std::string& key, const std::string& content, bool is_binary) {
    try {
        fs::path path(base_path_);
        path /= key;

        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(path, is_binary ? std::ios::binary : std::ios::out);
        if (!file.is_open()) {
            Ar5iv::Core::Logger::error("Write Error: " + path.string());
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            Ar5iv::Core::Logger::error("Write Error: " + path.string());
            return false;
        }
        Ar5iv::Core::Logger::success("Saved: " + path.string());
        return true;
    } catch (const fs::filesystem_error& e) {
        Ar5iv::Core::Logger::error("FS Error: " + std::string(e.what()));
        return false;
    }
}

}  // namespace Storage
}  // namespace Ar5iv
