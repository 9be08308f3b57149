#pragma once
#include <string>

#include "storage.hpp"

namespace Ar5iv {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool exists(const std::string& key) const override;
    bool save(const std::string& key, const std::string& content, bool is_binary = false) override;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Ar5iv
