#pragma once
#include <string>

namespace Ar5iv {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Keys are paths relative to the storage root, e.g. "assets/x1.png".
    virtual bool exists(const std::string& key) const = 0;
    virtual bool
    save(const std::string& key, const std::string& content, bool is_binary = false) = 0;
};

}  // namespace Storage
}  // namespace Ar5iv
