#pragma once
#include <cstddef>

#include "../../dom/document.hpp"

namespace Ar5iv {
namespace Engine {

// Strips page chrome that must never reach the asset or math stages.
class Sanitizer {
public:
    static bool is_footer(const Dom::Node& node);

    // Returns the number of removed subtrees.
    static size_t sanitize(Dom::Document& document);
};

}  // namespace Engine
}  // namespace Ar5iv
