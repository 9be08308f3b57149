#include "sanitizer.hpp"
#include <array>

namespace Ar5iv {
namespace Engine {

namespace {

constexpr std::array<const char*, 1> FOOTER_TAGS    = {"footer"};
constexpr std::array<const char*, 2> FOOTER_CLASSES = {"ltx_page_footer", "ar5iv-footer"};

}  // namespace

bool Sanitizer::is_footer(const Dom::Node& node) {
    if (!node.is_element())
        return false;

    for (const char* tag : FOOTER_TAGS) {
        if (node.tag() == tag)
            return true;
    }
    for (const char* cls : FOOTER_CLASSES) {
        if (node.has_class(cls))
            return true;
    }
    return false;
}

size_t Sanitizer::sanitize(Dom::Document& document) {
    auto footers = document.find_all(is_footer, Dom::Traversal::Outermost);
    for (Dom::Node* footer : footers)
        footer->detach();
    return footers.size();
}

}  // namespace Engine
}  // namespace Ar5iv
