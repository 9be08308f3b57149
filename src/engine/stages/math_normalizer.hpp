#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "../../dom/document.hpp"

namespace Ar5iv {
namespace Engine {

struct TexFragment {
    std::string source;
    bool        is_block = false;
};

// Replaces MathML by plain TeX text: $x$ inline, $$ fenced lines for display math.
class MathNormalizer {
public:
    static std::optional<std::string> extract_tex(const Dom::Node& math);
    static bool                       is_block(const Dom::Node& math);
    static std::string                render(const TexFragment& fragment);

    // Returns the number of math nodes replaced.
    static size_t normalize(Dom::Document& document);
};

}  // namespace Engine
}  // namespace Ar5iv
