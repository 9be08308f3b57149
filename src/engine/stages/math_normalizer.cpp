#include "math_normalizer.hpp"
#include <array>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../../utils/text/string_utils.hpp"

namespace Ar5iv {
namespace Engine {

using namespace Ar5iv::Utils::Text;

namespace {

constexpr const char* MATH_TAG        = "math";
constexpr const char* ANNOTATION_TAG  = "annotation";
constexpr const char* ENCODING_ATTR   = "encoding";
constexpr const char* ALT_TEXT_ATTR   = "alttext";
constexpr const char* RAW_TEX_ATTR    = "data-tex";
constexpr const char* DISPLAY_ATTR    = "display";
constexpr const char* BLOCK_DELIMITER = "$$";
constexpr const char* INLINE_DELIMITER = "$";

constexpr std::array<const char*, 5> DISPLAY_CONTEXT_CLASSES = {
    "ltx_equation", "ltx_equationgroup", "ltx_eqn_table", "ltx_eqn_cell", "ltx_displaymath"};

using TexExtractor = std::optional<std::string> (*)(const Dom::Node&);

std::optional<std::string> non_empty(const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.empty())
        return std::nullopt;
    return trimmed;
}

std::optional<std::string> from_annotation(const Dom::Node& node) {
    for (const auto& child : node.children()) {
        if (!child->is_element())
            continue;

        if (child->tag() == ANNOTATION_TAG) {
            const std::string* encoding = child->attribute(ENCODING_ATTR);
            if (encoding && icontains(*encoding, "tex")) {
                if (auto tex = non_empty(child->text_content()))
                    return tex;
            }
        }
        if (auto tex = from_annotation(*child))
            return tex;
    }
    return std::nullopt;
}

std::optional<std::string> from_attribute(const Dom::Node& node, const char* name) {
    const std::string* value = node.attribute(name);
    if (!value)
        return std::nullopt;
    return non_empty(*value);
}

std::optional<std::string> from_alt_text(const Dom::Node& node) {
    return from_attribute(node, ALT_TEXT_ATTR);
}

std::optional<std::string> from_raw_tex(const Dom::Node& node) {
    return from_attribute(node, RAW_TEX_ATTR);
}

constexpr std::array<TexExtractor, 3> EXTRACTORS = {from_annotation, from_alt_text, from_raw_tex};

bool has_converted_ancestor(const Dom::Node&                         node,
                            const std::unordered_set<const Dom::Node*>& converted) {
    for (const Dom::Node* p = node.parent(); p; p = p->parent()) {
        if (converted.count(p))
            return true;
    }
    return false;
}

bool in_display_context(const Dom::Node& node) {
    const Dom::Node* parent = node.parent();
    if (!parent || !parent->is_element())
        return false;

    for (const char* cls : DISPLAY_CONTEXT_CLASSES) {
        if (parent->has_class(cls))
            return true;
    }
    return false;
}

}  // namespace

std::optional<std::string> MathNormalizer::extract_tex(const Dom::Node& math) {
    for (TexExtractor extractor : EXTRACTORS) {
        if (auto tex = extractor(math))
            return tex;
    }
    return std::nullopt;
}

bool MathNormalizer::is_block(const Dom::Node& math) {
    const std::string* display = math.attribute(DISPLAY_ATTR);
    if (display)
        return to_lower(trim(*display)) == "block";
    return in_display_context(math);
}

std::string MathNormalizer::render(const TexFragment& fragment) {
    std::string tex = trim(fragment.source);
    if (fragment.is_block || tex.find('\n') != std::string::npos) {
        return std::string("\n") + BLOCK_DELIMITER + "\n" + tex + "\n" + BLOCK_DELIMITER + "\n";
    }
    return INLINE_DELIMITER + tex + INLINE_DELIMITER;
}

size_t MathNormalizer::normalize(Dom::Document& document) {
    auto nodes = document.find_all([](const Dom::Node& node) { return node.is_element(MATH_TAG); },
                                   Dom::Traversal::All);

    // Decide everything before mutating: a converted node takes its nested math with it,
    // while math nested in an unconvertible node is still a candidate.
    std::vector<std::pair<Dom::Node*, TexFragment>> pending;
    std::unordered_set<const Dom::Node*>            converted;
    for (Dom::Node* math : nodes) {
        if (has_converted_ancestor(*math, converted))
            continue;

        auto tex = extract_tex(*math);
        if (!tex)
            continue;

        converted.insert(math);
        pending.emplace_back(math, TexFragment{*tex, is_block(*math)});
    }

    for (const auto& [math, fragment] : pending)
        math->replace_with(Dom::Node::make_text(render(fragment)));
    return pending.size();
}

}  // namespace Engine
}  // namespace Ar5iv
