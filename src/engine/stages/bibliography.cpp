#include "bibliography.hpp"
#include <regex>
#include <sstream>

#include "../../utils/text/string_utils.hpp"

namespace Ar5iv {
namespace Engine {

using namespace Ar5iv::Utils::Text;

namespace {

constexpr const char* BIBITEM_CLASS   = "ltx_bibitem";
constexpr const char* BIB_ID_PREFIX   = "bib.bib";
constexpr const char* REFERENCES_MARK = "references";

const std::regex& bullet_pattern() {
    static const std::regex pattern(R"(^(\s*(?:[-*+]|\d+[.)])\s+))");
    return pattern;
}

// html2md may escape the brackets.
const std::regex& numbered_pattern() {
    static const std::regex pattern(R"(^\\?\[(\d+)\\?\])");
    return pattern;
}

const std::regex& numbered_id_pattern() {
    static const std::regex pattern(R"(^bib\.bib\d+$)");
    return pattern;
}

bool is_bibliography_entry(const Dom::Node& node) {
    if (!node.is_element())
        return false;

    const std::string* id = node.attribute("id");
    if (!id || id->empty())
        return false;
    return node.has_class(BIBITEM_CLASS) || std::regex_match(*id, numbered_id_pattern());
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream       stream(text);
    std::string              line;
    while (std::getline(stream, line))
        lines.push_back(line);
    return lines;
}

}  // namespace

std::vector<std::string> Bibliography::harvest_ids(const Dom::Document& document) {
    std::vector<std::string> ids;
    for (const Dom::Node* node : document.find_all(is_bibliography_entry))
        ids.push_back(*node->attribute("id"));
    return ids;
}

bool Bibliography::is_references_heading(const std::string& line) {
    std::string text = trim(line);

    // html2md writes ATX headings ("## References").
    size_t hashes = text.find_first_not_of('#');
    if (hashes > 0 && hashes != std::string::npos && (text[hashes] == ' ' || text[hashes] == '\t'))
        text = trim(text.substr(hashes));

    return to_lower(text) == REFERENCES_MARK;
}

std::string Bibliography::numbered_id(const std::string& number) {
    return BIB_ID_PREFIX + number;
}

std::string Bibliography::anchor(const std::string& id) {
    return "<a id=\"" + id + "\"></a>";
}

std::string Bibliography::restore_anchors(const std::string&              markdown,
                                          const std::vector<std::string>& ids) {
    std::vector<std::string> lines = split_lines(markdown);

    bool   in_references = false;
    size_t cursor        = 0;
    for (std::string& line : lines) {
        if (!in_references) {
            in_references = is_references_heading(line);
            continue;
        }

        std::smatch bullet;
        if (!std::regex_search(line, bullet, bullet_pattern()))
            continue;

        const std::string marker = bullet[1].str();
        const std::string rest   = line.substr(marker.size());

        std::smatch numbered;
        if (std::regex_search(rest, numbered, numbered_pattern())) {
            line = marker + anchor(numbered_id(numbered[1].str())) + rest;
        }
        else if (cursor < ids.size()) {
            line = marker + anchor(ids[cursor++]) + rest;
        }
    }

    std::string result;
    result.reserve(markdown.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0)
            result += '\n';
        result += lines[i];
    }
    if (!markdown.empty() && markdown.back() == '\n')
        result += '\n';
    return result;
}

}  // namespace Engine
}  // namespace Ar5iv
