#pragma once
#include <string>
#include <vector>

#include "../../dom/document.hpp"

namespace Ar5iv {
namespace Engine {

// html2md drops id attributes, so reference entries lose their citation targets.
// Ids are harvested from the DOM before conversion and put back into the Markdown afterwards.
class Bibliography {
public:
    // Ids of bibliography entries, in document order.
    static std::vector<std::string> harvest_ids(const Dom::Document& document);

    // Inserts anchors into the bullet lines that follow the "References" heading.
    // A line numbered "[N]" gets bib.bibN; any other bullet takes the next harvested id.
    static std::string restore_anchors(const std::string&              markdown,
                                       const std::vector<std::string>& ids);

    static bool        is_references_heading(const std::string& line);
    static std::string numbered_id(const std::string& number);
    static std::string anchor(const std::string& id);
};

}  // namespace Engine
}  // namespace Ar5iv
