#include "converter.hpp"
#include <html2md.h>
#include <string>

namespace Ar5iv {
namespace Utils {
namespace Text {

std::string Converter::to_markdown(const std::string& html) {
    return html2md::Convert(html);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Ar5iv
