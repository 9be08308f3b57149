#pragma once
#include <string>

namespace Ar5iv {
namespace Utils {
namespace Text {

class Converter {
public:
    static std::string to_markdown(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Ar5iv
