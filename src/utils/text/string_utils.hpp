#pragma once

#include <string>

namespace Ar5iv {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        icontains(const std::string& haystack, const std::string& needle);

}  // namespace Text
}  // namespace Utils
}  // namespace Ar5iv
