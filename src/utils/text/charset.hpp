#pragma once
#include <string>

namespace Ar5iv {
namespace Utils {
namespace Text {

// "text/html; charset=ISO-8859-1" -> "iso-8859-1"; empty when absent.
std::string charset_from_content_type(const std::string& content_type);

// True for UTF-8 and for any charset iconv can convert from.
bool is_supported_charset(const std::string& charset);

// Decodes a response body to UTF-8. Invalid sequences become U+FFFD, never an error.
// Unsupported charsets are read as UTF-8.
std::string decode_to_utf8(const std::string& body, const std::string& charset);

}  // namespace Text
}  // namespace Utils
}  // namespace Ar5iv
