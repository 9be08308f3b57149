#pragma once
#include <string>

namespace Ar5iv {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // http(s) URLs pass through; anything else is taken as an ar5iv identifier.
    static std::string to_document_url(const std::string& source);
    // Output directory name for a document URL, e.g. "2101.00001" or "hep-th_9901001".
    static std::string to_basename(const std::string& url);
    // Last path segment of an absolute URL, without query or fragment.
    static std::string path_filename(const std::string& url);
    static bool        is_data_url(const std::string& url);
};

}  // namespace Utils
}  // namespace Ar5iv
