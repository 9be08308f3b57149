#include "url.hpp"
#include <algorithm>
#include <sstream>
#include <string_view>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../text/string_utils.hpp"

namespace Ar5iv {
namespace Utils {

namespace {

constexpr std::string_view HTML_SEGMENT = "/html/";

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized.back() != '/') {
        normalized += "/";
    }
    return normalized;
}

void split_authority(std::string_view authority, UrlParsed& parsed) {
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    // IPv6 literals keep their brackets and may contain ':'.
    size_t host_end = 0;
    if (!authority.empty() && authority.front() == '[') {
        size_t bracket = authority.find(']');
        host_end       = bracket == std::string_view::npos ? authority.size() : bracket + 1;
    }
    size_t port_colon = authority.find(':', host_end);

    parsed.host = std::string(authority.substr(0, port_colon));
    if (port_colon != std::string_view::npos)
        parsed.port = std::string(authority.substr(port_colon + 1));
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    std::string_view rest = url;

    // A scheme ends at the first ':' that precedes any '/', '?' or '#'.
    size_t colon = rest.find(':');
    if (colon != std::string_view::npos && colon < rest.find_first_of("/?#")) {
        parsed.scheme = std::string(rest.substr(0, colon));
        rest.remove_prefix(colon + 1);
    }

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        size_t authority_end = std::min(rest.find_first_of("/?#"), rest.size());
        split_authority(rest.substr(0, authority_end), parsed);
        rest.remove_prefix(authority_end);
    }

    parsed.path = std::string(rest.substr(0, std::min(rest.find_first_of("?#"), rest.size())));
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t cut = std::min(base.find('?'), base.find('#'));
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, data: and friends have no network location.
    size_t colon_pos = relative.find(':');
    if (colon_pos != std::string::npos && colon_pos < 10
        && relative.find('/') > colon_pos)
        return "";

    UrlParsed base_parsed = parse(base);
    if (relative.size() >= 2 && relative[0] == '/' && relative[1] == '/') {
        return base_parsed.scheme + ":" + relative;
    }

    std::string auth = base_parsed.host;
    if (!base_parsed.port.empty())
        auth += ":" + base_parsed.port;
    std::string origin = base_parsed.scheme + "://" + auth;

    std::string path;
    if (relative[0] == '/') {
        path = relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir                    = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        path                   = dir + relative;
    }

    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    return origin + normalize_path(path) + query_frag;
}

std::string Url::to_document_url(const std::string& source) {
    if (Text::starts_with(source, "http://") || Text::starts_with(source, "https://"))
        return source;
    return std::string(Core::Constants::DOCUMENT_BASE_URL) + source;
}

std::string Url::to_basename(const std::string& url) {
    std::string path = parse(url).path;

    size_t html = path.find(HTML_SEGMENT);
    if (html != std::string::npos) {
        std::string id = path.substr(html + HTML_SEGMENT.size());
        while (!id.empty() && id.back() == '/')
            id.pop_back();
        if (!id.empty()) {
            std::replace(id.begin(), id.end(), '/', '_');
            return id;
        }
    }

    std::string name = path_filename(url);
    return name.empty() ? Core::Constants::DEFAULT_BASENAME : name;
}

std::string Url::path_filename(const std::string& url) {
    std::string path       = parse(url).path;
    size_t      last_slash = path.find_last_of('/');
    return last_slash == std::string::npos ? path : path.substr(last_slash + 1);
}

bool Url::is_data_url(const std::string& url) {
    return Text::starts_with(Text::to_lower(url), "data:");
}

}  // namespace Utils
}  // namespace Ar5iv
