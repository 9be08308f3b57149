#include "charset.hpp"
#include <iconv.h>
#include <cerrno>
#include <cstdint>
#include <memory>

#include "string_utils.hpp"

namespace Ar5iv {
namespace Utils {
namespace Text {

namespace {

constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

bool is_utf8_name(const std::string& charset) {
    return charset.empty() || charset == "utf-8" || charset == "utf8";
}

// Length of the well-formed UTF-8 sequence at data[i], or 0 if it is malformed.
size_t utf8_sequence_length(const std::string& data, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(data[k]); };
    unsigned char lead = byte(i);

    if (lead < 0x80)
        return 1;

    size_t   len;
    uint32_t min_cp;
    uint32_t cp;
    if ((lead & 0xE0) == 0xC0) {
        len    = 2;
        min_cp = 0x80;
        cp     = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0) {
        len    = 3;
        min_cp = 0x800;
        cp     = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0) {
        len    = 4;
        min_cp = 0x10000;
        cp     = lead & 0x07;
    }
    else {
        return 0;
    }

    if (i + len > data.size())
        return 0;
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

std::string sanitize_utf8(const std::string& body) {
    std::string out;
    out.reserve(body.size());
    size_t i = 0;
    while (i < body.size()) {
        size_t len = utf8_sequence_length(body, i);
        if (len == 0) {
            out += REPLACEMENT;
            ++i;
            continue;
        }
        out.append(body, i, len);
        i += len;
    }
    return out;
}

struct IconvCloser {
    void operator()(void* cd) const noexcept {
        iconv_close(static_cast<iconv_t>(cd));
    }
};

using IconvHandle = std::unique_ptr<void, IconvCloser>;

// Null when iconv does not know the charset.
IconvHandle open_decoder(const std::string& charset) {
    iconv_t cd = iconv_open("UTF-8", charset.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1))
        return nullptr;
    return IconvHandle(cd);
}

std::string transcode(iconv_t cd, const std::string& body) {
    std::string out;
    out.reserve(body.size() * 2);

    std::string input   = body;
    char*       in      = input.data();
    size_t      in_left = input.size();
    char        chunk[4096];

    while (in_left > 0) {
        char*  dst      = chunk;
        size_t dst_left = sizeof(chunk);
        size_t rc       = iconv(cd, &in, &in_left, &dst, &dst_left);
        out.append(chunk, dst - chunk);
        if (rc != static_cast<size_t>(-1))
            break;
        if (errno == E2BIG)
            continue;

        // EILSEQ or a truncated sequence at the end: drop one byte and resync.
        out += REPLACEMENT;
        ++in;
        --in_left;
        iconv(cd, nullptr, nullptr, nullptr, nullptr);
    }

    // Stateful encodings may still owe a shift sequence.
    char*  dst      = chunk;
    size_t dst_left = sizeof(chunk);
    if (iconv(cd, nullptr, nullptr, &dst, &dst_left) != static_cast<size_t>(-1))
        out.append(chunk, dst - chunk);
    return out;
}

}  // namespace

std::string charset_from_content_type(const std::string& content_type) {
    std::string lower = to_lower(content_type);
    size_t      pos   = lower.find("charset=");
    if (pos == std::string::npos)
        return "";

    std::string value = lower.substr(pos + 8);
    size_t      end   = value.find(';');
    if (end != std::string::npos)
        value = value.substr(0, end);
    value = trim(value);

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front())
        value = value.substr(1, value.size() - 2);
    return value;
}

bool is_supported_charset(const std::string& charset) {
    std::string name = to_lower(charset);
    return is_utf8_name(name) || open_decoder(name) != nullptr;
}

std::string decode_to_utf8(const std::string& body, const std::string& charset) {
    std::string name = to_lower(charset);
    if (is_utf8_name(name))
        return sanitize_utf8(body);

    IconvHandle decoder = open_decoder(name);
    if (!decoder)
        return sanitize_utf8(body);
    return transcode(static_cast<iconv_t>(decoder.get()), body);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Ar5iv
