#include "readeof/decoder.hpp"
#include "readeof/filecursor.hpp"

#include <algorithm>
#include <cctype>

namespace reof {
namespace {

    constexpr char32_t kReplacement = 0xFFFD;

    inline void append_utf8(std::string& out, char32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    inline uint8_t u8_at(std::span<const std::byte> s, std::size_t off) {
        return static_cast<uint8_t>(s[off]);
    }

    // Length of the well-formed sequence at `i`, or the length of its maximal
    // invalid prefix negated (always <= -1).
    int utf8_sequence(std::span<const std::byte> s, std::size_t i) {
        const uint8_t b0 = u8_at(s, i);
        if (b0 < 0x80) return 1;

        int need = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if      (b0 >= 0xC2 && b0 <= 0xDF) { need = 1; }
        else if (b0 == 0xE0)               { need = 2; lo = 0xA0; }
        else if (b0 >= 0xE1 && b0 <= 0xEC) { need = 2; }
        else if (b0 == 0xED)               { need = 2; hi = 0x9F; }
        else if (b0 >= 0xEE && b0 <= 0xEF) { need = 2; }
        else if (b0 == 0xF0)               { need = 3; lo = 0x90; }
        else if (b0 >= 0xF1 && b0 <= 0xF3) { need = 3; }
        else if (b0 == 0xF4)               { need = 3; hi = 0x8F; }
        else return -1;

        for (int k = 1; k <= need; ++k) {
            if (i + static_cast<std::size_t>(k) >= s.size()) return -k;
            const uint8_t b = u8_at(s, i + static_cast<std::size_t>(k));
            if (b < lo || b > hi) return -k;
            lo = 0x80; hi = 0xBF;
        }
        return need + 1;
    }

    void decode_utf8(std::span<const std::byte> s, std::string& out) {
        out.reserve(s.size());
        std::size_t i = 0;
        while (i < s.size()) {
            const int n = utf8_sequence(s, i);
            if (n > 0) {
                out.append(reinterpret_cast<const char*>(s.data() + i), static_cast<std::size_t>(n));
                i += static_cast<std::size_t>(n);
            } else {
                append_utf8(out, kReplacement);
                i += static_cast<std::size_t>(-n);
            }
        }
    }

    void decode_utf16le(std::span<const std::byte> s, std::string& out) {
        const std::size_t units = s.size() / 2;
        out.reserve(units * 2);
        auto unit_at = [&](std::size_t u) -> char16_t {
            return static_cast<char16_t>(u8_at(s, 2 * u) | (u8_at(s, 2 * u + 1) << 8));
        };
        for (std::size_t u = 0; u < units; ++u) {
            const char16_t c = unit_at(u);
            if (c >= 0xD800 && c <= 0xDBFF) {
                if (u + 1 < units) {
                    const char16_t d = unit_at(u + 1);
                    if (d >= 0xDC00 && d <= 0xDFFF) {
                        append_utf8(out, 0x10000 + ((char32_t(c) - 0xD800) << 10) + (char32_t(d) - 0xDC00));
                        ++u;
                        continue;
                    }
                }
                append_utf8(out, kReplacement);
            } else if (c >= 0xDC00 && c <= 0xDFFF) {
                append_utf8(out, kReplacement);
            } else {
                append_utf8(out, c);
            }
        }
    }

    void encode_base64(std::span<const std::byte> s, std::string& out) {
        static constexpr char kAlphabet[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        out.reserve((s.size() + 2) / 3 * 4);
        std::size_t i = 0;
        for (; i + 3 <= s.size(); i += 3) {
            const uint32_t v = (u8_at(s, i) << 16) | (u8_at(s, i + 1) << 8) | u8_at(s, i + 2);
            out.push_back(kAlphabet[(v >> 18) & 0x3F]);
            out.push_back(kAlphabet[(v >> 12) & 0x3F]);
            out.push_back(kAlphabet[(v >> 6) & 0x3F]);
            out.push_back(kAlphabet[v & 0x3F]);
        }
        const std::size_t rest = s.size() - i;
        if (rest == 1) {
            const uint32_t v = u8_at(s, i) << 16;
            out.push_back(kAlphabet[(v >> 18) & 0x3F]);
            out.push_back(kAlphabet[(v >> 12) & 0x3F]);
            out += "==";
        } else if (rest == 2) {
            const uint32_t v = (u8_at(s, i) << 16) | (u8_at(s, i + 1) << 8);
            out.push_back(kAlphabet[(v >> 18) & 0x3F]);
            out.push_back(kAlphabet[(v >> 12) & 0x3F]);
            out.push_back(kAlphabet[(v >> 6) & 0x3F]);
            out.push_back('=');
        }
    }

}

Encoding parse_encoding(std::string_view name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "utf8" || n == "utf-8")                        return Encoding::Utf8;
    if (n == "ascii")                                       return Encoding::Ascii;
    if (n == "latin1" || n == "binary")                     return Encoding::Latin1;
    if (n == "utf16le" || n == "utf-16le" || n == "ucs2" || n == "ucs-2")
                                                            return Encoding::Utf16Le;
    if (n == "hex")                                         return Encoding::Hex;
    if (n == "base64")                                      return Encoding::Base64;

    throw TailError{ErrorKind::InvalidArgument, "unknown encoding: " + std::string(name)};
}

std::string_view encoding_name(Encoding e) noexcept {
    switch (e) {
        case Encoding::Utf8:    return "utf8";
        case Encoding::Ascii:   return "ascii";
        case Encoding::Latin1:  return "latin1";
        case Encoding::Utf16Le: return "utf16le";
        case Encoding::Hex:     return "hex";
        case Encoding::Base64:  return "base64";
    }
    return "utf8";
}

std::string decode(std::span<const std::byte> bytes, Encoding enc) {
    std::string out;
    switch (enc) {
        case Encoding::Utf8:
            decode_utf8(bytes, out);
            break;
        case Encoding::Ascii:
            out.reserve(bytes.size());
            for (std::byte b : bytes) out.push_back(static_cast<char>(std::to_integer<uint8_t>(b) & 0x7F));
            break;
        case Encoding::Latin1:
            out.reserve(bytes.size());
            for (std::byte b : bytes) append_utf8(out, std::to_integer<uint8_t>(b));
            break;
        case Encoding::Utf16Le:
            decode_utf16le(bytes, out);
            break;
        case Encoding::Hex: {
            static constexpr char kDigits[] = "0123456789abcdef";
            out.reserve(bytes.size() * 2);
            for (std::byte b : bytes) {
                const auto v = std::to_integer<uint8_t>(b);
                out.push_back(kDigits[v >> 4]);
                out.push_back(kDigits[v & 0x0F]);
            }
            break;
        }
        case Encoding::Base64:
            encode_base64(bytes, out);
            break;
    }
    return out;
}

} // namespace reof
