#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace reof {

enum class Encoding : uint8_t {
    Utf8,
    Ascii,
    Latin1,   // also "binary"
    Utf16Le,  // also "ucs2"
    Hex,
    Base64
};

// Case-insensitive; throws TailError(InvalidArgument) on unknown names.
Encoding parse_encoding(std::string_view name);
[[nodiscard]] std::string_view encoding_name(Encoding e) noexcept;

// Decodes a complete byte range into UTF-8 text. Invalid UTF-8 and lone
// UTF-16 surrogates become U+FFFD; an odd trailing UTF-16 byte is dropped.
std::string decode(std::span<const std::byte> bytes, Encoding enc);

} // namespace reof
