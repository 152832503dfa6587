#pragma once
#include <cstddef>
#include <cstdint>

#include "readeof/filecursor.hpp"

namespace reof {

inline constexpr std::size_t kDefaultBufferSize = 16u * 1024;

// Backward scan from EOF for the byte offset where the last `target_lines`
// lines begin. A newline in the file's final byte is not counted as the
// first boundary. Returns 0 when the file holds fewer lines than requested.
// Reads at most ceil(size / buffer_size) chunks and stops at the first hit.
std::uint64_t find_start_offset(FileCursor& file,
                                std::size_t target_lines,
                                std::size_t buffer_size = kDefaultBufferSize);

} // namespace reof
