#include "readeof/scanner.hpp"

#include <algorithm>
#include <span>
#include <vector>

namespace reof {

std::uint64_t find_start_offset(FileCursor& file,
                                std::size_t target_lines,
                                std::size_t buffer_size)
{
    if (buffer_size == 0)
        throw TailError{ErrorKind::InvalidArgument, "buffer size must be >= 1", file.path()};

    const std::uint64_t size = file.size();
    if (target_lines == 0) return size;
    if (size == 0) return 0;

    std::vector<std::byte> chunk(static_cast<std::size_t>(
        std::min<std::uint64_t>(buffer_size, size)));

    std::uint64_t position = size;  // bytes not yet scanned
    std::size_t   found    = 0;

    while (position > 0 && found < target_lines) {
        const auto len = static_cast<std::size_t>(std::min<std::uint64_t>(buffer_size, position));
        position -= len;
        file.read_exact(std::span<std::byte>(chunk.data(), len), position);

        for (std::size_t i = len; i-- > 0;) {
            if (chunk[i] != std::byte{'\n'}) continue;

            const std::uint64_t abs = position + i;
            // trailing newline at EOF terminates the last line, it does not start one
            if (abs != size - 1 || found > 0) ++found;

            if (found == target_lines) return abs + 1;
        }
    }

    return 0;
}

} // namespace reof
