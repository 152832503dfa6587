#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <sys/types.h>

namespace reof {

enum class ErrorKind : uint8_t {
    NotFound,
    PermissionDenied,
    IsADirectory,
    IOError,
    InvalidArgument
};

[[nodiscard]] std::string_view to_string(ErrorKind k) noexcept;

struct TailError : std::runtime_error {
    ErrorKind   kind{ErrorKind::IOError};
    std::string path;
    int         code{};   // errno, 0 if none

    TailError(ErrorKind k, std::string_view msg, std::string path_ = {}, int code_ = 0);

    // classify an errno value from open/stat/read
    static TailError from_errno(int err, std::string_view what, const std::string& path);
};

// Owns a read-only descriptor on a regular file. Move-only; closed on destruction.
class FileCursor {
public:
    FileCursor() noexcept = default;
    ~FileCursor();

    FileCursor(FileCursor&& other) noexcept;
    FileCursor& operator=(FileCursor&& other) noexcept;
    FileCursor(const FileCursor&) = delete;
    FileCursor& operator=(const FileCursor&) = delete;

    static FileCursor open(const std::string& path);
    [[nodiscard]] static std::expected<FileCursor, TailError>
    try_open(const std::string& path) noexcept;

    // fstat the descriptor and refresh size(); throws TailError
    std::uint64_t stat();
    [[nodiscard]] std::expected<std::uint64_t, TailError> try_stat() noexcept;

    // positional read; returns bytes read (0 at EOF). Retries on EINTR.
    std::size_t read_at(std::span<std::byte> dst, std::uint64_t offset);
    [[nodiscard]] std::expected<std::size_t, TailError>
    try_read_at(std::span<std::byte> dst, std::uint64_t offset) noexcept;

    // reads exactly dst.size() bytes or throws IOError
    void read_exact(std::span<std::byte> dst, std::uint64_t offset);

    // true if `path` currently names a different file than the open one
    [[nodiscard]] bool replaced_on_disk() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool               is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t      size()    const noexcept { return size_; }
    [[nodiscard]] const std::string& path()    const noexcept { return path_; }

private:
    FileCursor(int fd, std::string path) noexcept : fd_(fd), path_(std::move(path)) {}

    int           fd_   = -1;
    std::string   path_;
    std::uint64_t size_ = 0;
    dev_t         dev_  = 0;
    ino_t         ino_  = 0;
};

} // namespace reof
