#include "readeof/filecursor.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace reof {

std::string_view to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::NotFound:         return "not found";
        case ErrorKind::PermissionDenied: return "permission denied";
        case ErrorKind::IsADirectory:     return "is a directory";
        case ErrorKind::IOError:          return "I/O error";
        case ErrorKind::InvalidArgument:  return "invalid argument";
    }
    return "unknown";
}

TailError::TailError(ErrorKind k, std::string_view msg, std::string path_, int code_)
    : std::runtime_error(std::string(msg)), kind(k), path(std::move(path_)), code(code_) {}

TailError TailError::from_errno(int err, std::string_view what, const std::string& path) {
    ErrorKind k = ErrorKind::IOError;
    switch (err) {
        case ENOENT:
        case ENOTDIR:      k = ErrorKind::NotFound;         break;
        case EACCES:
        case EPERM:        k = ErrorKind::PermissionDenied; break;
        case EISDIR:       k = ErrorKind::IsADirectory;     break;
        case ENAMETOOLONG:
        case EINVAL:       k = ErrorKind::InvalidArgument;  break;
        default:                                            break;
    }
    std::string msg(what);
    msg += " failed: " + path + ": " + std::system_category().message(err);
    return TailError{k, msg, path, err};
}

FileCursor::~FileCursor() { close(); }

FileCursor::FileCursor(FileCursor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , size_(std::exchange(other.size_, 0))
    , dev_(other.dev_)
    , ino_(other.ino_) {}

FileCursor& FileCursor::operator=(FileCursor&& other) noexcept {
    if (this != &other) {
        close();
        fd_   = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        size_ = std::exchange(other.size_, 0);
        dev_  = other.dev_;
        ino_  = other.ino_;
    }
    return *this;
}

std::expected<FileCursor, TailError> FileCursor::try_open(const std::string& path) noexcept {
    if (path.empty())
        return std::unexpected(TailError{ErrorKind::InvalidArgument, "empty path", path});
    if (path.find('\0') != std::string::npos)
        return std::unexpected(TailError{ErrorKind::InvalidArgument, "path contains NUL", path});

    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);  // a FIFO must not block here
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) return std::unexpected(TailError::from_errno(errno, "open", path));

    FileCursor fc(fd, path);

    struct stat st{};
    if (::fstat(fd, &st) != 0)
        return std::unexpected(TailError::from_errno(errno, "fstat", path));
    if (S_ISDIR(st.st_mode))
        return std::unexpected(TailError{ErrorKind::IsADirectory, "is a directory: " + path, path, EISDIR});
    if (!S_ISREG(st.st_mode))
        return std::unexpected(TailError{ErrorKind::IsADirectory, "not a regular file: " + path, path});

    fc.size_ = static_cast<std::uint64_t>(st.st_size);
    fc.dev_  = st.st_dev;
    fc.ino_  = st.st_ino;
    return fc;
}

FileCursor FileCursor::open(const std::string& path) {
    auto r = try_open(path);
    if (!r) throw r.error();
    return std::move(*r);
}

std::expected<std::uint64_t, TailError> FileCursor::try_stat() noexcept {
    if (fd_ < 0) return std::unexpected(TailError{ErrorKind::IOError, "stat on closed file", path_, EBADF});
    struct stat st{};
    if (::fstat(fd_, &st) != 0)
        return std::unexpected(TailError::from_errno(errno, "fstat", path_));
    size_ = static_cast<std::uint64_t>(st.st_size);
    return size_;
}

std::uint64_t FileCursor::stat() {
    auto r = try_stat();
    if (!r) throw r.error();
    return *r;
}

std::expected<std::size_t, TailError>
FileCursor::try_read_at(std::span<std::byte> dst, std::uint64_t offset) noexcept {
    if (fd_ < 0) return std::unexpected(TailError{ErrorKind::IOError, "read on closed file", path_, EBADF});
    ssize_t n = -1;
    do {
        n = ::pread(fd_, dst.data(), dst.size(), static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    if (n < 0) return std::unexpected(TailError::from_errno(errno, "pread", path_));
    return static_cast<std::size_t>(n);
}

std::size_t FileCursor::read_at(std::span<std::byte> dst, std::uint64_t offset) {
    auto r = try_read_at(dst, offset);
    if (!r) throw r.error();
    return *r;
}

void FileCursor::read_exact(std::span<std::byte> dst, std::uint64_t offset) {
    std::size_t got = 0;
    while (got < dst.size()) {
        const std::size_t n = read_at(dst.subspan(got), offset + got);
        if (n == 0)
            throw TailError{ErrorKind::IOError,
                            "short read: " + path_ + " (file shrank while reading)", path_};
        got += n;
    }
}

bool FileCursor::replaced_on_disk() const noexcept {
    if (fd_ < 0) return false;
    struct stat st{};
    // path missing: rotation in progress, keep the old handle for now
    if (::stat(path_.c_str(), &st) != 0) return false;
    return st.st_dev != dev_ || st.st_ino != ino_;
}

void FileCursor::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace reof
