#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace FsStore {
namespace detail {

/// @brief Move-only owner of a file descriptor
///
/// The store opens its file once per operation; this wrapper guarantees the
/// descriptor is released on every return path.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// @brief open(2) with O_CLOEXEC added
    /// @param path File path
    /// @param flags open(2) flags
    /// @param ec Raw errno-based error on failure (not classified)
    /// @param mode Permission bits used when O_CREAT is given
    /// @return Owning wrapper, invalid on failure
    static UniqueFd open(const std::string& path, int flags, std::error_code& ec,
                         mode_t mode = 0644) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd = ::open(path.c_str(), flags, mode);
        if (fd < 0)
            ec = std::error_code(errno, std::generic_category());
        return UniqueFd(fd);
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Give up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Close the current fd (errors ignored) and adopt newFd
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Close and report the close(2) result
    /// @details Used after writes, where a failed close can mean lost data.
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace FsStore
