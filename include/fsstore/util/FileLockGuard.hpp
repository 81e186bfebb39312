#pragma once
/// @file FileLockGuard.hpp
/// @brief RAII guard for whole-file fcntl advisory locks (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace FsStore {
namespace detail {

/// @brief RAII guard for a whole-file advisory lock
///
/// Uses open file description locks (F_OFD_SETLK*) where the platform has
/// them, so two descriptors opened by the same process on the same file
/// exclude each other. Falls back to classic process-scoped F_SETLK* locks.
///
/// @note Only taken when StoreOptions::lockPolicy is LockPolicy::Advisory.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK, many readers
        Exclusive ///< F_WRLCK, one writer
    };

    enum class Wait {
        Block, ///< Wait until the lock is granted
        Try    ///< Fail immediately with EAGAIN/EACCES if contended
    };

    FileLockGuard() = default;

    FileLockGuard(int fd, Mode mode, std::error_code& ec, Wait wait = Wait::Block) {
        lock(fd, mode, ec, wait);
    }

    ~FileLockGuard() { unlockIgnore(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    FileLockGuard(FileLockGuard&& other) noexcept : fd_(other.fd_), locked_(other.locked_) {
        other.fd_ = -1;
        other.locked_ = false;
    }

    FileLockGuard& operator=(FileLockGuard&& other) noexcept {
        if (this != &other) {
            unlockIgnore();
            fd_ = other.fd_;
            locked_ = other.locked_;
            other.fd_ = -1;
            other.locked_ = false;
        }
        return *this;
    }

    /// @brief Acquire the lock, releasing any lock this guard already holds
    /// @return true on success; ec carries the raw errno otherwise
    bool lock(int fd, Mode mode, std::error_code& ec, Wait wait = Wait::Block) {
        ec.clear();
        unlockIgnore();
        fd_ = fd;

        if (fd_ < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }

        // l_len=0 은 파일 전체 잠금. 레코드 단위가 아니라 저장소 파일 단위로 상호배제한다.
        struct flock fl{};
        fl.l_type = (mode == Mode::Shared) ? F_RDLCK : F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        int rc;
        do {
            rc = ::fcntl(fd_, command(wait), &fl);
        } while (rc < 0 && errno == EINTR);

        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            fd_ = -1;
            locked_ = false;
            return false;
        }

        locked_ = true;
        return true;
    }

    /// @brief Release the lock, ignoring errors (safe to call from destructor)
    void unlockIgnore() noexcept {
        if (!locked_ || fd_ < 0)
            return;
        struct flock fl{};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        ::fcntl(fd_, command(Wait::Try), &fl);
        locked_ = false;
        fd_ = -1;
    }

    bool locked() const noexcept { return locked_; }

  private:
    static int command(Wait wait) noexcept {
#if defined(F_OFD_SETLKW) && defined(F_OFD_SETLK)
        return wait == Wait::Block ? F_OFD_SETLKW : F_OFD_SETLK;
#else
        return wait == Wait::Block ? F_SETLKW : F_SETLK;
#endif
    }

    int fd_ = -1;
    bool locked_ = false;
};

} // namespace detail
} // namespace FsStore
