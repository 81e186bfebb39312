/**
 * @file fsStoreLib/util/fdIo.cpp
 * @brief fd 단위 전체 읽기 / 전체 쓰기 / 내용 교체.
 * @details
 * - short write 와 EINTR 을 모두 재시도한다.
 * - replaceContent 는 ftruncate 후 처음부터 다시 쓰고, 필요하면 fsync 한다.
 */
#include <fsstore/util/fdIo.hpp>

#include <errno.h>
#include <unistd.h>

namespace FsStore::util {

bool readAll(int fd, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();

    if (::lseek(fd, 0, SEEK_SET) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        if (n == 0)
            break;
        out.append(buf, static_cast<size_t>(n));
    }
    return true;
}

bool writeAll(int fd, const std::string& data, std::error_code& ec) {
    ec.clear();
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool replaceContent(int fd, const std::string& data, bool sync, std::error_code& ec) {
    ec.clear();
    // 파일을 비운 뒤 새 스냅샷 전체를 처음부터 다시 기록한다.
    if (::ftruncate(fd, 0) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (!writeAll(fd, data, ec))
        return false;

    if (sync && ::fsync(fd) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

} // namespace FsStore::util
