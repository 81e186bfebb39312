/**
 * @file fsStoreLib/fs/FsOps.cpp
 * @brief 폴더/파일 생성, 이름 변경, 목록, 읽기, 삭제 헬퍼.
 * @details
 * - std::filesystem 의 error_code 오버로드만 사용하므로 예외가 나가지 않는다.
 * - createJsonFile 은 O_EXCL 로 열어 기존 파일을 절대 덮어쓰지 않는다.
 */
#include <fsstore/error/StoreError.hpp>
#include <fsstore/fs/FsOps.hpp>
#include <fsstore/util/UniqueFd.hpp>
#include <fsstore/util/fdIo.hpp>

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>

namespace FsStore::FsOps {

namespace fs = std::filesystem;

namespace {

std::string join(const std::string& folder, const std::string& name) {
    return (fs::path(folder) / name).string();
}

bool renamePath(const std::string& from, const std::string& to, std::error_code& ec) {
    if (::rename(from.c_str(), to.c_str()) < 0) {
        ec = classifyErrno(errno);
        return false;
    }
    return true;
}

} // namespace

bool createFolder(const std::string& path, std::error_code& ec) {
    ec.clear();
    std::error_code fec;
    // 이미 존재하는 경로는 다른 실패와 구분해서 AlreadyExists 로 알린다.
    if (fs::exists(path, fec)) {
        ec = make_error_code(StoreErrc::AlreadyExists);
        return false;
    }
    fs::create_directories(path, fec);
    if (fec) {
        ec = classify(fec);
        return false;
    }
    return true;
}

bool createJsonFile(const std::string& path, std::error_code& ec) {
    ec.clear();
    std::error_code raw;
    // O_EXCL 로 존재 확인과 생성을 한 번에 처리한다.
    auto fd = detail::UniqueFd::open(path, O_WRONLY | O_CREAT | O_EXCL, raw);
    if (!fd) {
        ec = classify(raw);
        return false;
    }
    if (!util::writeAll(fd.get(), "{}", raw) || !fd.close(raw)) {
        ec = classify(raw);
        return false;
    }
    return true;
}

bool renameFolder(const std::string& oldPath, const std::string& newPath, std::error_code& ec) {
    ec.clear();
    return renamePath(oldPath, newPath, ec);
}

bool renameFileInFolder(const std::string& folder, const std::string& oldName,
                        const std::string& newName, std::error_code& ec) {
    ec.clear();
    return renamePath(join(folder, oldName), join(folder, newName), ec);
}

std::vector<std::string> listFilesInFolder(const std::string& folder, std::error_code& ec) {
    ec.clear();
    std::vector<std::string> names;

    std::error_code fec;
    fs::directory_iterator it(folder, fec);
    if (fec) {
        ec = classify(fec);
        return names;
    }

    for (fs::directory_iterator end; it != end; it.increment(fec)) {
        if (fec)
            break;
        std::error_code sec;
        if (it->is_directory(sec))
            continue;
        names.push_back(it->path().filename().string());
    }
    if (fec) {
        ec = classify(fec);
        names.clear();
        return names;
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::string readFileInFolder(const std::string& folder, const std::string& name,
                             std::error_code& ec) {
    ec.clear();
    std::error_code raw;
    auto fd = detail::UniqueFd::open(join(folder, name), O_RDONLY, raw);
    if (!fd) {
        ec = classify(raw);
        return std::string();
    }

    std::string text;
    if (!util::readAll(fd.get(), text, raw)) {
        ec = classify(raw);
        return std::string();
    }
    return text;
}

bool deleteFolder(const std::string& path, std::error_code& ec) {
    ec.clear();
    std::error_code fec;
    if (!fs::exists(fs::symlink_status(path, fec))) {
        ec = make_error_code(StoreErrc::NotFound);
        return false;
    }
    fs::remove_all(path, fec);
    if (fec) {
        ec = classify(fec);
        return false;
    }
    return true;
}

bool deleteFileInFolder(const std::string& folder, const std::string& name, std::error_code& ec) {
    ec.clear();
    if (::unlink(join(folder, name).c_str()) < 0) {
        ec = classifyErrno(errno);
        return false;
    }
    return true;
}

} // namespace FsStore::FsOps
