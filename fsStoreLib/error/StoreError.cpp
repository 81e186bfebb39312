/**
 * @file fsStoreLib/error/StoreError.cpp
 * @brief StoreErrc 에러 카테고리와 errno 분류 구현.
 * @details
 * - ENOENT/ENOTDIR 은 NotFound, EEXIST/ENOTEMPTY 는 AlreadyExists 로 분류한다.
 * - 그 밖의 시스템 에러는 모두 IOError 로 묶는다. invalid_argument 와 StoreErrc 코드는 그대로 통과시킨다.
 */
#include <fsstore/error/StoreError.hpp>

#include <cerrno>
#include <string>

namespace FsStore {

namespace {

class StoreCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "fsstore"; }

    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
        case StoreErrc::NotFound:
            return "not found";
        case StoreErrc::AlreadyExists:
            return "already exists";
        case StoreErrc::ParseError:
            return "invalid JSON content";
        case StoreErrc::IOError:
            return "I/O error";
        }
        return "unknown fsstore error";
    }

    // std::errc 조건과 비교 가능하도록 대응 관계를 정의한다.
    // ec == std::errc::no_such_file_or_directory 같은 검사를 그대로 쓸 수 있다.
    std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<StoreErrc>(ev)) {
        case StoreErrc::NotFound:
            return std::errc::no_such_file_or_directory;
        case StoreErrc::AlreadyExists:
            return std::errc::file_exists;
        case StoreErrc::IOError:
            return std::errc::io_error;
        default:
            return std::error_condition(ev, *this);
        }
    }
};

} // namespace

const std::error_category& storeCategory() noexcept {
    static const StoreCategory instance;
    return instance;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return std::error_code(static_cast<int>(e), storeCategory());
}

std::error_code classify(const std::error_code& ec) noexcept {
    if (!ec)
        return ec;
    if (ec.category() == storeCategory())
        return ec;
    if (ec == std::errc::invalid_argument)
        return ec;

    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        return make_error_code(StoreErrc::NotFound);
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        return make_error_code(StoreErrc::AlreadyExists);
    return make_error_code(StoreErrc::IOError);
}

std::error_code classifyErrno(int err) noexcept {
    return classify(std::error_code(err, std::generic_category()));
}

} // namespace FsStore
