/**
 * @file fsStoreLib/repository/JsonFileRepositoryImpl.cpp
 * @brief JSON 배열 파일 하나를 저장소로 쓰는 레코드 저장소 구현.
 * @details
 * - 모든 연산은 파일을 열고, 전체를 읽어 파싱한 뒤, 변경 연산이면 전체를 다시 쓴다. 호출 사이에 캐시는 없다.
 * - 실패는 예외 대신 std::error_code(StoreErrc)로 호출자에게 전달한다.
 * - 파싱에 실패한 파일은 절대 덮어쓰지 않는다. append 만 "배열이 아닌 유효한 JSON"을 빈 저장소로 보고 새로 시작한다.
 * - 객체 멤버 순서는 읽은 순서 그대로 유지되므로 건드리지 않은 레코드는 다시 써도 같은 텍스트로 남는다.
 * - LockPolicy::Advisory 일 때만 fcntl lock 을 잡으며, 잠금 해제는 fd close 보다 먼저 일어나야 한다.
 */
#include <fsstore/error/StoreError.hpp>
#include <fsstore/repository/JsonFileRepositoryImpl.hpp>
#include <fsstore/util/Log.hpp>
#include <fsstore/util/fdIo.hpp>
#include <fsstore/util/jsonUtil.hpp>

#include <fcntl.h>

#include <utility>

namespace FsStore {

namespace {
constexpr const char* kTag = "store";
}

JsonFileRepositoryImpl::JsonFileRepositoryImpl(std::string path, StoreOptions options,
                                               std::unique_ptr<IdGenerator> ids)
    : path_(std::move(path)), options_(std::move(options)), ids_(std::move(ids)) {
    if (!ids_)
        ids_ = std::make_unique<UuidGenerator>();
    if (options_.idField.empty())
        options_.idField = kDefaultIdField;
}

std::string JsonFileRepositoryImpl::append(const json& data, std::error_code& ec) {
    ec.clear();
    if (!data.is_null() && !data.is_object()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::string();
    }

    // 식별자는 파일을 읽기 전에 생성한다. 호출자가 같은 키를 넘겼더라도 덮어쓴다.
    std::string id = ids_->next();
    json record = data.is_null() ? json::object() : data;
    record[options_.idField] = id;

    Session s;
    if (!open(Access::Write, s, ec))
        return std::string();

    json root;
    if (!load(s, root, ec))
        return std::string();

    // 유효한 JSON이지만 배열이 아니면 빈 저장소로 간주하고 새 배열로 시작한다.
    // 빈 sentinel({}) 이외의 값이 사라지는 경우이므로 경고를 남긴다.
    if (!root.is_array()) {
        bool sentinel = root.is_object() && root.empty();
        if (!sentinel)
            log::warn(kTag, path_ + ": content is not a JSON array, starting a new one");
        root = json::array();
    }

    root.push_back(std::move(record));
    if (!store(s, root, ec))
        return std::string();

    log::debug(kTag, path_ + ": appended " + id);
    return id;
}

std::unique_ptr<JsonRecord> JsonFileRepositoryImpl::findById(const std::string& id,
                                                             std::error_code& ec) {
    ec.clear();
    Session s;
    if (!open(Access::Read, s, ec))
        return nullptr;

    json root;
    if (!load(s, root, ec) || !recordsOf(root, ec))
        return nullptr;

    const json* found = locate(root, id);
    if (!found) {
        ec = make_error_code(StoreErrc::NotFound);
        return nullptr;
    }
    return std::make_unique<JsonRecord>(*found, options_.idField);
}

bool JsonFileRepositoryImpl::updateById(const std::string& id, const json& newData,
                                        std::error_code& ec) {
    ec.clear();
    if (!newData.is_object()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    Session s;
    if (!open(Access::Write, s, ec))
        return false;

    json root;
    if (!load(s, root, ec))
        return false;
    bool sentinel = root.is_object() && root.empty();
    if (!recordsOf(root, ec))
        return false;
    if (sentinel)
        return true; // nothing to update, keep the sentinel as is

    // 대상이 아닌 레코드는 그대로 통과시키고, 일치하는 모든 레코드에 얕은 병합을 적용한다.
    // 식별자 필드도 덮어쓸 수 있다 (호출자 책임).
    for (auto& element : root) {
        if (matches(element, id))
            util::mergeShallow(element, newData);
    }
    return store(s, root, ec);
}

bool JsonFileRepositoryImpl::deleteById(const std::string& id, std::error_code& ec) {
    ec.clear();
    Session s;
    if (!open(Access::Write, s, ec))
        return false;

    json root;
    if (!load(s, root, ec))
        return false;
    bool sentinel = root.is_object() && root.empty();
    if (!recordsOf(root, ec))
        return false;
    if (sentinel)
        return true;

    // 첫 번째 일치 항목만이 아니라 같은 식별자를 가진 항목을 모두 제외한다.
    json kept = json::array();
    for (const auto& element : root) {
        if (!matches(element, id))
            kept.push_back(element);
    }
    return store(s, kept, ec);
}

std::vector<std::unique_ptr<JsonRecord>> JsonFileRepositoryImpl::findAll(std::error_code& ec) {
    ec.clear();
    std::vector<std::unique_ptr<JsonRecord>> result;

    Session s;
    if (!open(Access::Read, s, ec))
        return result;

    json root;
    if (!load(s, root, ec) || !recordsOf(root, ec))
        return result;

    for (const auto& element : root) {
        if (element.is_object())
            result.push_back(std::make_unique<JsonRecord>(element, options_.idField));
    }
    return result;
}

bool JsonFileRepositoryImpl::deleteAll(std::error_code& ec) {
    ec.clear();
    Session s;
    if (!open(Access::Write, s, ec))
        return false;
    return store(s, json::array(), ec);
}

size_t JsonFileRepositoryImpl::count(std::error_code& ec) {
    ec.clear();
    Session s;
    if (!open(Access::Read, s, ec))
        return 0;

    json root;
    if (!load(s, root, ec) || !recordsOf(root, ec))
        return 0;

    size_t n = 0;
    for (const auto& element : root) {
        if (element.is_object())
            ++n;
    }
    return n;
}

bool JsonFileRepositoryImpl::existsById(const std::string& id, std::error_code& ec) {
    ec.clear();
    Session s;
    if (!open(Access::Read, s, ec))
        return false;

    json root;
    if (!load(s, root, ec) || !recordsOf(root, ec))
        return false;
    return locate(root, id) != nullptr;
}

bool JsonFileRepositoryImpl::open(Access access, Session& s, std::error_code& ec) {
    // 파일은 여기서 만들지 않는다. 없으면 NotFound 로 보고한다.
    std::error_code raw;
    int flags = (access == Access::Read) ? O_RDONLY : O_RDWR;
    s.fd = detail::UniqueFd::open(path_, flags, raw);
    if (!s.fd) {
        ec = classify(raw);
        return false;
    }

    if (options_.lockPolicy == LockPolicy::Advisory) {
        auto mode = (access == Access::Read) ? detail::FileLockGuard::Mode::Shared
                                             : detail::FileLockGuard::Mode::Exclusive;
        if (!s.lock.lock(s.fd.get(), mode, raw)) {
            ec = classify(raw);
            return false;
        }
    }
    return true;
}

bool JsonFileRepositoryImpl::load(const Session& s, json& root, std::error_code& ec) {
    std::string text;
    std::error_code raw;
    if (!util::readAll(s.fd.get(), text, raw)) {
        ec = classify(raw);
        return false;
    }

    std::string errors;
    if (!util::parseJson(text, root, ec, &errors)) {
        log::debug(kTag, path_ + ": " + errors);
        return false;
    }
    return true;
}

bool JsonFileRepositoryImpl::recordsOf(json& root, std::error_code& ec) {
    if (root.is_array())
        return true;
    if (root.is_object() && root.empty()) {
        root = json::array();
        return true;
    }
    ec = make_error_code(StoreErrc::ParseError);
    return false;
}

bool JsonFileRepositoryImpl::store(Session& s, const json& records, std::error_code& ec) {
    std::string text = util::formatJson(records, options_.indent);
    std::error_code raw;
    if (!util::replaceContent(s.fd.get(), text, options_.syncOnWrite, raw)) {
        log::error(kTag, path_ + ": write failed: " + raw.message());
        ec = classify(raw);
        return false;
    }

    // fd 를 닫기 전에 잠금을 먼저 해제해야 재사용된 fd 번호에 unlock 이 가지 않는다.
    s.lock.unlockIgnore();
    if (!s.fd.close(raw)) {
        log::error(kTag, path_ + ": close failed: " + raw.message());
        ec = classify(raw);
        return false;
    }
    return true;
}

const json* JsonFileRepositoryImpl::locate(const json& records,
                                                  const std::string& id) const {
    for (const auto& element : records) {
        if (matches(element, id))
            return &element;
    }
    return nullptr;
}

bool JsonFileRepositoryImpl::matches(const json& element, const std::string& id) const {
    if (!element.is_object())
        return false;
    auto it = element.find(options_.idField);
    return it != element.end() && it->is_string() && it->get_ref<const std::string&>() == id;
}

} // namespace FsStore
