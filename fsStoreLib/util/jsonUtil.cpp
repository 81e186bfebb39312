/**
 * @file fsStoreLib/util/jsonUtil.cpp
 * @brief JSON 텍스트 파싱 / 직렬화 / 얕은 병합.
 * @details
 * - 라이브러리 예외는 밖으로 내보내지 않고 StoreErrc::ParseError 로 바꾼다.
 * - 직렬화 시 UTF-8 은 그대로 두고, 잘못된 바이트열은 예외 대신 치환한다.
 * - ordered_json 을 쓰므로 객체 멤버 순서가 읽은 그대로 유지되고, 숫자는 가장 짧은 왕복 표기로 쓴다.
 */
#include <fsstore/error/StoreError.hpp>
#include <fsstore/util/jsonUtil.hpp>

#include <cctype>

namespace FsStore::util {

namespace {

bool isBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c))
            return false;
    }
    return true;
}

} // namespace

bool parseJson(const std::string& text, json& out, std::error_code& ec, std::string* errors) {
    ec.clear();
    out = json();

    if (isBlank(text)) {
        if (errors)
            *errors = "empty document";
        ec = make_error_code(StoreErrc::ParseError);
        return false;
    }

    try {
        out = json::parse(text);
    } catch (const json::exception& e) {
        // parse_error 외에 숫자 범위 초과(out_of_range)도 여기로 온다.
        if (errors)
            *errors = e.what();
        out = json();
        ec = make_error_code(StoreErrc::ParseError);
        return false;
    }
    return true;
}

std::string formatJson(const json& value, unsigned indent) {
    const int width = indent == 0 ? -1 : static_cast<int>(indent);
    return value.dump(width, ' ', false, json::error_handler_t::replace);
}

void mergeShallow(json& base, const json& patch) {
    if (!base.is_object() || !patch.is_object())
        return;
    for (auto it = patch.begin(); it != patch.end(); ++it)
        base[it.key()] = it.value();
}

bool sameContent(const json& a, const json& b) {
    // nlohmann::json 은 std::map 기반이라 멤버 순서와 무관하게 비교된다.
    return nlohmann::json(a) == nlohmann::json(b);
}

} // namespace FsStore::util
