/**
 * @file fsStoreLib/util/IdGenerator.cpp
 * @brief libuuid 기반 UUID v4 식별자 생성.
 */
#include <fsstore/util/IdGenerator.hpp>

#include <uuid/uuid.h>

#include <cctype>

namespace FsStore {

std::string UuidGenerator::next() {
    uuid_t raw;
    uuid_generate_random(raw);
    char buf[37]; // 36 chars + NUL
    uuid_unparse_lower(raw, buf);
    return std::string(buf, 36);
}

namespace util {

bool isCanonicalUuid(const std::string& s) {
    if (s.size() != 36)
        return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-')
                return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace util

} // namespace FsStore
