/**
 * @file fsStoreLib/record/JsonRecord.cpp
 * @brief JsonRecord 구현.
 */
#include <fsstore/record/JsonRecord.hpp>

#include <utility>

namespace FsStore {

JsonRecord::JsonRecord() : fields_(json::object()), idField_(kDefaultIdField) {}

JsonRecord::JsonRecord(json fields, std::string idField)
    : fields_(std::move(fields)), idField_(std::move(idField)) {
    if (fields_.is_null())
        fields_ = json::object();
}

std::string JsonRecord::id() const {
    auto it = fields_.find(idField_);
    if (it == fields_.end() || !it->is_string())
        return std::string();
    return it->get<std::string>();
}

const json& JsonRecord::get(const std::string& key) const {
    static const json kNull;
    auto it = fields_.find(key);
    return it == fields_.end() ? kNull : *it;
}

void JsonRecord::merge(const json& patch) { util::mergeShallow(fields_, patch); }

} // namespace FsStore
