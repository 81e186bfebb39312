#pragma once
/// @file JsonFileRepositoryImpl.hpp
/// @brief Record repository over a single JSON array file

#include "../util/FileLockGuard.hpp"
#include "../util/IdGenerator.hpp"
#include "../util/UniqueFd.hpp"
#include "RecordRepository.hpp"
#include "StoreOptions.hpp"

#include <memory>
#include <string>

namespace FsStore {

/// @brief Record repository backed by one JSON file
/// @details The file holds either the empty sentinel `{}` or an array of objects.
///          Each call opens the file, reads and parses all of it, and for
///          mutations truncates and rewrites all of it. Nothing is cached
///          between calls, so edits made by other processes are always seen.
///
///          With LockPolicy::None (default) two writers can interleave and the
///          last one wins. LockPolicy::Advisory serializes them with fcntl locks.
///
///          The file is never created here; create it first (FsOps::createJsonFile).
class JsonFileRepositoryImpl : public RecordRepository {
  public:
    /// @brief Constructor
    /// @param path Store file path
    /// @param options Configuration
    /// @param ids Identifier source (UuidGenerator when null)
    explicit JsonFileRepositoryImpl(std::string path, StoreOptions options = StoreOptions(),
                                    std::unique_ptr<IdGenerator> ids = nullptr);
    ~JsonFileRepositoryImpl() override = default;

    JsonFileRepositoryImpl(const JsonFileRepositoryImpl&) = delete;
    JsonFileRepositoryImpl& operator=(const JsonFileRepositoryImpl&) = delete;

    std::string append(const json& data, std::error_code& ec) override;
    std::unique_ptr<JsonRecord> findById(const std::string& id, std::error_code& ec) override;
    bool updateById(const std::string& id, const json& newData,
                    std::error_code& ec) override;
    bool deleteById(const std::string& id, std::error_code& ec) override;
    std::vector<std::unique_ptr<JsonRecord>> findAll(std::error_code& ec) override;
    bool deleteAll(std::error_code& ec) override;
    size_t count(std::error_code& ec) override;
    bool existsById(const std::string& id, std::error_code& ec) override;

    const std::string& path() const noexcept { return path_; }
    const StoreOptions& options() const noexcept { return options_; }

  private:
    /// @brief Open descriptor plus (optional) lock for one operation
    struct Session {
        detail::UniqueFd fd;
        detail::FileLockGuard lock;
    };

    enum class Access { Read, Write };

    bool open(Access access, Session& s, std::error_code& ec);
    /// @brief Read and parse the whole file
    bool load(const Session& s, json& root, std::error_code& ec);
    /// @brief Narrow a parsed document to the record array
    /// @details Array -> itself; `{}` -> empty array; anything else -> ParseError.
    bool recordsOf(json& root, std::error_code& ec);
    /// @brief Serialize and replace the file content, then close
    bool store(Session& s, const json& records, std::error_code& ec);
    /// @brief First object element whose identifier equals id, or nullptr
    const json* locate(const json& records, const std::string& id) const;
    bool matches(const json& element, const std::string& id) const;

    std::string path_;
    StoreOptions options_;
    std::unique_ptr<IdGenerator> ids_;
};

} // namespace FsStore
