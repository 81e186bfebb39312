#include <cstdlib>
#include <iostream>
#include <string>

#include <fsstore/fsstore.hpp>

using namespace FsStore;

// =============================================================================
// Helpers
// =============================================================================

namespace {

constexpr const char* kTag = "example";

/// Status line per outcome; each error class gets its own wording.
void report(const std::string& what, const std::error_code& ec) {
    if (!ec) {
        log::info(kTag, what + ": ok");
        return;
    }
    if (ec == StoreErrc::NotFound)
        log::error(kTag, what + ": not found");
    else if (ec == StoreErrc::AlreadyExists)
        log::warn(kTag, what + ": already exists");
    else if (ec == StoreErrc::ParseError)
        log::error(kTag, what + ": file is not valid JSON, left untouched");
    else
        log::error(kTag, what + ": " + ec.message());
}

json user(const std::string& name, int age, const std::string& city) {
    json v = json::object();
    v["name"] = name;
    v["age"] = age;
    v["city"] = city;
    return v;
}

} // namespace

// =============================================================================
// Walkthrough
// =============================================================================

int main(int argc, char** argv) {
    log::setLevel(log::Level::Info);
    if (const char* lvl = std::getenv("FSSTORE_LOG_LEVEL")) {
        log::Level parsed;
        if (log::parseLevel(lvl, parsed))
            log::setLevel(parsed);
        else
            log::warn(kTag, std::string("ignoring unknown FSSTORE_LOG_LEVEL '") + lvl + "'");
    }

    const std::string folder = argc > 1 ? argv[1] : "./myFolder";
    const std::string renamed = folder + "_renamed";
    const std::string file = folder + "/data.json";
    std::error_code ec;

    FsOps::createFolder(folder, ec);
    report("create folder " + folder, ec);

    FsOps::createJsonFile(file, ec);
    report("create store " + file, ec);

    JsonFileRepositoryImpl repo(file);

    std::string first = repo.append(user("Mugdha", 21, "Nagpur"), ec);
    report("append Mugdha", ec);
    repo.append(user("Mansi", 25, "Kochi"), ec);
    report("append Mansi", ec);
    std::string third = repo.append(user("Mitali", 20, "Banglore"), ec);
    report("append Mitali", ec);

    auto found = repo.findById(third, ec);
    report("find " + third, ec);
    if (found)
        std::cout << util::formatJson(found->fields(), 2) << "\n";

    json patch = json::object();
    patch["age"] = 35;
    patch["city"] = "Hyderabad";
    repo.updateById(first, patch, ec);
    report("update " + first, ec);

    repo.deleteById(third, ec);
    report("delete " + third, ec);

    size_t n = repo.count(ec);
    report("count", ec);
    std::cout << "records: " << n << "\n";

    FsOps::renameFolder(folder, renamed, ec);
    report("rename folder to " + renamed, ec);

    FsOps::renameFileInFolder(renamed, "data.json", "dataaa.json", ec);
    report("rename data.json to dataaa.json", ec);

    auto files = FsOps::listFilesInFolder(renamed, ec);
    report("list " + renamed, ec);
    for (const auto& f : files)
        std::cout << "  " << f << "\n";

    std::string text = FsOps::readFileInFolder(renamed, "dataaa.json", ec);
    report("read dataaa.json", ec);
    if (!ec)
        std::cout << text << "\n";

    FsOps::deleteFileInFolder(renamed, "dataaa.json", ec);
    report("delete dataaa.json", ec);

    FsOps::deleteFolder(renamed, ec);
    report("delete folder " + renamed, ec);

    return 0;
}
