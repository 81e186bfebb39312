/**
 * @file FilePermissionTest.cpp
 * @brief Integration tests for file permission and access failure mapping
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>

#include <fsstore/error/StoreError.hpp>
#include <fsstore/fs/FsOps.hpp>
#include <fsstore/repository/JsonFileRepositoryImpl.hpp>

#include "support/TestFiles.hpp"

using namespace FsStore;

class FilePermissionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_permission.json";
        ::remove(testFile_.c_str());
        testsupport::writeText(testFile_, "{}");
    }

    void TearDown() override {
        ::chmod(testFile_.c_str(), 0644);
        ::remove(testFile_.c_str());
    }

    static bool isRoot() { return ::geteuid() == 0; }

    std::string testFile_;
};

TEST_F(FilePermissionTest, NormalReadWrite) {
    JsonFileRepositoryImpl repo(testFile_);
    std::error_code ec;
    json v = json::object();
    v["name"] = "alice";
    EXPECT_FALSE(repo.append(v, ec).empty());
    EXPECT_FALSE(ec);
}

TEST_F(FilePermissionTest, ReadOnlyFileRejectsWritesButAllowsReads) {
    if (isRoot())
        GTEST_SKIP() << "permission bits are not enforced for root";

    testsupport::writeText(testFile_, R"([{"uuid":"a","name":"alice"}])");
    ASSERT_EQ(::chmod(testFile_.c_str(), 0444), 0);

    JsonFileRepositoryImpl repo(testFile_);
    std::error_code ec;
    EXPECT_EQ(repo.append(json::object(), ec), "");
    EXPECT_EQ(ec, StoreErrc::IOError);
    EXPECT_TRUE(ec == std::errc::io_error);

    EXPECT_FALSE(repo.deleteById("a", ec));
    EXPECT_EQ(ec, StoreErrc::IOError);

    auto found = repo.findById("a", ec);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->get("name").get<std::string>(), "alice");
    EXPECT_EQ(testsupport::readText(testFile_), R"([{"uuid":"a","name":"alice"}])");
}

TEST_F(FilePermissionTest, UnreadableFileIsIOError) {
    if (isRoot())
        GTEST_SKIP() << "permission bits are not enforced for root";

    ASSERT_EQ(::chmod(testFile_.c_str(), 0000), 0);
    JsonFileRepositoryImpl repo(testFile_);
    std::error_code ec;
    EXPECT_EQ(repo.count(ec), 0u);
    EXPECT_EQ(ec, StoreErrc::IOError);
}

TEST_F(FilePermissionTest, NonExistentDirectory) {
    JsonFileRepositoryImpl repo("/nonexistent/path/file.json");
    std::error_code ec;
    EXPECT_EQ(repo.append(json::object(), ec), "");
    EXPECT_EQ(ec, StoreErrc::NotFound);

    EXPECT_FALSE(FsOps::createJsonFile("/nonexistent/path/file.json", ec));
    EXPECT_EQ(ec, StoreErrc::NotFound);
}

TEST_F(FilePermissionTest, FileDescriptorLeak) {
    // 연산마다 open/close 하므로 fd 한도를 넘는 반복에서도 실패하지 않아야 한다.
    JsonFileRepositoryImpl repo(testFile_, StoreOptions{"uuid", 0, LockPolicy::Advisory, false});
    for (int i = 0; i < 2000; ++i) {
        std::error_code ec;
        ASSERT_FALSE(repo.existsById("x", ec)) << "iteration " << i;
        ASSERT_FALSE(ec) << "iteration " << i << ": " << ec.message();
    }
    SUCCEED();
}
