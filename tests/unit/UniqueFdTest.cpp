/**
 * @file UniqueFdTest.cpp
 * @brief Unit tests for UniqueFd RAII wrapper
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <fsstore/util/UniqueFd.hpp>

using namespace FsStore::detail;

class UniqueFdTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_uniquefd.tmp";
        ::remove(testFile_.c_str());
    }

    void TearDown() override { ::remove(testFile_.c_str()); }

    std::string testFile_;
};

TEST_F(UniqueFdTest, DefaultIsInvalid) {
    UniqueFd fd;
    EXPECT_EQ(fd.get(), -1);
    EXPECT_FALSE(fd.valid());
    EXPECT_FALSE(static_cast<bool>(fd));
}

TEST_F(UniqueFdTest, OpenCreatesFile) {
    std::error_code ec;
    auto fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(fd.valid());
    EXPECT_EQ(::access(testFile_.c_str(), F_OK), 0);
}

TEST_F(UniqueFdTest, OpenMissingFileReportsErrno) {
    std::error_code ec;
    auto fd = UniqueFd::open(testFile_, O_RDONLY, ec);
    EXPECT_FALSE(fd.valid());
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(UniqueFdTest, OpenSetsCloseOnExec) {
    std::error_code ec;
    auto fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd.valid());
    int flags = ::fcntl(fd.get(), F_GETFD);
    ASSERT_GE(flags, 0);
    EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST_F(UniqueFdTest, DestructorClosesFd) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    {
        UniqueFd fd(rawFd);
        EXPECT_TRUE(fd.valid());
    }

    EXPECT_EQ(::write(rawFd, "x", 1), -1);
}

TEST_F(UniqueFdTest, MoveTransfersOwnership) {
    std::error_code ec;
    auto fd1 = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    int raw = fd1.get();

    UniqueFd fd2(std::move(fd1));
    EXPECT_FALSE(fd1.valid());
    EXPECT_EQ(fd2.get(), raw);

    UniqueFd fd3;
    fd3 = std::move(fd2);
    EXPECT_FALSE(fd2.valid());
    EXPECT_EQ(fd3.get(), raw);
}

TEST_F(UniqueFdTest, ReleaseDoesNotClose) {
    std::error_code ec;
    auto fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    int raw = fd.release();
    EXPECT_FALSE(fd.valid());
    EXPECT_EQ(::write(raw, "x", 1), 1);
    ::close(raw);
}

TEST_F(UniqueFdTest, ExplicitCloseReportsSuccess) {
    std::error_code ec;
    auto fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, ec);
    ASSERT_TRUE(fd.valid());

    EXPECT_TRUE(fd.close(ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(fd.valid());

    // closing an already closed wrapper is a no-op
    EXPECT_TRUE(fd.close(ec));
}
