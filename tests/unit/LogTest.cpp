/**
 * @file LogTest.cpp
 * @brief Unit tests for the line logger
 */

#include <gtest/gtest.h>

#include <cctype>
#include <sstream>

#include <fsstore/util/Log.hpp>

using namespace FsStore;

class LogTest : public ::testing::Test {
  protected:
    void SetUp() override {
        saved_ = log::level();
        log::setSink(&out_);
    }

    void TearDown() override {
        log::setSink(nullptr);
        log::setLevel(saved_);
    }

    std::ostringstream out_;
    log::Level saved_ = log::Level::Warn;
};

TEST_F(LogTest, LineFormat) {
    log::setLevel(log::Level::Debug);
    log::info("store", "hello");

    std::string line = out_.str();
    // [YYYY-MM-DD HH:MM:SS][INFO][store] hello
    ASSERT_GE(line.size(), 22u);
    EXPECT_EQ(line[0], '[');
    EXPECT_EQ(line[5], '-');
    EXPECT_EQ(line[8], '-');
    EXPECT_EQ(line[11], ' ');
    EXPECT_EQ(line[14], ':');
    EXPECT_EQ(line[17], ':');
    EXPECT_EQ(line[20], ']');
    for (size_t i : {1u, 2u, 3u, 4u, 6u, 7u, 9u, 10u, 12u, 13u, 15u, 16u, 18u, 19u})
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(line[i]))) << line;
    EXPECT_NE(line.find("][INFO][store] hello\n"), std::string::npos) << line;
}

TEST_F(LogTest, LevelFilters) {
    log::setLevel(log::Level::Warn);
    log::debug("t", "d");
    log::info("t", "i");
    log::warn("t", "w");
    log::error("t", "e");

    std::string s = out_.str();
    EXPECT_EQ(s.find("[DEBUG]"), std::string::npos);
    EXPECT_EQ(s.find("[INFO]"), std::string::npos);
    EXPECT_NE(s.find("[WARN][t] w"), std::string::npos);
    EXPECT_NE(s.find("[ERROR][t] e"), std::string::npos);
}

TEST_F(LogTest, OffSilencesEverything) {
    log::setLevel(log::Level::Off);
    log::error("t", "e");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LogTest, ParseLevel) {
    log::Level l = log::Level::Off;
    EXPECT_TRUE(log::parseLevel("DEBUG", l));
    EXPECT_EQ(l, log::Level::Debug);
    EXPECT_TRUE(log::parseLevel("warning", l));
    EXPECT_EQ(l, log::Level::Warn);
    EXPECT_TRUE(log::parseLevel("Error", l));
    EXPECT_EQ(l, log::Level::Error);

    EXPECT_FALSE(log::parseLevel("verbose", l));
    EXPECT_EQ(l, log::Level::Error);
}
