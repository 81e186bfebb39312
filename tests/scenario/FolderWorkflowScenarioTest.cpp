/**
 * @file FolderWorkflowScenarioTest.cpp
 * @brief Scenario test for the full folder -> store -> rename -> cleanup lifecycle
 */

#include <filesystem>
#include <gtest/gtest.h>

#include <fsstore/error/StoreError.hpp>
#include <fsstore/fs/FsOps.hpp>
#include <fsstore/repository/JsonFileRepositoryImpl.hpp>
#include <fsstore/util/jsonUtil.hpp>

using namespace FsStore;
namespace fs = std::filesystem;

class FolderWorkflowScenarioTest : public ::testing::Test {
  protected:
    void SetUp() override {
        folder_ = "./test_workflow_myFolder";
        renamed_ = "./test_workflow_newFolder";
        fs::remove_all(folder_);
        fs::remove_all(renamed_);
    }

    void TearDown() override {
        fs::remove_all(folder_);
        fs::remove_all(renamed_);
    }

    std::string folder_;
    std::string renamed_;
};

TEST_F(FolderWorkflowScenarioTest, FullLifecycle) {
    std::error_code ec;
    const std::string file = folder_ + "/data.json";

    ASSERT_TRUE(FsOps::createFolder(folder_, ec));
    ASSERT_TRUE(FsOps::createJsonFile(file, ec));
    EXPECT_FALSE(FsOps::createJsonFile(file, ec));
    EXPECT_EQ(ec, StoreErrc::AlreadyExists);

    std::string id;
    {
        JsonFileRepositoryImpl repo(file);
        json u = json::object();
        u["name"] = "Mitali";
        u["age"] = 20;
        u["city"] = "Banglore";
        id = repo.append(u, ec);
        ASSERT_FALSE(ec);
    }

    ASSERT_TRUE(FsOps::renameFolder(folder_, renamed_, ec));
    ASSERT_TRUE(FsOps::renameFileInFolder(renamed_, "data.json", "dataaa.json", ec));

    auto names = FsOps::listFilesInFolder(renamed_, ec);
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "dataaa.json");

    std::string text = FsOps::readFileInFolder(renamed_, "dataaa.json", ec);
    ASSERT_FALSE(ec);
    json root;
    ASSERT_TRUE(util::parseJson(text, root, ec));
    ASSERT_EQ(root.size(), 1u);
    EXPECT_EQ(root[0]["uuid"].get<std::string>(), id);

    // 이전 경로의 저장소는 더 이상 존재하지 않는다.
    JsonFileRepositoryImpl stale(file);
    EXPECT_EQ(stale.findById(id, ec), nullptr);
    EXPECT_EQ(ec, StoreErrc::NotFound);

    JsonFileRepositoryImpl moved(renamed_ + "/dataaa.json");
    EXPECT_NE(moved.findById(id, ec), nullptr);

    ASSERT_TRUE(FsOps::deleteFileInFolder(renamed_, "dataaa.json", ec));
    EXPECT_TRUE(FsOps::listFilesInFolder(renamed_, ec).empty());
    ASSERT_TRUE(FsOps::deleteFolder(renamed_, ec));
    EXPECT_FALSE(FsOps::deleteFolder(renamed_, ec));
    EXPECT_EQ(ec, StoreErrc::NotFound);
}
