#include "utils/FileUtils.hpp"
#include "core/History.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <string>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

// Test Fixture for tests needing filesystem setup/teardown
class FileUtilsFixture : public ::testing::Test {
protected:
    std::string baseTestDir = "temp_fileutils_test_dir";
    std::string nestedDir = "subdir1/subdir2";

    // Original working directory to restore later
    fs::path original_cwd;

    Eigen::VectorXd lb = Eigen::VectorXd::Constant(2, -1.0);
    Eigen::VectorXd ub = Eigen::VectorXd::Constant(2, 1.0);
    std::vector<metaopt::Agent> agents;
    metaopt::Agent best{2, 2, lb, ub};

    void SetUp() override {
        original_cwd = fs::current_path();
        fs::remove_all(baseTestDir);
        fs::create_directories(baseTestDir);
        fs::create_directory(FileUtils::joinPaths(baseTestDir, "data"));
        fs::current_path(baseTestDir);

        for (int i = 0; i < 3; ++i) {
            metaopt::Agent agent(2, 2, lb, ub);
            agent.position().setConstant(0.1 * i);
            agent.setFitness(static_cast<double>(i));
            agents.push_back(agent);
        }
        best = agents[0];
    }

    void TearDown() override {
        fs::current_path(original_cwd);
        fs::remove_all(baseTestDir);
    }

    std::vector<std::string> readLines(const std::string& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) lines.push_back(line);
        return lines;
    }
};

TEST(FileUtilsTest, JoinPaths) {
    EXPECT_EQ(FileUtils::joinPaths("path/to", "file.txt"), "path/to/file.txt");
    EXPECT_EQ(FileUtils::joinPaths("/", "home/user"), "/home/user");
    EXPECT_EQ(FileUtils::joinPaths("path/to/", "file.txt"), "path/to/file.txt");
    EXPECT_EQ(FileUtils::joinPaths("path/to", "/file.txt"), "path/to/file.txt");
    EXPECT_EQ(FileUtils::joinPaths("", "file.txt"), "file.txt");
    EXPECT_EQ(FileUtils::joinPaths("path/to", ""), "path/to");
    EXPECT_EQ(FileUtils::joinPaths("", ""), "");
    EXPECT_EQ(FileUtils::joinPaths("path/./to", "../file.txt"), "path/file.txt");
}

TEST(FileUtilsTest, PositionHeader) {
    EXPECT_EQ(FileUtils::positionHeader(2, 1), "x0_0,x1_0");
    EXPECT_EQ(FileUtils::positionHeader(1, 3, "best_x"), "best_x0_0,best_x0_1,best_x0_2");
}

TEST_F(FileUtilsFixture, EnsureDirectoryExists_CreateNew) {
    std::string newDirPath = "new_dir";
    ASSERT_FALSE(fs::exists(newDirPath));
    EXPECT_TRUE(FileUtils::ensureDirectoryExists(newDirPath));
    EXPECT_TRUE(fs::exists(newDirPath));
    EXPECT_TRUE(fs::is_directory(newDirPath));
}

TEST_F(FileUtilsFixture, EnsureDirectoryExists_Existing) {
    std::string existingDirPath = "data";
    ASSERT_TRUE(fs::exists(existingDirPath));
    EXPECT_TRUE(FileUtils::ensureDirectoryExists(existingDirPath));
    EXPECT_TRUE(fs::exists(existingDirPath));
}

TEST_F(FileUtilsFixture, EnsureDirectoryExists_Nested) {
    std::string nestedPath = nestedDir;
    ASSERT_FALSE(fs::exists(nestedPath));
    EXPECT_TRUE(FileUtils::ensureDirectoryExists(nestedPath));
    EXPECT_TRUE(fs::exists(nestedPath));
    EXPECT_TRUE(fs::is_directory(nestedPath));
}

TEST_F(FileUtilsFixture, WriteSpaceSnapshot) {
    const std::string path = FileUtils::joinPaths(nestedDir, "snapshot.csv");
    FileUtils::writeSpaceSnapshot(path, 7, best, agents);

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "# iteration 7");
    EXPECT_EQ(lines[1], "role,index,fitness,x0_0,x0_1,x1_0,x1_1");
    EXPECT_EQ(lines[2], "best,-1,0,0,0,0,0");
    EXPECT_EQ(lines[3].substr(0, 10), "agent,0,0,");
    EXPECT_EQ(lines[4].substr(0, 10), "agent,1,1,");
    EXPECT_EQ(lines[5].substr(0, 10), "agent,2,2,");
}

TEST_F(FileUtilsFixture, WriteHistoryCSV) {
    metaopt::History history;
    history.dump(1, agents, best);
    history.dump(2, agents, best);

    FileUtils::writeHistoryCSV("history.csv", history);
    const auto lines = readLines("history.csv");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "iteration,best_fitness,mean_fitness,variance_fitness,min_fitness,max_fitness,"
                        "best_x0_0,best_x0_1,best_x1_0,best_x1_1");
    EXPECT_EQ(lines[2].substr(0, 6), "2,0,1,");
}

TEST_F(FileUtilsFixture, WriteFailsOnDirectoryPath) {
    EXPECT_THROW(FileUtils::writeHistoryCSV("data", metaopt::History()), metaopt::FileIOException);
}
