#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Ar5iv::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"ar5iv2md", (char*)"2101.00001"};
    auto  config = Config::parse(2, argv);
    EXPECT_EQ(config.source, "2101.00001");
    EXPECT_EQ(config.download_dir, ".");
    EXPECT_EQ(config.timeout, 30);
    EXPECT_EQ(config.jobs, 1);
    EXPECT_EQ(config.user_agent, "ar5iv2md/0.1");
    EXPECT_EQ(config.log_level(), LOG_WARN | LOG_ERROR);
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"ar5iv2md",
                    (char*)"https://ar5iv.org/html/1706.03762",
                    (char*)"--download-dir",
                    (char*)"papers",
                    (char*)"-t",
                    (char*)"5",
                    (char*)"-j",
                    (char*)"8",
                    (char*)"--user-agent",
                    (char*)"agent/1.0",
                    (char*)"-v"};
    auto  config = Config::parse(11, argv);
    EXPECT_EQ(config.source, "https://ar5iv.org/html/1706.03762");
    EXPECT_EQ(config.download_dir, "papers");
    EXPECT_EQ(config.timeout, 5);
    EXPECT_EQ(config.jobs, 8);
    EXPECT_EQ(config.user_agent, "agent/1.0");
    EXPECT_EQ(config.log_level(), LOG_ALL);
}

TEST(ConfigTest, QuietWinsOverVerbose) {
    char* argv[] = {(char*)"ar5iv2md", (char*)"x", (char*)"-v", (char*)"-q"};
    auto  config = Config::parse(4, argv);
    EXPECT_EQ(config.log_level(), LOG_ERROR);
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        download_dir: "yaml_out"
        timeout: 12
        jobs: 3
        user_agent: "yaml-agent"
        verbose: true
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"ar5iv2md", (char*)"2101.00001", (char*)"--config",
                    (char*)"test_config.yaml"};
    auto  config = Config::parse(4, argv);

    EXPECT_EQ(config.download_dir, "yaml_out");
    EXPECT_EQ(config.timeout, 12);
    EXPECT_EQ(config.jobs, 3);
    EXPECT_EQ(config.user_agent, "yaml-agent");
    EXPECT_TRUE(config.verbose);

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "timeout: 20\njobs: 4";
    ofs.close();

    char* argv[] = {(char*)"ar5iv2md",
                    (char*)"2101.00001",
                    (char*)"--config",
                    (char*)"test_ovr.yaml",
                    (char*)"--timeout",
                    (char*)"9"};
    auto  config = Config::parse(6, argv);

    EXPECT_EQ(config.timeout, 9);
    EXPECT_EQ(config.jobs, 4);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "timeout: [not an integer]";
    ofs.close();

    const char* argv[] = {"ar5iv2md", "x", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(4, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, NonExistentFile) {
    const char* argv[] = {"ar5iv2md", "x", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(4, (char**)argv), std::runtime_error);
}

TEST(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"ar5iv2md", (char*)"x", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(4, argv);
    EXPECT_EQ(config.timeout, 30);

    std::remove("empty.yaml");
}

TEST(ConfigTest, MissingSourceExits) {
    char* argv[] = {(char*)"ar5iv2md"};
    EXPECT_EXIT(Config::parse(1, argv), ::testing::ExitedWithCode(106), "");
}
