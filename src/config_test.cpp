#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "config.hpp"

class ConfigTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        Config::get() = Config();
        std::filesystem::remove(test_file);
    }

    std::string test_file = "test_config_test.yaml";
};

TEST_F(ConfigTest, Load)
{
    std::ofstream f(test_file);
    f << "listen_address: 0.0.0.0\n"
      << "port: 8123\n"
      << "data_dir: /var/lib/karma\n"
      << "owner: 4242\n"
      << "log_level: debug\n"
      << "default_batch: 50\n";
    f.close();

    Config::get().load(test_file);
    EXPECT_EQ(Config::get().listen_address, "0.0.0.0");
    EXPECT_EQ(Config::get().port, 8123);
    EXPECT_EQ(Config::get().owner, 4242);
    EXPECT_EQ(Config::get().log_level, "debug");
    EXPECT_EQ(Config::get().default_batch, 50);

    std::string expected_db =
        (std::filesystem::path("/var/lib/karma") / "karma.db").string();
    EXPECT_EQ(Config::get().db_path, expected_db);
}

TEST_F(ConfigTest, ExplicitDBPathAndBatchCap)
{
    std::ofstream f(test_file);
    f << "db_path: /tmp/ledger.db\n"
      << "default_batch: 5000\n";
    f.close();

    Config::get().load(test_file);
    EXPECT_EQ(Config::get().db_path, "/tmp/ledger.db");
    EXPECT_EQ(Config::get().default_batch, MAX_BATCH);
    EXPECT_EQ(Config::get().owner, ANONYMOUS);
    EXPECT_EQ(Config::get().port, 8080);
}

TEST_F(ConfigTest, MissingFileThrows)
{
    EXPECT_THROW(Config::get().load("no_such_config.yaml"), std::runtime_error);
}
