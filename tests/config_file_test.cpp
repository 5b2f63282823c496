#include <gtest/gtest.h>

#include "config_file.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace g1;

class JsonConfigStoreTest : public ::testing::Test {
protected:
    std::string dir;
    std::string path;

    void SetUp() override {
        char pattern[] = "/tmp/g1link-test-XXXXXX";
        ASSERT_NE(nullptr, mkdtemp(pattern));
        dir = pattern;
        path = dir + "/nested/config.json";
    }

    void TearDown() override {
        std::remove(path.c_str());
        std::remove((path + ".tmp").c_str());
        rmdir((dir + "/nested").c_str());
        rmdir(dir.c_str());
    }

    void write_file(const std::string& content) {
        mkdir((dir + "/nested").c_str(), 0700);
        std::ofstream out(path);
        out << content;
    }

    std::string read_file() {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(JsonConfigStoreTest, MissingFileLoadsEmpty) {
    config_file::JsonConfigStore store(path);

    EXPECT_TRUE(store.load());
    EXPECT_FALSE(store.address(Side::Left).has_value());
    EXPECT_FALSE(store.paired(Side::Right));
    EXPECT_FALSE(store.complete());
}

TEST_F(JsonConfigStoreTest, SaveCreatesDirectoriesAndReloads) {
    config_file::JsonConfigStore store(path);
    store.set_address(Side::Left, "AA:BB:CC:DD:EE:01");
    store.set_name(Side::Left, "G1_L_42");
    store.set_paired(Side::Left, true);
    store.set_address(Side::Right, "AA:BB:CC:DD:EE:02");

    ASSERT_TRUE(store.save());

    struct stat st;
    EXPECT_NE(0, stat((path + ".tmp").c_str(), &st));

    config_file::JsonConfigStore reloaded(path);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ("AA:BB:CC:DD:EE:01", reloaded.address(Side::Left));
    EXPECT_EQ("G1_L_42", reloaded.name(Side::Left));
    EXPECT_TRUE(reloaded.paired(Side::Left));
    EXPECT_EQ("AA:BB:CC:DD:EE:02", reloaded.address(Side::Right));
    EXPECT_FALSE(reloaded.name(Side::Right).has_value());
    EXPECT_FALSE(reloaded.paired(Side::Right));
    EXPECT_TRUE(reloaded.complete());
}

TEST_F(JsonConfigStoreTest, MissingValuesSavedAsNull) {
    config_file::JsonConfigStore store(path);
    ASSERT_TRUE(store.save());

    auto content = read_file();
    EXPECT_NE(std::string::npos, content.find("\"left_address\": null"));
    EXPECT_NE(std::string::npos, content.find("\"right_name\": null"));
    EXPECT_NE(std::string::npos, content.find("\"right_paired\": false"));
}

TEST_F(JsonConfigStoreTest, MalformedFileLoadsEmpty) {
    write_file("{ \"left_address\": ");

    config_file::JsonConfigStore store(path);
    store.set_address(Side::Left, "stale");

    EXPECT_FALSE(store.load());
    EXPECT_FALSE(store.address(Side::Left).has_value());
}

TEST_F(JsonConfigStoreTest, AbsentKeysDefault) {
    write_file("{\"left_address\": \"AA\", \"right_address\": null}");

    config_file::JsonConfigStore store(path);
    ASSERT_TRUE(store.load());

    EXPECT_EQ("AA", store.address(Side::Left));
    EXPECT_FALSE(store.address(Side::Right).has_value());
    EXPECT_FALSE(store.paired(Side::Left));
    EXPECT_FALSE(store.complete());
}

TEST_F(JsonConfigStoreTest, SyncFileNeedsExistingFile) {
    write_file("{}");

    EXPECT_TRUE(config_file::sync_file(path));
    EXPECT_FALSE(config_file::sync_file(dir + "/nested/missing.json"));
}

TEST(ConfigDefaultPath, PrefersXdgConfigHome) {
    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old_xdg ? old_xdg : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ("/tmp/xdg/g1link/config.json", config_file::default_path());

    unsetenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (home && *home) {
        EXPECT_EQ(std::string(home) + "/.config/g1link/config.json", config_file::default_path());
    }

    if (old_xdg) setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
}
