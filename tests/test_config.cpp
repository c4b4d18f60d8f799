#include <gtest/gtest.h>
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        init_localization();
        // Reset to default
        set_root_path("/");
        test_root = fs::absolute("tmp_config_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        set_root_path("/");
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    fs::path write_conf(const std::string& content) {
        fs::path p = test_root / "pkgslim.conf";
        std::ofstream f(p);
        f << content;
        return p;
    }
};

TEST_F(ConfigTest, DefaultRoot) {
    EXPECT_EQ(ROOT_DIR, "/");
    EXPECT_EQ(CONFIG_DIR, PKGSLIM_CONF_DIR);
    EXPECT_EQ(DPKG_STATUS_FILE, "/var/lib/dpkg/status");
    EXPECT_EQ(DPKG_INFO_DIR, "/var/lib/dpkg/info");
    EXPECT_EQ(LPKG_PKGS_FILE, "/var/lib/lpkg/pkgs");
}

TEST_F(ConfigTest, CustomRoot) {
    std::string root = "/mnt/new_root";
    set_root_path(root);

    EXPECT_EQ(ROOT_DIR, fs::path(root));
    EXPECT_EQ(DPKG_STATUS_FILE, fs::path(root) / "var/lib/dpkg/status");
    EXPECT_EQ(DPKG_INFO_DIR, fs::path(root) / "var/lib/dpkg/info");
    EXPECT_EQ(LPKG_PROVIDES_DB, fs::path(root) / "var/lib/lpkg/provides.db");
    EXPECT_EQ(SETTINGS_FILE, fs::path(root) / fs::path(PKGSLIM_CONF_DIR).relative_path() / "pkgslim.conf");
}

TEST_F(ConfigTest, CustomRootWithTrailingSlash) {
    set_root_path("/mnt/new_root/");
    EXPECT_EQ(DPKG_STATUS_FILE, fs::path("/mnt/new_root/") / "var/lib/dpkg/status");
}

TEST_F(ConfigTest, DuPathIsNotRebased) {
    set_root_path("/mnt/new_root");
    EXPECT_EQ(DU_BIN_PATH, "/usr/bin/du");
}

TEST_F(ConfigTest, MissingSettingsFileGivesDefaults) {
    Settings s = load_settings(test_root / "absent.conf");
    EXPECT_EQ(s.max_results, DEFAULT_MAX_RESULTS);
    EXPECT_EQ(s.max_depth, DEFAULT_MAX_DEPTH);
    EXPECT_FALSE(s.explore_var);
    EXPECT_FALSE(s.verbose);
    EXPECT_EQ(s.backend, Backend::DPKG);
}

TEST_F(ConfigTest, ReadsSettings) {
    auto path = write_conf(
        "# pkgslim settings\n"
        "max_results = 20\n"
        "\n"
        "max_depth=15\n"
        "explore_var = yes\n"
        "verbose = false\n"
        "backend = lpkg\n"
        "colour = always\n");

    Settings s = load_settings(path);
    EXPECT_EQ(s.max_results, 20u);
    EXPECT_EQ(s.max_depth, 15);
    EXPECT_TRUE(s.explore_var);
    EXPECT_FALSE(s.verbose);
    EXPECT_EQ(s.backend, Backend::LPKG);
}

TEST_F(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(load_settings(write_conf("max_results = -3\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("max_depth = 0\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("max_depth = ten\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("max_depth = 2147483648\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("max_results = 99999999999999999999\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("explore_var = maybe\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("backend = rpm\n")), PkgslimException);
    EXPECT_THROW(load_settings(write_conf("just some words\n")), PkgslimException);
}

TEST_F(ConfigTest, MaxDepthAcceptsLargestInt) {
    Settings s = load_settings(write_conf("max_depth = 2147483647\n"));
    EXPECT_EQ(s.max_depth, std::numeric_limits<int>::max());
}

TEST_F(ConfigTest, ArchitectureOverride) {
    set_architecture("riscv64");
    EXPECT_EQ(get_architecture(), "riscv64");
    set_architecture("");
    EXPECT_FALSE(get_architecture().empty());
}
