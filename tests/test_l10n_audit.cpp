#include <gtest/gtest.h>
#include "../main/src/localization.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([^\"]+)\"");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
                auto words_begin = std::sregex_iterator(content.begin(), content.end(), key_regex);
                auto words_end = std::sregex_iterator();
                for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
                    keys.insert((*i)[1].str());
                }
            }
        }
        return keys;
    }

    std::set<std::string> catalogue_keys(const fs::path& file) {
        std::set<std::string> keys;
        std::ifstream f(file);
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            if (auto pos = line.find('='); pos != std::string::npos) keys.insert(line.substr(0, pos));
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    auto source_keys = extract_keys_from_source(fs::path(PKGSLIM_SOURCE_DIR) / "main/src");
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        if (!has_string(key)) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, ChineseCatalogueMatchesEnglish) {
    const fs::path l10n = fs::path(PKGSLIM_SOURCE_DIR) / "l10n";
    EXPECT_EQ(catalogue_keys(l10n / "zh.txt"), catalogue_keys(l10n / "en.txt"));
}

TEST_F(L10nIntegrityTest, UnknownKeysGetPlaceholder) {
    EXPECT_TRUE(has_string("info.description"));
    EXPECT_FALSE(has_string("no.such.key"));
    EXPECT_EQ(get_string("no.such.key"), "[MISSING_STRING: no.such.key]");
}
