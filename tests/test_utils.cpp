#include <gtest/gtest.h>
#include "../main/src/utils.hpp"
#include "../main/src/localization.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class UtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(UtilsTest, RunCommandCapturesOutput) {
    CommandResult r = run_command({"/bin/sh", "-c", "echo hello; echo oops >&2; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_NE(r.output.find("hello"), std::string::npos);
    EXPECT_NE(r.output.find("oops"), std::string::npos);
}

TEST_F(UtilsTest, RunCommandMissingBinary) {
    CommandResult r = run_command({"/nonexistent/binary"});
    EXPECT_EQ(r.exit_code, 127);
}

TEST_F(UtilsTest, RunCommandEmptyThrows) {
    EXPECT_THROW(run_command({}), PkgslimException);
}

TEST_F(UtilsTest, Trim) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST_F(UtilsTest, ReadLinesSkipsBlankAndCarriageReturns) {
    fs::path p = fs::absolute("tmp_read_lines.txt");
    {
        std::ofstream f(p);
        f << "one\r\n\ntwo\n";
    }
    EXPECT_EQ(read_lines(p), (std::vector<std::string>{"one", "two"}));
    fs::remove(p);

    EXPECT_THROW(read_lines(p), PkgslimException);
}

TEST_F(UtilsTest, LogTraceIndents) {
    testing::internal::CaptureStdout();
    log_trace(0, "top");
    log_trace(2, "deep");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "top\n    deep\n");
}
