// <errno.h> first: glibc declares its own error_t there
#include <errno.h>

#include <cerrno>

#include "util.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

#include "test_utils.hpp"

class util : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        if (const char* path = std::getenv("PATH"))
            m_old_path = path;
    }

    void TearDown() override
    {
        if (m_old_path)
            setenv("PATH", m_old_path->c_str(), 1);
        else
            unsetenv("PATH");
        TempDirTest::TearDown();
    }

private:
    std::optional<std::string> m_old_path;
};

TEST(util_errors, err_keeps_kind_op_and_message) {
    const grab_error_t& err = Err(ErrorKind::SaveFailed, "save", "Failed to save {} ({})", "a.png", 42);
    EXPECT_EQ(err.kind, ErrorKind::SaveFailed);
    EXPECT_EQ(err.op, "save");
    EXPECT_EQ(err.msg, "Failed to save a.png (42)");
    EXPECT_EQ(fmt::format("{}", err), "Failed to save a.png (42)");
    EXPECT_EQ(error_kind_name(err.kind), "SaveFailed");
}

TEST(util_errors, result_holds_value_or_error) {
    const Result<int> value = 7;
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(value.get(), 7);

    const Result<int> failed = Err(ErrorKind::InvalidArgument, "parse", "bad");
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().kind, ErrorKind::InvalidArgument);

    EXPECT_TRUE(Ok().ok());
}

TEST(util_strings, case_helpers) {
    EXPECT_EQ(str_toupper("jpeg"), "JPEG");
    EXPECT_EQ(str_tolower("WebP"), "webp");
}

TEST_F(util, which_needs_the_execute_bit) {
    const fs::path& tool = dir() / "fake-grim";
    write_text(tool, "#!/bin/sh\n");
    setenv("PATH", dir().c_str(), 1);

    fs::permissions(tool, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    EXPECT_FALSE(which("fake-grim"));

    fs::permissions(tool, fs::perms::owner_exec, fs::perm_options::add);
    EXPECT_TRUE(which("fake-grim"));

    EXPECT_FALSE(which("not-there-at-all"));
}
