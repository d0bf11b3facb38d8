#ifndef _TEST_UTILS_HPP_
#define _TEST_UTILS_HPP_

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "screen_capture.hpp"
#include "util.hpp"

// A fresh directory under the system temp dir, removed with the fixture
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{ 0 };

        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() /
                fmt::format("grabshot_{}_{}_{}_{}", info->test_suite_name(), info->name(), getpid(), counter++);
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);

        g_verbose = false;
        g_quiet   = true;
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
        g_quiet = false;
    }

    const fs::path& dir() const { return m_dir; }

private:
    fs::path m_dir;
};

inline capture_result_t make_solid_image(int w, int h, uint8_t r, uint8_t g, uint8_t b)
{
    capture_result_t img;
    img.w = w;
    img.h = h;
    img.data.resize(static_cast<size_t>(w) * h * 4);
    for (size_t i = 0; i < img.data.size(); i += 4)
    {
        img.data[i + 0] = r;
        img.data[i + 1] = g;
        img.data[i + 2] = b;
        img.data[i + 3] = 0xff;
    }
    return img;
}

inline std::vector<uint8_t> read_file(const fs::path& path)
{
    std::ifstream f(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>() };
}

inline std::string read_text(const fs::path& path)
{
    std::ifstream f(path);
    return { std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>() };
}

inline void write_text(const fs::path& path, const std::string_view text)
{
    std::ofstream f(path, std::ios::trunc);
    f << text;
}

#endif  // !_TEST_UTILS_HPP_
