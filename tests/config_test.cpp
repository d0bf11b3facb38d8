#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

#include "test_utils.hpp"

class config : public TempDirTest
{
};

TEST_F(config, missing_file_is_generated_with_defaults) {
    const fs::path& path = dir() / "sub" / "config.toml";
    Config cfg(path);
    cfg.LoadConfigFile();

    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(cfg.GetDefaultFormat(), "PNG");
    EXPECT_EQ(cfg.GetDefaultQuality(), 95);
    EXPECT_EQ(cfg.GetDefaultOutputDir(), fs::path("."));
    EXPECT_EQ(cfg.GetConfigFile(), path);

    Config reloaded(path);
    reloaded.LoadConfigFile();
    EXPECT_EQ(reloaded.GetDefaultFormat(), "PNG");
    EXPECT_EQ(reloaded.GetDefaultQuality(), 95);
}

TEST_F(config, partial_file_keeps_defaults_for_the_rest) {
    const fs::path& path = dir() / "config.toml";
    write_text(path, "default_format = \"JPEG\"\n");

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_EQ(cfg.GetDefaultFormat(), "JPEG");
    EXPECT_EQ(cfg.GetDefaultQuality(), 95);
    EXPECT_EQ(cfg.GetDefaultOutputDir(), fs::path("."));
}

TEST_F(config, corrupted_file_gives_defaults_and_is_left_alone) {
    const fs::path&        path    = dir() / "config.toml";
    constexpr std::string_view garbage = "default_format = = [ this is not toml\n";
    write_text(path, garbage);

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_EQ(cfg.GetDefaultFormat(), "PNG");
    EXPECT_EQ(cfg.GetDefaultQuality(), 95);
    EXPECT_EQ(read_text(path), garbage);
}

TEST_F(config, quality_bounds) {
    Config cfg(dir() / "config.toml");
    cfg.LoadConfigFile();

    for (const int bad : { 0, 101, -5 })
    {
        const Result<>& res = cfg.SetDefaultQuality(bad);
        ASSERT_FALSE(res.ok()) << bad;
        EXPECT_EQ(res.error().kind, ErrorKind::InvalidArgument);
        EXPECT_NE(res.error().msg.find("Quality must be between 1 and 100"), std::string::npos);
    }
    EXPECT_EQ(cfg.GetDefaultQuality(), 95);

    EXPECT_TRUE(cfg.SetDefaultQuality(1).ok());
    EXPECT_EQ(cfg.GetDefaultQuality(), 1);
    EXPECT_TRUE(cfg.SetDefaultQuality(100).ok());
    EXPECT_EQ(cfg.GetDefaultQuality(), 100);
}

TEST_F(config, setters_persist_after_save) {
    const fs::path& path = dir() / "config.toml";
    {
        Config cfg(path);
        cfg.LoadConfigFile();
        cfg.SetDefaultFormat("jpeg");
        ASSERT_TRUE(cfg.SetDefaultQuality(70).ok());
        cfg.SetDefaultOutputDir(dir() / "shots");
        EXPECT_EQ(cfg.GetDefaultFormat(), "JPEG");
        ASSERT_TRUE(cfg.SaveConfigFile().ok());
    }

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_EQ(cfg.GetDefaultFormat(), "JPEG");
    EXPECT_EQ(cfg.GetDefaultQuality(), 70);
    EXPECT_EQ(cfg.GetDefaultOutputDir(), dir() / "shots");
}

TEST_F(config, custom_keys_round_trip) {
    const fs::path& path = dir() / "config.toml";
    {
        Config cfg(path);
        cfg.LoadConfigFile();
        cfg.Set("custom_key", "custom_value");
        cfg.Set("custom_number", 42);
        ASSERT_TRUE(cfg.SaveConfigFile().ok());
    }

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_TRUE(cfg.Contains("custom_key"));
    EXPECT_EQ(cfg.Get("custom_key", ""), "custom_value");
    EXPECT_EQ(cfg.Get<int>("custom_number", 0), 42);
    EXPECT_EQ(cfg.Get("missing_key", "fallback"), "fallback");
}

TEST_F(config, reset_drops_custom_keys) {
    const fs::path& path = dir() / "config.toml";
    Config cfg(path);
    cfg.LoadConfigFile();
    cfg.SetDefaultFormat("BMP");
    cfg.Set("custom_key", "x");
    ASSERT_TRUE(cfg.SaveConfigFile().ok());

    ASSERT_TRUE(cfg.Reset().ok());
    EXPECT_EQ(cfg.GetDefaultFormat(), "PNG");
    EXPECT_FALSE(cfg.Contains("custom_key"));

    Config reloaded(path);
    reloaded.LoadConfigFile();
    EXPECT_EQ(reloaded.GetDefaultFormat(), "PNG");
    EXPECT_FALSE(reloaded.Contains("custom_key"));
}

TEST_F(config, output_dir_expands_home) {
    const char* home = std::getenv("HOME");
    if (!home)
        GTEST_SKIP() << "HOME is not set";

    const fs::path& path = dir() / "config.toml";
    write_text(path, "default_output_dir = \"~/Pictures\"\n");

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_EQ(cfg.GetDefaultOutputDir(), fs::path(std::string(home) + "/Pictures"));
}

TEST_F(config, print_lists_every_setting) {
    const fs::path& path = dir() / "config.toml";
    Config cfg(path);
    cfg.LoadConfigFile();
    cfg.Set("custom_key", "custom_value");

    const fs::path& out = dir() / "print.txt";
    std::FILE* f = std::fopen(out.c_str(), "w");
    ASSERT_NE(f, nullptr);
    cfg.Print(f);
    std::fclose(f);

    const std::string& text = read_text(out);
    EXPECT_NE(text.find("Current Configuration:"), std::string::npos);
    EXPECT_NE(text.find("Default Format: PNG"), std::string::npos);
    EXPECT_NE(text.find("Default Quality: 95"), std::string::npos);
    EXPECT_NE(text.find(path.string()), std::string::npos);
    EXPECT_NE(text.find("custom_key"), std::string::npos);
}

TEST_F(config, out_of_range_integers_use_the_fallback) {
    const fs::path& path = dir() / "config.toml";
    write_text(path, "default_quality = 4294967391\nother = -4294967296\n");

    Config cfg(path);
    cfg.LoadConfigFile();
    EXPECT_EQ(cfg.GetDefaultQuality(), 95);
    EXPECT_EQ(cfg.Get<int>("other", 7), 7);
}

TEST_F(config, save_reports_unwritable_location) {
    const fs::path& blocker = dir() / "not_a_dir";
    write_text(blocker, "");

    Config cfg(blocker / "config.toml");
    cfg.SetDefaultFormat("PNG");
    const Result<>& res = cfg.SaveConfigFile();
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::ConfigIO);
    EXPECT_EQ(res.error().op, "save_config");
}
