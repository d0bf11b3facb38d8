#ifndef _CONFIG_HPP
#define _CONFIG_HPP

#include <cstdint>
#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "toml++/toml.hpp"
#include "util.hpp"

inline constexpr std::string_view DEFAULT_CONFIG_FORMAT     = "PNG";
inline constexpr int              DEFAULT_CONFIG_QUALITY    = 95;
inline constexpr std::string_view DEFAULT_CONFIG_OUTPUT_DIR = ".";

class Config
{
public:
    // Only remembers the path, call LoadConfigFile() to actually read it
    explicit Config(const fs::path& configFile);

    /**
     * Load the config file and merge it over the built-in defaults.
     * This never fails:
     * - a missing file gets generated with the defaults
     * - a broken file is left untouched and the defaults are used for this session
     */
    void LoadConfigFile();

    /**
     * Write every key (custom ones too) back to the config file
     * creating the parent directories if needed
     */
    Result<> SaveConfigFile() const;

    // Go back to the built-in defaults, drop the custom keys and save
    Result<> Reset();

    /**
     * Get value of a config variable
     * @param key The config variable name (e.g "default_format")
     * @param fallback Default value if couldn't retrive value
     */
    template <typename T>
    T Get(const std::string_view key, const T& fallback) const
    {
        if constexpr (std::is_same_v<T, int>)
        {
            const std::optional<int64_t> ret = m_tbl[key].value<int64_t>();
            if (!ret || *ret < std::numeric_limits<int>::min() || *ret > std::numeric_limits<int>::max())
                return fallback;
            return static_cast<int>(*ret);
        }
        else
        {
            return m_tbl[key].value<T>().value_or(fallback);
        }
    }

    std::string Get(const std::string_view key, const char* fallback) const
    {
        return Get<std::string>(key, fallback);
    }

    bool Contains(const std::string_view key) const { return m_tbl.contains(key); }

    // Set a custom or well-known key, it's not saved until SaveConfigFile()
    template <typename T>
    void Set(const std::string_view key, T&& value)
    {
        if constexpr (std::is_same_v<std::decay_t<T>, int>)
            m_tbl.insert_or_assign(key, static_cast<int64_t>(value));
        else if constexpr (std::is_convertible_v<T, std::string_view>)
            m_tbl.insert_or_assign(key, std::string(value));
        else
            m_tbl.insert_or_assign(key, std::forward<T>(value));
    }

    std::string GetDefaultFormat() const;
    void        SetDefaultFormat(const std::string_view format);

    int      GetDefaultQuality() const;
    Result<> SetDefaultQuality(int quality);

    // With '~' and '$VAR' expanded
    fs::path GetDefaultOutputDir() const;
    void     SetDefaultOutputDir(const fs::path& dir);

    const fs::path&    GetConfigFile() const { return m_config_file; }
    const toml::table& GetTable() const { return m_tbl; }

    void Print(std::FILE* stream = stdout) const;

private:
    fs::path    m_config_file;
    toml::table m_tbl;

    void FillMissingDefaults();

    // Write the commented default config (AUTOCONFIG)
    Result<> GenerateConfig() const;

    // Replace the config file content, creating its folder if needed
    Result<> WriteConfig(const std::string_view op, const std::string_view content) const;
};

// default config
inline constexpr std::string_view AUTOCONFIG = R"#(# Default image format used when -f/--format is not given.
# One of PNG, JPEG, JPG, BMP, GIF, TIFF, WEBP
default_format = "PNG"

# Default JPEG quality, from 1 to 100. Other formats ignore it
default_quality = 95

# Where screenshots go when -o/--output is not given.
# '~' and '$VAR' at the start are expanded
default_output_dir = "."
)#";

#endif  // _CONFIG_HPP
