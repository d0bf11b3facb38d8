#include "config.hpp"

#include <sstream>
#include <string>
#include <system_error>

#include "fmt/os.h"
#include "util.hpp"

Config::Config(const fs::path& configFile) : m_config_file(configFile) {}

void Config::FillMissingDefaults()
{
    if (!m_tbl.contains("default_format"))
        m_tbl.insert("default_format", std::string(DEFAULT_CONFIG_FORMAT));
    if (!m_tbl.contains("default_quality"))
        m_tbl.insert("default_quality", static_cast<int64_t>(DEFAULT_CONFIG_QUALITY));
    if (!m_tbl.contains("default_output_dir"))
        m_tbl.insert("default_output_dir", std::string(DEFAULT_CONFIG_OUTPUT_DIR));
}

void Config::LoadConfigFile()
{
    std::error_code ec;
    if (!fs::exists(m_config_file, ec))
    {
        warn(_("config file {} not found, generating new one"), m_config_file.string());
        m_tbl = toml::parse(AUTOCONFIG);

        const Result<>& res = GenerateConfig();
        if (!res.ok())
            warn(_("Failed to generate config file: {}"), res.error());
        return;
    }

    try
    {
        m_tbl = toml::parse_file(m_config_file.string());
    }
    catch (const toml::parse_error& err)
    {
        // don't overwrite the user file, it may be fixable by hand
        warn(_("Parsing config file '{}' failed:\n"
               "{}\n"
               "\t(error occurred at line {} column {})\n"
               "Using the default settings for this session"),
             m_config_file.string(),
             err.description(),
             err.source().begin.line,
             err.source().begin.column);
        m_tbl = toml::table{};
    }

    FillMissingDefaults();
    debug("Loaded config file '{}'", m_config_file.string());
}

Result<> Config::WriteConfig(const std::string_view op, const std::string_view content) const
{
    std::error_code ec;
    if (m_config_file.has_parent_path())
    {
        fs::create_directories(m_config_file.parent_path(), ec);
        if (ec)
            return Err(ErrorKind::ConfigIO,
                       op,
                       "Failed to create config folder {}: {}",
                       m_config_file.parent_path().string(),
                       ec.message());
    }

    try
    {
        auto f = fmt::output_file(m_config_file.string());
        f.print("{}", content);
        f.close();
    }
    catch (const std::system_error& e)
    {
        return Err(ErrorKind::ConfigIO, op, "Failed to write {}: {}", m_config_file.string(), e.what());
    }

    return Ok();
}

Result<> Config::GenerateConfig() const
{
    return WriteConfig("generate_config", AUTOCONFIG);
}

Result<> Config::SaveConfigFile() const
{
    std::ostringstream oss;
    oss << m_tbl << '\n';
    return WriteConfig("save_config", oss.str());
}

Result<> Config::Reset()
{
    m_tbl = toml::parse(AUTOCONFIG);
    return GenerateConfig();
}

std::string Config::GetDefaultFormat() const
{
    return str_toupper(Get<std::string>("default_format", std::string(DEFAULT_CONFIG_FORMAT)));
}

void Config::SetDefaultFormat(const std::string_view format)
{
    Set("default_format", str_toupper(std::string(format)));
}

int Config::GetDefaultQuality() const
{
    return Get<int>("default_quality", DEFAULT_CONFIG_QUALITY);
}

Result<> Config::SetDefaultQuality(int quality)
{
    if (quality < 1 || quality > 100)
        return Err(ErrorKind::InvalidArgument,
                   "set_default_quality",
                   "Quality must be between 1 and 100 (got {})",
                   quality);

    Set("default_quality", quality);
    return Ok();
}

fs::path Config::GetDefaultOutputDir() const
{
    return expandVar(Get<std::string>("default_output_dir", std::string(DEFAULT_CONFIG_OUTPUT_DIR)));
}

void Config::SetDefaultOutputDir(const fs::path& dir)
{
    Set("default_output_dir", dir.string());
}

void Config::Print(std::FILE* stream) const
{
    fmt::print(stream, "Current Configuration:\n");
    fmt::print(stream, "  Default Format: {}\n", GetDefaultFormat());
    fmt::print(stream, "  Default Directory: {}\n", GetDefaultOutputDir().string());
    fmt::print(stream, "  Default Quality: {}\n", GetDefaultQuality());
    fmt::print(stream, "  Config File: {}\n", m_config_file.string());

    for (const auto& [key, value] : m_tbl)
    {
        if (key == "default_format" || key == "default_quality" || key == "default_output_dir")
            continue;

        std::ostringstream oss;
        value.visit([&oss](const auto& node) { oss << node; });
        fmt::print(stream, "  {}: {}\n", key.str(), oss.str());
    }
}
