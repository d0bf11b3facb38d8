#include "util.hpp"

#ifdef _WIN32
#  include <windows.h>
#  include <shlobj.h>
#endif

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "fmt/format.h"

bool g_verbose = false;
bool g_quiet   = false;

std::string_view error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::PlatformNotSupported: return "PlatformNotSupported";
        case ErrorKind::DependencyMissing:    return "DependencyMissing";
        case ErrorKind::CaptureFailed:        return "CaptureFailed";
        case ErrorKind::InvalidRegion:        return "InvalidRegion";
        case ErrorKind::SaveFailed:           return "SaveFailed";
        case ErrorKind::ConfigIO:             return "ConfigIO";
        case ErrorKind::InvalidArgument:      return "InvalidArgument";
    }
    return "Unknown";
}

std::string str_toupper(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
    return str;
}

std::string str_tolower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}

std::string expandVar(std::string ret, bool dont)
{
    if (ret.empty() || dont)
        return ret;

    const char* env;
    if (ret.front() == '~')
    {
        env = std::getenv("HOME");
        if (env == nullptr)
            die(_("FATAL: $HOME enviroment variable is not set (how?)"));

        ret.replace(0, 1, env);  // replace ~ with the $HOME value
    }
    else if (ret.front() == '$')
    {
        std::string  name = ret.substr(1);
        std::string  temp;
        const size_t pos = name.find('/');
        if (pos != std::string::npos)
        {
            temp = name.substr(pos);
            name.erase(pos);
        }

        env = std::getenv(name.c_str());
        if (env == nullptr)
        {
            warn(_("No such enviroment variable: {}, keeping '{}' as is"), name, ret);
            return ret;
        }

        ret = env;
        ret += temp;
    }

    return ret;
}

bool which(const std::string_view name)
{
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr)
        return false;

#ifdef _WIN32
    constexpr char sep = ';';
#else
    constexpr char sep = ':';
#endif

    const std::string_view paths(path_env);
    size_t                 start = 0;
    while (start <= paths.size())
    {
        size_t end = paths.find(sep, start);
        if (end == std::string_view::npos)
            end = paths.size();

        const std::string_view dir = paths.substr(start, end - start);
        if (!dir.empty())
        {
            std::error_code ec;
            const fs::path  candidate = fs::path(dir) / name;
#ifdef _WIN32
            if (fs::is_regular_file(candidate, ec))
                return true;
#else
            if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
                return true;
#endif
        }

        start = end + 1;
    }

    return false;
}

fs::path getHomeConfigDir()
{
#if __unix__ || __APPLE__
    const char* dir = std::getenv("XDG_CONFIG_HOME");
    if (dir != NULL && dir[0] != '\0' && fs::exists(dir))
    {
        return fs::path(dir);
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (home == nullptr)
            die(_("Failed to find $HOME, set it to your home directory!"));

        return fs::path(home) / ".config";
    }
#else
    PWSTR widePath = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, NULL, &widePath)))
    {
        // Get required buffer size
        int         size = WideCharToMultiByte(CP_UTF8, 0, widePath, -1, NULL, 0, NULL, NULL);
        std::string narrowPath(size, 0);
        WideCharToMultiByte(CP_UTF8, 0, widePath, -1, &narrowPath[0], size, NULL, NULL);
        CoTaskMemFree(widePath);

        // Remove null terminator from string
        narrowPath.pop_back();
        return narrowPath;
    }
    const char* dir = std::getenv("APPDATA");
    if (dir == NULL || dir[0] == '\0' || !fs::exists(dir))
        die("Failed to get %APPDATA% path");

    return fs::path(dir);
#endif
}

fs::path getConfigDir()
{
    return getHomeConfigDir() / "grabshot";
}
