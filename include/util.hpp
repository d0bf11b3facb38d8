#ifndef _UTIL_HPP_
#define _UTIL_HPP_

#ifdef _WIN32
#  include <io.h>
#else
#  include <unistd.h>
#endif

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "fmt/chrono.h"
#include "fmt/color.h"
#include "fmt/format.h"

#if ENABLE_NLS
/* here so it doesn't need to be included elsewhere */
#include <libintl.h>
#include <locale.h>
#define _(str) gettext(str)
#else
#define _(s) (char*)s
#endif

namespace fs = std::filesystem;

// Set from the command line (--verbose / --quiet)
extern bool g_verbose;
extern bool g_quiet;

enum class ErrorKind
{
    PlatformNotSupported,
    DependencyMissing,
    CaptureFailed,
    InvalidRegion,
    SaveFailed,
    ConfigIO,
    InvalidArgument
};

struct grab_error_t
{
    ErrorKind   kind;
    std::string op;   // the operation that failed, e.g "capture_region"
    std::string msg;
};

std::string_view error_kind_name(ErrorKind kind);

/*
 * Either a value or a grab_error_t.
 * Result<> is the value-less version, it only tells if the operation went fine.
 */
template <typename T = void>
class Result
{
public:
    Result(const T& value) : m_data(value) {}
    Result(T&& value) : m_data(std::move(value)) {}
    Result(grab_error_t err) : m_data(std::move(err)) {}

    bool ok() const { return m_data.index() == 0; }

    T&       get() & { return std::get<0>(m_data); }
    const T& get() const& { return std::get<0>(m_data); }
    T&&      get() && { return std::get<0>(std::move(m_data)); }

    const grab_error_t& error() const { return std::get<1>(m_data); }

private:
    std::variant<T, grab_error_t> m_data;
};

template <>
class Result<void>
{
public:
    Result() = default;
    Result(grab_error_t err) : m_err(std::move(err)) {}

    bool ok() const { return !m_err.has_value(); }

    const grab_error_t& error() const { return *m_err; }

private:
    std::optional<grab_error_t> m_err;
};

inline Result<> Ok()
{
    return {};
}

template <typename... Args>
grab_error_t Err(ErrorKind kind, const std::string_view op, const std::string_view fmt, Args&&... args)
{
    return { kind, std::string(op), fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...) };
}

template <>
struct fmt::formatter<grab_error_t> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const grab_error_t& err, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(err.msg, ctx);
    }
};

std::string str_toupper(std::string str);
std::string str_tolower(std::string str);

/*
 * Get the user config directory
 * either from $XDG_CONFIG_HOME or from $HOME/.config/
 * @return user's config directory
 */
fs::path getHomeConfigDir();

/*
 * Get the grabshot config directory
 * where we'll have "config.toml"
 * from getHomeConfigDir()
 * @return grabshot's config directory
 */
fs::path getConfigDir();

/* Replace special symbols such as ~ and $ (at the begging) in std::string
 * @param str The string
 * @param dont Don't do it
 * @return The modified string
 */
std::string expandVar(std::string ret, bool dont = false);

/* Search an executable in $PATH
 * @param name The executable name
 * @return true if found and executable
 */
bool which(const std::string_view name);

// Don't print escape codes into files or pipes
inline fmt::text_style term_style(std::FILE* stream, const fmt::text_style style)
{
    return isatty(fileno(stream)) ? style : fmt::text_style{};
}

#define BOLD_COLOR(x) (fmt::emphasis::bold | fmt::fg(x))
template <typename... Args>
void error(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(stderr,
               term_style(stderr, BOLD_COLOR(fmt::rgb(fmt::color::red))),
               "Error: {}\n",
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void die(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(stderr,
               term_style(stderr, BOLD_COLOR(fmt::rgb(fmt::color::red))),
               "[{}] FATAL: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
    std::exit(1);
}

template <typename... Args>
void debug(const std::string_view fmt, Args&&... args) noexcept
{
    if (!g_verbose)
        return;

    fmt::print(term_style(stdout, BOLD_COLOR((fmt::rgb(fmt::color::hot_pink)))),
               "[{}] [DEBUG]: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void warn(const std::string_view fmt, Args&&... args) noexcept
{
    if (g_quiet)
        return;

    fmt::print(stderr,
               term_style(stderr, BOLD_COLOR((fmt::rgb(fmt::color::yellow)))),
               "[{}] WARNING: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void info(const std::string_view fmt, Args&&... args) noexcept
{
    if (g_quiet)
        return;

    fmt::print(term_style(stdout, BOLD_COLOR((fmt::rgb(fmt::color::cyan)))),
               "[{}] INFO: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

#endif  // !_UTIL_HPP_
