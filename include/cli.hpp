#ifndef _CLI_HPP_
#define _CLI_HPP_

#include <optional>
#include <string>
#include <string_view>

#include "capturer.hpp"
#include "region.hpp"
#include "screen_capture.hpp"
#include "util.hpp"

struct cli_options_t
{
    CaptureMode                mode = CaptureMode::Fullscreen;
    std::optional<std::string> region;
    std::optional<fs::path>    output;
    std::optional<std::string> format;
    std::optional<int>         quality;
    std::optional<fs::path>    config_file;

    bool                       show_config  = false;
    bool                       reset_config = false;
    std::optional<std::string> set_default_format;
    std::optional<std::string> set_default_dir;
    std::optional<int>         set_default_quality;

    bool verbose = false;
    bool quiet   = false;
};

/*
 * Parse a region in the format "x,y,width,height"
 * Anything else than exactly 4 integers is an InvalidArgument error,
 * bad geometry is an InvalidRegion error.
 */
Result<Region> parse_region(const std::string_view str);

// "screenshot_<YYYYMMDD_HHMMSS>.<format in lower case>"
std::string generate_filename(const std::string_view format);

/**
 * The whole command line tool.
 * @param grab The grab primitive to hand to the Capturer, empty for the native one
 * @return the process exit code
 */
int run_cli(int argc, char* argv[], const GrabFunc& grab = {});

inline constexpr std::string_view grabshot_help = (R"(Usage: grabshot [OPTIONS]...
Capture the screen, or a part of it, into an image file.

CAPTURE OPTIONS:
    -m, --mode <MODE>           Capture mode: fullscreen, region, active_window (default: fullscreen).
    -r, --region <X,Y,W,H>      Region to capture, required by "--mode region".
    -o, --output <PATH>         Output file path (default: screenshot_<date>_<time>.<ext> in the configured directory).
    -f, --format <FORMAT>       Output format: png, jpeg, jpg, bmp, gif, tiff, webp (default: from the config, png).
    -q, --quality <N>           JPEG quality from 1 to 100 (default: from the config, 95).

CONFIG OPTIONS:
    -C, --config <PATH>         Path to the config file to use (default: ~/.config/grabshot/config.toml).
    --show-config               Print the current configuration and exit.
    --set-default-format <FMT>  Save the default output format and exit.
    --set-default-dir <PATH>    Save the default output directory and exit.
    --set-default-quality <N>   Save the default JPEG quality and exit.
    --reset-config              Restore the default configuration and exit.

GENERAL OPTIONS:
    -v, --verbose               Print what's going on.
    --quiet                     Only print errors.
    -h, --help                  Print this help menu.
    -V, --version               Print version and exit.

EXAMPLES:
    grabshot -o ~/Pictures/shot.png
    grabshot -m region -r 100,100,800,600
    grabshot -f jpeg -q 85
)");

#endif  // !_CLI_HPP_
