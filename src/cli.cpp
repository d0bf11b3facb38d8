#include "cli.hpp"

#include <getopt.h>

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <string>
#include <typeinfo>
#include <vector>

#include "capturer.hpp"
#include "config.hpp"
#include "fmt/chrono.h"
#include "fmt/compile.h"
#include "image_codec.hpp"
#include "util.hpp"

#ifndef VERSION
#  define VERSION "unknown"
#endif

enum long_only_opts
{
    OPT_QUIET = 256,
    OPT_SHOW_CONFIG,
    OPT_SET_DEFAULT_FORMAT,
    OPT_SET_DEFAULT_DIR,
    OPT_SET_DEFAULT_QUALITY,
    OPT_RESET_CONFIG,
};

static constexpr std::string_view cli_formats[] = { "png", "jpeg", "jpg", "bmp", "gif", "tiff", "webp" };

static std::string_view trim(std::string_view str)
{
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t'))
        str.remove_prefix(1);
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t'))
        str.remove_suffix(1);
    return str;
}

static std::optional<int> parse_int(std::string_view str)
{
    str = trim(str);
    if (!str.empty() && str.front() == '+')
    {
        str.remove_prefix(1);
        if (!str.empty() && (str.front() == '-' || str.front() == '+'))
            return std::nullopt;
    }

    int ret{};
    const auto& [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
    if (ec != std::errc() || ptr != str.data() + str.size() || str.empty())
        return std::nullopt;

    return ret;
}

static bool is_cli_format(const std::string_view format)
{
    const std::string& lower = str_tolower(std::string(format));
    for (const std::string_view f : cli_formats)
        if (f == lower)
            return true;
    return false;
}

Result<Region> parse_region(const std::string_view str)
{
    std::vector<std::string_view> parts;
    size_t                        start = 0;
    while (true)
    {
        const size_t pos = str.find(',', start);
        parts.push_back(str.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }

    if (parts.size() != 4)
        return Err(ErrorKind::InvalidArgument,
                   "parse_region",
                   "Invalid region format '{}': Region must have 4 values: x,y,width,height",
                   str);

    int values[4];
    for (size_t i = 0; i < 4; ++i)
    {
        const std::optional<int> value = parse_int(parts[i]);
        if (!value)
            return Err(ErrorKind::InvalidArgument,
                       "parse_region",
                       "Invalid region format '{}': '{}' is not an integer",
                       str,
                       trim(parts[i]));
        values[i] = *value;
    }

    return Region::Create(values[0], values[1], values[2], values[3]);
}

std::string generate_filename(const std::string_view format)
{
    const std::time_t now = std::time(nullptr);
    return fmt::format("screenshot_{:%Y%m%d_%H%M%S}.{}", fmt::localtime(now), str_tolower(std::string(format)));
}

// Print the version and some other infos
static void version()
{
    fmt::print("grabshot {} ({})\n", VERSION, get_platform_name());
}

// Print the args help menu
static void help()
{
    fmt::print(FMT_COMPILE("{}\n"), grabshot_help);
}

// clang-format off
// @return an exit code if we should stop here (--help, --version or invalid args)
static std::optional<int> parseargs(int argc, char* argv[], cli_options_t& opts)
{
    int opt = 0;
    int option_index = 0;
    opterr = 1;
    const char *optstring = "m:r:o:f:q:C:vVh";
    static const struct option long_opts[] = {
        {"mode",                required_argument, 0, 'm'},
        {"region",              required_argument, 0, 'r'},
        {"output",              required_argument, 0, 'o'},
        {"format",              required_argument, 0, 'f'},
        {"quality",             required_argument, 0, 'q'},
        {"config",              required_argument, 0, 'C'},
        {"verbose",             no_argument,       0, 'v'},
        {"version",             no_argument,       0, 'V'},
        {"help",                no_argument,       0, 'h'},

        {"quiet",               no_argument,       0, OPT_QUIET},
        {"show-config",         no_argument,       0, OPT_SHOW_CONFIG},
        {"set-default-format",  required_argument, 0, OPT_SET_DEFAULT_FORMAT},
        {"set-default-dir",     required_argument, 0, OPT_SET_DEFAULT_DIR},
        {"set-default-quality", required_argument, 0, OPT_SET_DEFAULT_QUALITY},
        {"reset-config",        no_argument,       0, OPT_RESET_CONFIG},

        {0,0,0,0}
    };

    // 0 makes glibc re-initialize getopt, run_cli() can be called more than once
    optind = 0;
    while ((opt = getopt_long(argc, argv, optstring, long_opts, &option_index)) != -1)
    {
        switch (opt)
        {
            case 0:
                break;
            case '?':
                fmt::print(stderr, "Try 'grabshot --help' for more information.\n");
                return EXIT_FAILURE;

            case 'V':
                version(); return EXIT_SUCCESS;
            case 'h':
                help(); return EXIT_SUCCESS;
            case 'v':
                opts.verbose = true; break;
            case OPT_QUIET:
                opts.quiet = true; break;

            case 'm':
            {
                const std::optional<CaptureMode>& mode = capture_mode_from_str(optarg);
                if (!mode)
                {
                    error(_("Invalid mode '{}' (choose from fullscreen, region, active_window)"), optarg);
                    return EXIT_FAILURE;
                }
                opts.mode = *mode;
            } break;

            case 'r':
                opts.region = optarg; break;
            case 'o':
                opts.output = optarg; break;
            case 'C':
                opts.config_file = optarg; break;

            case 'f':
                if (!is_cli_format(optarg))
                {
                    error(_("Invalid format '{}' (choose from png, jpeg, jpg, bmp, gif, tiff, webp)"), optarg);
                    return EXIT_FAILURE;
                }
                opts.format = str_toupper(optarg); break;

            case 'q':
                opts.quality = parse_int(optarg);
                if (!opts.quality)
                {
                    error(_("Invalid quality '{}', it must be an integer"), optarg);
                    return EXIT_FAILURE;
                }
                break;

            case OPT_SHOW_CONFIG:
                opts.show_config = true; break;
            case OPT_RESET_CONFIG:
                opts.reset_config = true; break;
            case OPT_SET_DEFAULT_DIR:
                opts.set_default_dir = optarg; break;

            case OPT_SET_DEFAULT_FORMAT:
                if (!is_supported_format(optarg))
                {
                    error(_("Invalid format '{}' (choose from png, jpeg, jpg, bmp, gif, tiff, webp)"), optarg);
                    return EXIT_FAILURE;
                }
                opts.set_default_format = optarg; break;

            case OPT_SET_DEFAULT_QUALITY:
                opts.set_default_quality = parse_int(optarg);
                if (!opts.set_default_quality)
                {
                    error(_("Invalid quality '{}', it must be an integer"), optarg);
                    return EXIT_FAILURE;
                }
                break;

            default:
                return EXIT_FAILURE;
        }
    }

    if (optind < argc)
    {
        error(_("Unexpected argument '{}'"), argv[optind]);
        return EXIT_FAILURE;
    }

    return std::nullopt;
}
// clang-format on

// @return true if something was asked to be changed
static bool wants_config_update(const cli_options_t& opts)
{
    return opts.reset_config || opts.set_default_format || opts.set_default_dir || opts.set_default_quality;
}

static int handle_config_update(Config& config, const cli_options_t& opts)
{
    if (opts.reset_config)
    {
        const Result<>& res = config.Reset();
        if (!res.ok())
        {
            error("{}", res.error());
            return EXIT_FAILURE;
        }
        if (!g_quiet)
            fmt::print("Configuration reset to defaults\n");
        return EXIT_SUCCESS;
    }

    if (opts.set_default_format)
    {
        config.SetDefaultFormat(*opts.set_default_format);
        if (!g_quiet)
            fmt::print("Default format set to: {}\n", config.GetDefaultFormat());
    }

    if (opts.set_default_dir)
    {
        config.SetDefaultOutputDir(*opts.set_default_dir);
        if (!g_quiet)
            fmt::print("Default directory set to: {}\n", config.GetDefaultOutputDir().string());
    }

    if (opts.set_default_quality)
    {
        const Result<>& res = config.SetDefaultQuality(*opts.set_default_quality);
        if (!res.ok())
        {
            error("{}", res.error());
            return EXIT_FAILURE;
        }
        if (!g_quiet)
            fmt::print("Default quality set to: {}\n", config.GetDefaultQuality());
    }

    const Result<>& res = config.SaveConfigFile();
    if (!res.ok())
    {
        error("{}", res.error());
        return EXIT_FAILURE;
    }

    if (!g_quiet)
        fmt::print("Configuration saved successfully\n");
    return EXIT_SUCCESS;
}

int run_cli(int argc, char* argv[], const GrabFunc& grab)
{
    cli_options_t opts;
    if (const std::optional<int>& exit_code = parseargs(argc, argv, opts))
        return *exit_code;

    g_verbose = opts.verbose;
    g_quiet   = opts.quiet && !opts.verbose;

    std::string_view stage = "loading the configuration";
    try
    {
        const fs::path& configFile = opts.config_file.value_or(getConfigDir() / "config.toml");
        Config          config(configFile);
        config.LoadConfigFile();

        if (opts.show_config)
        {
            config.Print();
            return EXIT_SUCCESS;
        }

        if (wants_config_update(opts))
            return handle_config_update(config, opts);

        // Everything is validated before touching the screen
        stage = "validating the arguments";
        const int quality = opts.quality.value_or(config.GetDefaultQuality());
        if (quality < 1 || quality > 100)
        {
            error(_("Quality must be between 1 and 100 (got {})"), quality);
            return EXIT_FAILURE;
        }

        const std::string& format = opts.format.value_or(config.GetDefaultFormat());
        if (!is_supported_format(format))
        {
            error(_("Unsupported default format '{}' in {}"), format, configFile.string());
            return EXIT_FAILURE;
        }

        std::optional<Region> region;
        if (opts.mode == CaptureMode::Region)
        {
            if (!opts.region)
            {
                error(_("--region is required for region mode"));
                return EXIT_FAILURE;
            }

            Result<Region> parsed = parse_region(*opts.region);
            if (!parsed.ok())
            {
                error("{}", parsed.error());
                return EXIT_FAILURE;
            }
            region = parsed.get();
            debug("Region: {}", *region);
        }
        else if (opts.region)
        {
            warn(_("--region is only used by region mode, ignoring it"));
        }

        // with -o and no -f, let the file extension decide
        fs::path                   output;
        std::optional<std::string> save_format = format;
        if (opts.output)
        {
            output = *opts.output;
            if (!opts.format && output.has_extension())
                save_format = std::nullopt;
        }
        else
        {
            output = config.GetDefaultOutputDir() / generate_filename(format);
        }

        stage = "initializing the capturer";
        debug("Initializing screenshot capturer...");
        Result<Capturer> capturer = Capturer::Create(get_platform_name(), grab);
        if (!capturer.ok())
        {
            error("{}", capturer.error());
            return EXIT_FAILURE;
        }

        debug("Platform: {}", capturer.get().GetPlatform());
        debug("Capture mode: {}", capture_mode_to_str(opts.mode));

        stage = "capturing";
        const Result<capture_output_t>& result =
            capturer.get().QuickCapture(output, opts.mode, region, save_format, quality);
        if (!result.ok())
        {
            debug("{} error from {}", error_kind_name(result.error().kind), result.error().op);
            error("{}", result.error());
            return EXIT_FAILURE;
        }

        if (!g_quiet)
            fmt::print("Screenshot saved to: {}\n", std::get<fs::path>(result.get()).string());

        return EXIT_SUCCESS;
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "Unexpected error: {}\n", e.what());
        debug("{} thrown while {}", typeid(e).name(), stage);
        return EXIT_FAILURE;
    }
}
