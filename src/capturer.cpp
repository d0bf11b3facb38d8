#include "capturer.hpp"

#include <array>
#include <utility>

#include "image_codec.hpp"
#include "util.hpp"

std::optional<CaptureMode> capture_mode_from_str(const std::string_view str)
{
    if (str == "fullscreen")
        return CaptureMode::Fullscreen;
    if (str == "active_window")
        return CaptureMode::ActiveWindow;
    if (str == "region")
        return CaptureMode::Region;
    return std::nullopt;
}

std::string_view capture_mode_to_str(CaptureMode mode)
{
    switch (mode)
    {
        case CaptureMode::Fullscreen:   return "fullscreen";
        case CaptureMode::ActiveWindow: return "active_window";
        case CaptureMode::Region:       return "region";
    }
    return "unknown";
}

const Capturer::platform_caps_t* Capturer::FindPlatform(const std::string_view platform)
{
    static constexpr std::array<platform_caps_t, 3> platforms = { {
        { "Linux", false },
        { "Windows", true },
        { "Darwin", true },
    } };

    for (const platform_caps_t& caps : platforms)
        if (caps.name == platform)
            return &caps;

    return nullptr;
}

Result<Capturer> Capturer::Create(const std::string& platform, GrabFunc grab)
{
    const platform_caps_t* caps = FindPlatform(platform);
    if (!caps)
        return Err(ErrorKind::PlatformNotSupported, "create", "Platform '{}' is not supported", platform);

    if (!grab)
    {
        const Result<>& res = probe_capture_backend();
        if (!res.ok())
            return res.error();
        grab = capture_screen;
    }

    debug("Capturer ready for platform {} (active window support: {})", platform, caps->active_window);
    return Capturer(platform, *caps, std::move(grab));
}

Result<capture_result_t> Capturer::Grab(const std::string_view       op,
                                        const std::string_view       what,
                                        const std::optional<bbox_t>& bbox) const
{
    Result<capture_result_t> res = m_grab(bbox);
    if (!res.ok())
    {
        // keep a bbox rejected by the primitive distinguishable from other failures
        if (res.error().kind == ErrorKind::InvalidRegion)
            return res.error();
        return Err(ErrorKind::CaptureFailed, op, "Failed to capture {}: {}", what, res.error());
    }

    if (res.get().empty())
        return Err(ErrorKind::CaptureFailed, op, "Screenshot capture returned nothing");

    return res;
}

Result<capture_result_t> Capturer::CaptureFullscreen() const
{
    debug("Capturing fullscreen");
    return Grab("capture_fullscreen", "fullscreen", std::nullopt);
}

Result<capture_result_t> Capturer::CaptureRegion(const Region& region) const
{
    debug("Capturing {}", region);
    return Grab("capture_region", "region", region.bbox());
}

Result<capture_result_t> Capturer::CaptureActiveWindow() const
{
    if (!m_caps.active_window)
        return Err(ErrorKind::PlatformNotSupported,
                   "capture_active_window",
                   "Active window capture is not supported on {}. Please use region capture instead.",
                   m_platform);

    // TODO: ask the window manager for the foreground window rectangle
    // (GetForegroundWindow + GetWindowRect, CGWindowListCopyWindowInfo) and grab only that
    debug("Capturing active window as fullscreen");
    return Grab("capture_active_window", "active window", std::nullopt);
}

Result<capture_output_t> Capturer::QuickCapture(const std::optional<fs::path>&    output,
                                                CaptureMode                       mode,
                                                const std::optional<Region>&      region,
                                                const std::optional<std::string>& format,
                                                int                               quality) const
{
    if (mode == CaptureMode::Region && !region)
        return Err(ErrorKind::InvalidRegion, "quick_capture", "Region must be provided for region mode");

    Result<capture_result_t> shot = [&]() -> Result<capture_result_t> {
        switch (mode)
        {
            case CaptureMode::Fullscreen:   return CaptureFullscreen();
            case CaptureMode::ActiveWindow: return CaptureActiveWindow();
            case CaptureMode::Region:       return CaptureRegion(*region);
        }
        return Err(ErrorKind::CaptureFailed, "quick_capture", "Unknown capture mode");
    }();

    if (!shot.ok())
        return shot.error();

    if (!output)
        return capture_output_t(std::move(shot).get());

    const Result<fs::path>& saved = save_image(shot.get(), *output, format, quality);
    if (!saved.ok())
        return saved.error();

    return capture_output_t(saved.get());
}
