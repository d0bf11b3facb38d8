#ifndef _CAPTURER_HPP_
#define _CAPTURER_HPP_

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "image_codec.hpp"
#include "region.hpp"
#include "screen_capture.hpp"
#include "util.hpp"

enum class CaptureMode
{
    Fullscreen,
    ActiveWindow,
    Region
};

std::optional<CaptureMode> capture_mode_from_str(const std::string_view str);
std::string_view           capture_mode_to_str(CaptureMode mode);

// What QuickCapture() gives back: the saved file, or the raster when no output was asked
using capture_output_t = std::variant<fs::path, capture_result_t>;

class Capturer
{
public:
    /**
     * Resolve the platform and its capabilities.
     * @param platform The platform identifier (see get_platform_name())
     * @param grab The grab primitive to use.
     *             If empty, the native one is used and its availability is probed once here.
     * @return PlatformNotSupported for anything else than Linux, Windows and Darwin,
     *         DependencyMissing if the native backend can't be used
     */
    static Result<Capturer> Create(const std::string& platform = get_platform_name(), GrabFunc grab = {});

    Result<capture_result_t> CaptureFullscreen() const;
    Result<capture_result_t> CaptureRegion(const Region& region) const;

    // Linux has no reliable way to find the active window, so it always fails there
    Result<capture_result_t> CaptureActiveWindow() const;

    /**
     * The one entry point for callers.
     * Captures with the given mode then, if output is given, saves the image there.
     * @param output Where to save, nothing for getting the raster back
     * @param mode The capture mode
     * @param region Needed only (and required) by CaptureMode::Region
     * @param format Image format, nothing for guessing it from the output extension
     * @param quality JPEG quality
     */
    Result<capture_output_t> QuickCapture(const std::optional<fs::path>&    output,
                                          CaptureMode                       mode    = CaptureMode::Fullscreen,
                                          const std::optional<Region>&      region  = std::nullopt,
                                          const std::optional<std::string>& format  = std::nullopt,
                                          int                               quality = DEFAULT_QUALITY) const;

    const std::string& GetPlatform() const { return m_platform; }
    bool               SupportsActiveWindow() const { return m_caps.active_window; }

    std::span<const std::string_view> GetSupportedFormats() const { return SUPPORTED_FORMATS; }

private:
    struct platform_caps_t
    {
        std::string_view name;
        bool             active_window;
    };

    static const platform_caps_t* FindPlatform(const std::string_view platform);

    Capturer(std::string platform, platform_caps_t caps, GrabFunc grab)
        : m_platform(std::move(platform)), m_caps(caps), m_grab(std::move(grab))
    {
    }

    Result<capture_result_t> Grab(const std::string_view       op,
                                  const std::string_view       what,
                                  const std::optional<bbox_t>& bbox) const;

    std::string     m_platform;
    platform_caps_t m_caps;
    GrabFunc        m_grab;
};

#endif  // !_CAPTURER_HPP_
