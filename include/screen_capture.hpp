#ifndef _SCREEN_CAPTURE_HPP_
#define _SCREEN_CAPTURE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "region.hpp"
#include "util.hpp"

enum class PixelFormat
{
    RGBA8
};

// In-memory raster: row-major, tightly packed, 4 bytes per pixel
struct capture_result_t
{
    std::vector<uint8_t> data;
    int                  w{};
    int                  h{};
    PixelFormat          format = PixelFormat::RGBA8;

    std::span<const uint8_t> view() const { return data; }
    bool                     empty() const { return data.empty() || w <= 0 || h <= 0; }
};

enum class SessionType
{
    Wayland,
    X11,
    Unknown
};

// The platform grab primitive: no bbox means the whole primary display
using GrabFunc = std::function<Result<capture_result_t>(const std::optional<bbox_t>&)>;

std::vector<uint8_t> ppm_to_rgba(const uint8_t* ppm, int width, int height);
std::vector<uint8_t> bgra_to_rgba(const uint8_t* bgra, int width, int height, size_t stride);

/*
 * Resolved platform identifier,
 * "Linux", "Windows", "Darwin" or the system name from uname(2)
 */
std::string get_platform_name();
SessionType get_session_type();

Result<capture_result_t> capture_screen(const std::optional<bbox_t>& bbox);

/*
 * Check once that the native capture backend can be used,
 * e.g. that the X display can be opened or `grim` is installed
 */
Result<> probe_capture_backend();

#endif  // !_SCREEN_CAPTURE_HPP_
