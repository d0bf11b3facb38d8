#ifndef _IMAGE_CODEC_HPP_
#define _IMAGE_CODEC_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "screen_capture.hpp"
#include "util.hpp"

inline constexpr int DEFAULT_QUALITY = 95;

inline constexpr std::array<std::string_view, 7> SUPPORTED_FORMATS = {
    "PNG", "JPEG", "JPG", "BMP", "GIF", "TIFF", "WEBP",
};

bool is_supported_format(const std::string_view format);

/*
 * Pick the format to encode with.
 * An explicit format wins, else the path extension, else PNG.
 * The result is always upper-case and JPG/TIF are folded into JPEG/TIFF.
 */
std::string resolve_format(const fs::path& path, const std::optional<std::string>& format);

/**
 * Encode a raster into memory.
 * @param quality Only used by JPEG, other formats ignore it
 */
Result<std::vector<uint8_t>> encode_image(const capture_result_t& image,
                                          const std::string_view  format  = "PNG",
                                          int                     quality = DEFAULT_QUALITY);

/**
 * Encode a raster and write it to disk, creating the missing parent directories.
 * @return the absolute path of the written file
 */
Result<fs::path> save_image(const capture_result_t&           image,
                            const fs::path&                   path,
                            const std::optional<std::string>& format  = std::nullopt,
                            int                               quality = DEFAULT_QUALITY);

// Decode PNG/JPEG/BMP/... bytes back into an RGBA raster
Result<capture_result_t> decode_image(std::span<const uint8_t> bytes);

#endif  // !_IMAGE_CODEC_HPP_
