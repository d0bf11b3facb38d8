#include "image_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "util.hpp"

static std::string normalize_format(const std::string_view format)
{
    std::string ret = str_toupper(std::string(format));
    if (ret == "JPG")
        return "JPEG";
    if (ret == "TIF")
        return "TIFF";
    return ret;
}

// file extension OpenCV uses to pick the encoder
static std::string_view opencv_ext(const std::string_view format)
{
    if (format == "PNG")
        return ".png";
    if (format == "JPEG")
        return ".jpg";
    if (format == "BMP")
        return ".bmp";
    if (format == "GIF")
        return ".gif";
    if (format == "TIFF")
        return ".tiff";
    if (format == "WEBP")
        return ".webp";
    return {};
}

bool is_supported_format(const std::string_view format)
{
    const std::string& upper = str_toupper(std::string(format));
    return std::find(SUPPORTED_FORMATS.begin(), SUPPORTED_FORMATS.end(), upper) != SUPPORTED_FORMATS.end();
}

std::string resolve_format(const fs::path& path, const std::optional<std::string>& format)
{
    if (format && !format->empty())
        return normalize_format(*format);

    const std::string& ext = path.extension().string();
    if (ext.size() <= 1)
        return "PNG";

    return normalize_format(ext.substr(1));
}

Result<std::vector<uint8_t>> encode_image(const capture_result_t& image, const std::string_view format, int quality)
{
    const std::string&     name = normalize_format(format);
    const std::string_view ext  = opencv_ext(name);
    if (ext.empty())
        return Err(ErrorKind::SaveFailed, "encode", "Unsupported image format '{}'", format);

    const size_t expected = static_cast<size_t>(image.w) * image.h * 4;
    if (image.empty() || image.data.size() < expected)
        return Err(ErrorKind::SaveFailed,
                   "encode",
                   "Invalid image buffer ({}x{}, {} bytes)",
                   image.w,
                   image.h,
                   image.data.size());

    std::vector<int> params;
    if (name == "JPEG")
        params = { cv::IMWRITE_JPEG_QUALITY, quality, cv::IMWRITE_JPEG_OPTIMIZE, 1 };

    try
    {
        const cv::Mat rgba(image.h, image.w, CV_8UC4, const_cast<uint8_t*>(image.data.data()));
        cv::Mat       bgr;
        cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);

        std::vector<uint8_t> out;
        if (!cv::imencode(std::string(ext), bgr, out, params))
            return Err(ErrorKind::SaveFailed, "encode", "The {} encoder refused the image", name);

        return out;
    }
    catch (const cv::Exception& e)
    {
        return Err(ErrorKind::SaveFailed, "encode", "Failed to encode as {}: {}", name, e.what());
    }
}

Result<fs::path> save_image(const capture_result_t&           image,
                            const fs::path&                   path,
                            const std::optional<std::string>& format,
                            int                               quality)
{
    const std::string& name = resolve_format(path, format);
    debug("Saving {}x{} image to '{}' as {} (quality {})", image.w, image.h, path.string(), name, quality);

    std::error_code ec;
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            return Err(ErrorKind::SaveFailed,
                       "save",
                       "Failed to save screenshot to {}: {}",
                       path.string(),
                       ec.message());
    }

    const Result<std::vector<uint8_t>>& bytes = encode_image(image, name, quality);
    if (!bytes.ok())
        return Err(ErrorKind::SaveFailed, "save", "Failed to save screenshot to {}: {}", path.string(), bytes.error());

    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out)
        return Err(ErrorKind::SaveFailed,
                   "save",
                   "Failed to save screenshot to {}: {}",
                   path.string(),
                   std::strerror(errno));

    out.write(reinterpret_cast<const char*>(bytes.get().data()), static_cast<std::streamsize>(bytes.get().size()));
    out.close();
    if (!out)
        return Err(ErrorKind::SaveFailed, "save", "Failed to save screenshot to {}: write error", path.string());

    fs::path ret = fs::absolute(path, ec);
    if (ec)
        return path;

    const fs::path& canonical = fs::weakly_canonical(ret, ec);
    if (!ec)
        ret = canonical;

    return ret;
}

Result<capture_result_t> decode_image(std::span<const uint8_t> bytes)
{
    if (bytes.empty())
        return Err(ErrorKind::SaveFailed, "decode", "No image data to decode");

    try
    {
        const cv::Mat buf(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
        const cv::Mat decoded = cv::imdecode(buf, cv::IMREAD_COLOR);
        if (decoded.empty())
            return Err(ErrorKind::SaveFailed, "decode", "Unrecognized or corrupted image data");

        cv::Mat rgba;
        cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);

        capture_result_t result;
        result.w = rgba.cols;
        result.h = rgba.rows;
        result.data.assign(rgba.data, rgba.data + rgba.total() * rgba.elemSize());
        return result;
    }
    catch (const cv::Exception& e)
    {
        return Err(ErrorKind::SaveFailed, "decode", "Failed to decode image: {}", e.what());
    }
}
