// Using grabshot as a library: grab the screen, keep the raster in memory,
// then save a region of it as JPEG.

#include <algorithm>
#include <cstdlib>

#include "capturer.hpp"
#include "image_codec.hpp"
#include "region.hpp"
#include "util.hpp"

int main()
{
    g_verbose = true;

    Result<Capturer> capturer = Capturer::Create();
    if (!capturer.ok())
    {
        error("{}", capturer.error());
        return EXIT_FAILURE;
    }

    info("Running on {}, active window capture {}",
         capturer.get().GetPlatform(),
         capturer.get().SupportsActiveWindow() ? "available" : "unavailable");

    const Result<capture_output_t>& raw = capturer.get().QuickCapture(std::nullopt);
    if (!raw.ok())
    {
        error("{}", raw.error());
        return EXIT_FAILURE;
    }

    const capture_result_t& image = std::get<capture_result_t>(raw.get());
    info("Captured {}x{} pixels", image.w, image.h);

    const Result<std::vector<uint8_t>>& png = encode_image(image, "PNG");
    if (png.ok())
        info("That would be {} bytes as PNG", png.get().size());

    const Result<Region>& region = Region::Create(0, 0, std::min(image.w, 400), std::min(image.h, 300));
    if (!region.ok())
    {
        error("{}", region.error());
        return EXIT_FAILURE;
    }

    const Result<capture_output_t>& saved =
        capturer.get().QuickCapture("grabshot_example.jpg", CaptureMode::Region, region.get(), std::nullopt, 85);
    if (!saved.ok())
    {
        error("{}", saved.error());
        return EXIT_FAILURE;
    }

    info("Saved to {}", std::get<fs::path>(saved.get()).string());
    return EXIT_SUCCESS;
}
