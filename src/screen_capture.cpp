#include "screen_capture.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#if defined(_WIN32)
#  include <windows.h>
#elif defined(__APPLE__)
#  include <CoreGraphics/CoreGraphics.h>
#  include <sys/utsname.h>
#else
#  include <sys/utsname.h>
#endif

#if defined(__linux__)
#  include <X11/Xlib.h>
// Xutil.h has its own "Region" typedef
#  define Region XRegion
#  include <X11/Xutil.h>
#  undef Region
#endif

#include "util.hpp"

std::vector<uint8_t> ppm_to_rgba(const uint8_t* ppm, int width, int height)
{
    std::vector<uint8_t> rgba_data(static_cast<size_t>(width) * height * 4);

    for (size_t i = 0; i < static_cast<size_t>(width) * height; ++i)
    {
        rgba_data[i * 4 + 0] = ppm[i * 3 + 0];  // R
        rgba_data[i * 4 + 1] = ppm[i * 3 + 1];  // G
        rgba_data[i * 4 + 2] = ppm[i * 3 + 2];  // B
        rgba_data[i * 4 + 3] = 0xff;            // A
    }

    return rgba_data;
}

std::vector<uint8_t> bgra_to_rgba(const uint8_t* bgra, int width, int height, size_t stride)
{
    std::vector<uint8_t> rgba_data(static_cast<size_t>(width) * height * 4);

    for (int y = 0; y < height; ++y)
    {
        const uint8_t* row = bgra + y * stride;
        for (int x = 0; x < width; ++x)
        {
            const size_t i   = (static_cast<size_t>(y) * width + x) * 4;
            rgba_data[i + 0] = row[x * 4 + 2];  // R
            rgba_data[i + 1] = row[x * 4 + 1];  // G
            rgba_data[i + 2] = row[x * 4 + 0];  // B
            rgba_data[i + 3] = 0xff;            // A
        }
    }

    return rgba_data;
}

std::string get_platform_name()
{
#ifdef _WIN32
    return "Windows";
#else
    struct utsname name;
    if (uname(&name) != 0)
        return "Unknown";
    return name.sysname;
#endif
}

SessionType get_session_type()
{
    const char* xdg     = std::getenv("XDG_SESSION_TYPE");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    const char* x11     = std::getenv("DISPLAY");

    if (xdg && strncmp(xdg, "wayland", 8) == 0)
        return SessionType::Wayland;
    if (wayland && wayland[0] != '\0')
        return SessionType::Wayland;

    if (x11 && x11[0] != '\0')
        return SessionType::X11;
    if (xdg && strncmp(xdg, "x11", 4) == 0)
        return SessionType::X11;

    return SessionType::Unknown;
}

#if defined(__linux__)
static int g_x11_error_code = 0;

static int x11_error_handler(Display*, XErrorEvent* ev)
{
    g_x11_error_code = ev->error_code;
    return 0;
}

static std::vector<uint8_t> ximage_to_rgba(XImage* image, int width, int height)
{
    std::vector<uint8_t> rgba_data(static_cast<size_t>(width) * height * 4);

    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            uint64_t pixel = XGetPixel(image, x, y);

            size_t i         = (static_cast<size_t>(y) * width + x) * 4;
            rgba_data[i + 0] = (pixel >> 16) & 0xff;  // R
            rgba_data[i + 1] = (pixel >> 8) & 0xff;   // G
            rgba_data[i + 2] = (pixel) & 0xff;        // B
            rgba_data[i + 3] = 0xff;                  // A
        }
    }

    return rgba_data;
}

static Result<capture_result_t> capture_screen_x11(const std::optional<bbox_t>& bbox)
{
    Display* display = XOpenDisplay(nullptr);
    if (!display)
        return Err(ErrorKind::CaptureFailed, "capture_x11", "Failed to open X display");

    Window            root = DefaultRootWindow(display);
    XWindowAttributes attrs;
    XGetWindowAttributes(display, root, &attrs);

    int x = 0, y = 0, width = attrs.width, height = attrs.height;
    if (bbox)
    {
        if (bbox->x2 > attrs.width || bbox->y2 > attrs.height)
        {
            XCloseDisplay(display);
            return Err(ErrorKind::InvalidRegion,
                       "capture_x11",
                       "Region ({}, {}, {}, {}) exceeds the screen bounds {}x{}",
                       bbox->x1,
                       bbox->y1,
                       bbox->x2,
                       bbox->y2,
                       attrs.width,
                       attrs.height);
        }
        x      = bbox->x1;
        y      = bbox->y1;
        width  = bbox->width();
        height = bbox->height();
    }

    // the default handler would exit the whole process on BadMatch
    g_x11_error_code = 0;
    auto old_handler = XSetErrorHandler(x11_error_handler);

    XImage* image = XGetImage(display, root, x, y, width, height, AllPlanes, ZPixmap);
    XSync(display, False);
    XSetErrorHandler(old_handler);

    if (!image)
    {
        XCloseDisplay(display);
        return Err(ErrorKind::CaptureFailed,
                   "capture_x11",
                   "Failed to capture screen image (X error code {})",
                   g_x11_error_code);
    }

    capture_result_t result;
    result.data = ximage_to_rgba(image, width, height);
    result.w    = width;
    result.h    = height;

    XDestroyImage(image);
    XCloseDisplay(display);

    return result;
}

static Result<capture_result_t> capture_screen_wayland(const std::optional<bbox_t>& bbox)
{
    std::string cmd = "grim -t ppm ";
    if (bbox)
        cmd += fmt::format("-g \"{},{} {}x{}\" ", bbox->x1, bbox->y1, bbox->width(), bbox->height());
    cmd += "-";

    debug("Running '{}'", cmd);
    std::FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
        return Err(ErrorKind::CaptureFailed, "capture_wayland", "Failed to execute grim");

    char magic[3];
    int  width{}, height{}, maxval{};
    if (fscanf(pipe, "%2s %d %d %d", magic, &width, &height, &maxval) != 4 || magic[0] != 'P' || magic[1] != '6' ||
        maxval != 255 || width <= 0 || height <= 0)
    {
        pclose(pipe);
        return Err(ErrorKind::CaptureFailed, "capture_wayland", "Invalid PPM format from grim");
    }
    fgetc(pipe);  // skip newline

    std::vector<uint8_t> ppm_data(static_cast<size_t>(width) * height * 3);
    if (fread(ppm_data.data(), 1, ppm_data.size(), pipe) != ppm_data.size())
    {
        pclose(pipe);
        return Err(ErrorKind::CaptureFailed, "capture_wayland", "Failed to read PPM data");
    }

    const int status = pclose(pipe);
    if (status != 0)
        return Err(ErrorKind::CaptureFailed, "capture_wayland", "grim exited with status {}", status);

    capture_result_t result;
    result.data = ppm_to_rgba(ppm_data.data(), width, height);
    result.w    = width;
    result.h    = height;

    return result;
}
#endif  // __linux__

#if defined(_WIN32)
static Result<capture_result_t> capture_screen_gdi(const std::optional<bbox_t>& bbox)
{
    int x = 0, y = 0;
    int w = GetSystemMetrics(SM_CXSCREEN);
    int h = GetSystemMetrics(SM_CYSCREEN);
    if (bbox)
    {
        x = bbox->x1;
        y = bbox->y1;
        w = bbox->width();
        h = bbox->height();
    }

    HDC scr = GetDC(nullptr);
    if (!scr)
        return Err(ErrorKind::CaptureFailed, "capture_gdi", "GetDC failed");

    HDC     mem = CreateCompatibleDC(scr);
    HBITMAP bmp = CreateCompatibleBitmap(scr, w, h);
    HGDIOBJ old = SelectObject(mem, bmp);

    const bool blitted = BitBlt(mem, 0, 0, w, h, scr, x, y, SRCCOPY | CAPTUREBLT);

    BITMAPINFO bmi{};
    bmi.bmiHeader.biSize        = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth       = w;
    bmi.bmiHeader.biHeight      = -h;  // top-down
    bmi.bmiHeader.biPlanes      = 1;
    bmi.bmiHeader.biBitCount    = 32;
    bmi.bmiHeader.biCompression = BI_RGB;

    std::vector<uint8_t> bgra(static_cast<size_t>(w) * h * 4);
    const int lines = blitted ? GetDIBits(mem, bmp, 0, h, bgra.data(), &bmi, DIB_RGB_COLORS) : 0;

    SelectObject(mem, old);
    DeleteObject(bmp);
    DeleteDC(mem);
    ReleaseDC(nullptr, scr);

    if (lines != h)
        return Err(ErrorKind::CaptureFailed, "capture_gdi", "BitBlt/GetDIBits failed (error {})", GetLastError());

    capture_result_t result;
    result.data = bgra_to_rgba(bgra.data(), w, h, static_cast<size_t>(w) * 4);
    result.w    = w;
    result.h    = h;
    return result;
}
#endif  // _WIN32

#if defined(__APPLE__)
static Result<capture_result_t> capture_screen_cg(const std::optional<bbox_t>& bbox)
{
    CGDirectDisplayID displayID = CGMainDisplayID();

    CGImageRef screenshot = bbox ? CGDisplayCreateImageForRect(
                                       displayID, CGRectMake(bbox->x1, bbox->y1, bbox->width(), bbox->height()))
                                 : CGDisplayCreateImage(displayID);
    if (!screenshot)
        return Err(ErrorKind::CaptureFailed, "capture_cg", "Failed to create screenshot");

    const size_t width  = CGImageGetWidth(screenshot);
    const size_t height = CGImageGetHeight(screenshot);

    capture_result_t result;
    result.data.resize(width * height * 4);
    result.w = static_cast<int>(width);
    result.h = static_cast<int>(height);

    CGColorSpaceRef colorSpace = CGColorSpaceCreateDeviceRGB();
    CGContextRef    context    = CGBitmapContextCreate(result.data.data(),
                                                 width,
                                                 height,
                                                 8,
                                                 width * 4,
                                                 colorSpace,
                                                 kCGImageAlphaPremultipliedLast | kCGBitmapByteOrder32Big);
    if (!context)
    {
        CGImageRelease(screenshot);
        CGColorSpaceRelease(colorSpace);
        return Err(ErrorKind::CaptureFailed, "capture_cg", "Failed to create bitmap context");
    }

    CGContextDrawImage(context, CGRectMake(0, 0, width, height), screenshot);

    CGContextRelease(context);
    CGImageRelease(screenshot);
    CGColorSpaceRelease(colorSpace);

    return result;
}
#endif  // __APPLE__

Result<capture_result_t> capture_screen(const std::optional<bbox_t>& bbox)
{
#if defined(__linux__)
    switch (get_session_type())
    {
        case SessionType::X11:     return capture_screen_x11(bbox);
        case SessionType::Wayland: return capture_screen_wayland(bbox);
        default:                   return Err(ErrorKind::CaptureFailed, "capture", "No X11 or Wayland session found");
    }
#elif defined(_WIN32)
    return capture_screen_gdi(bbox);
#elif defined(__APPLE__)
    return capture_screen_cg(bbox);
#else
    (void)bbox;
    return Err(ErrorKind::PlatformNotSupported, "capture", "No capture backend for '{}'", get_platform_name());
#endif
}

Result<> probe_capture_backend()
{
#if defined(__linux__)
    switch (get_session_type())
    {
        case SessionType::X11:
        {
            Display* display = XOpenDisplay(nullptr);
            if (!display)
                return Err(ErrorKind::DependencyMissing, "probe", "Cannot open the X11 display '{}'",
                           std::getenv("DISPLAY") ? std::getenv("DISPLAY") : "");
            XCloseDisplay(display);
            return Ok();
        }

        case SessionType::Wayland:
            if (!which("grim"))
                return Err(ErrorKind::DependencyMissing,
                           "probe",
                           "Capturing on Wayland requires 'grim', please install it and make sure it's in $PATH");
            return Ok();

        default:
            return Err(ErrorKind::DependencyMissing,
                       "probe",
                       "No X11 or Wayland session found ($DISPLAY and $WAYLAND_DISPLAY are unset)");
    }
#elif defined(_WIN32) || defined(__APPLE__)
    return Ok();
#else
    return Err(ErrorKind::DependencyMissing, "probe", "No capture backend for '{}'", get_platform_name());
#endif
}
