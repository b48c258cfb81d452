#include "io/image_decode.h"

#include <climits>
#include <cstring>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace drift::image_decode
{
namespace
{
// Takes ownership of `data` (stbi allocated) and copies it into `out`.
static bool AdoptStbPixels(unsigned char* data, int w, int h, Bitmap& out, std::string& err)
{
    if (!data)
    {
        err = std::string("Failed to decode image: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    out.width = w;
    out.height = h;

    const size_t pixel_bytes = static_cast<size_t>(w) * static_cast<size_t>(h) * 4u;
    out.rgba.resize(pixel_bytes);
    std::memcpy(out.rgba.data(), data, pixel_bytes);

    stbi_image_free(data);
    return true;
}
} // namespace

bool DecodeFileRgba32(const std::string& path, Bitmap& out, std::string& err)
{
    err.clear();
    out = Bitmap{};

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
    return AdoptStbPixels(data, w, h, out, err);
}

bool DecodeMemoryRgba32(const std::vector<std::uint8_t>& bytes, Bitmap& out, std::string& err)
{
    err.clear();
    out = Bitmap{};

    if (bytes.empty())
    {
        err = "Empty image payload.";
        return false;
    }
    if (bytes.size() > (size_t)INT_MAX)
    {
        err = "Image payload too large.";
        return false;
    }

    int w = 0;
    int h = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 4);
    return AdoptStbPixels(data, w, h, out, err);
}
} // namespace drift::image_decode
