#pragma once

#include "core/bitmap.h"

#include <cstdint>
#include <string>
#include <vector>

namespace drift::image_decode
{
// Load an image from disk into an RGBA8 bitmap using stb_image.
// - supports common formats (PNG/JPG/GIF/BMP/PNM/...)
// - output pixels are row-major, width * height * 4 bytes.
bool DecodeFileRgba32(const std::string& path, Bitmap& out, std::string& err);

// Decode an image from memory into an RGBA8 bitmap using stb_image.
// `bytes` can contain PNG/JPG/GIF/BMP/etc.
bool DecodeMemoryRgba32(const std::vector<std::uint8_t>& bytes, Bitmap& out, std::string& err);
} // namespace drift::image_decode
