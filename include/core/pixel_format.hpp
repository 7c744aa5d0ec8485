#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/*
    Pixel layouts a renderer can produce. Both are 4 bytes per pixel, only the channel order and alpha
    premultiplication differ. Converting between them is the presentation surface's business.
*/

namespace tfp {

enum class PixelFormat {
  Rgba8,  // R, G, B, A
  Prgb8   // premultiplied A, R, G, B
};

inline constexpr std::size_t BytesPerPixel(PixelFormat) { return 4; }

inline constexpr std::size_t Stride(PixelFormat fmt, std::uint32_t width) {
  return static_cast<std::size_t>(width) * BytesPerPixel(fmt);
}

inline constexpr std::size_t BufferSize(PixelFormat fmt, std::uint32_t width, std::uint32_t height) {
  return Stride(fmt, width) * static_cast<std::size_t>(height);
}

inline const char* ToString(PixelFormat fmt) {
  return fmt == PixelFormat::Prgb8 ? "prgb8" : "rgba8";
}

} // namespace tfp
