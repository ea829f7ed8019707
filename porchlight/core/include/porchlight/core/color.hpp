#pragma once

#include <porchlight/core/math.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <cstdint>

namespace porchlight::core {

// Display colour: non-linear sRGB channels in [0, 1]
using Color = Vec3;

// OKLab coordinates (L, a, b)
using OkLab = Vec3;

// Parse "#rrggbb" or "#rgb" (leading '#' optional). Returns nullopt on malformed input.
std::optional<Color> parse_hex_color(std::string_view hex);

// Format as lowercase "#rrggbb"
std::string to_hex_string(const Color& color);

// Pack as 0xRRGGBBAA with full alpha
uint32_t to_rgba8(const Color& color);

// sRGB <-> linear transfer (IEC 61966-2-1)
Vec3 srgb_to_linear(const Color& color);
Color linear_to_srgb(const Vec3& linear);

// Linear sRGB <-> OKLab
OkLab linear_to_oklab(const Vec3& linear);
Vec3 oklab_to_linear(const OkLab& lab);

// Blend two sRGB colours in OKLab. t is clamped to [0, 1]; the endpoints
// return the inputs unchanged.
Color mix_oklab(const Color& a, const Color& b, float t);

} // namespace porchlight::core
