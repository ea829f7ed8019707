#include <porchlight/core/color.hpp>
#include <glm/gtc/color_space.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace porchlight::core {

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Color> parse_hex_color(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 3 && hex.size() != 6) {
        return std::nullopt;
    }

    int digits[6] = {};
    for (size_t i = 0; i < hex.size(); ++i) {
        digits[i] = hex_digit(hex[i]);
        if (digits[i] < 0) return std::nullopt;
    }

    Color color{0.0f};
    if (hex.size() == 3) {
        // #rgb expands each nibble to a byte (0xf -> 0xff)
        for (int i = 0; i < 3; ++i) {
            color[i] = static_cast<float>(digits[i] * 17) / 255.0f;
        }
    } else {
        for (int i = 0; i < 3; ++i) {
            color[i] = static_cast<float>(digits[i * 2] * 16 + digits[i * 2 + 1]) / 255.0f;
        }
    }
    return color;
}

static int to_byte(float channel) {
    return static_cast<int>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
}

std::string to_hex_string(const Color& color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x",
                  to_byte(color.r), to_byte(color.g), to_byte(color.b));
    return buffer;
}

uint32_t to_rgba8(const Color& color) {
    return (static_cast<uint32_t>(to_byte(color.r)) << 24) |
           (static_cast<uint32_t>(to_byte(color.g)) << 16) |
           (static_cast<uint32_t>(to_byte(color.b)) << 8) |
           0xFFu;
}

Vec3 srgb_to_linear(const Color& color) {
    return glm::convertSRGBToLinear(glm::clamp(color, 0.0f, 1.0f));
}

Color linear_to_srgb(const Vec3& linear) {
    // Out-of-gamut OKLab blends can go slightly negative
    return glm::convertLinearToSRGB(glm::clamp(linear, 0.0f, 1.0f));
}

// Björn Ottosson's OKLab matrices
OkLab linear_to_oklab(const Vec3& c) {
    float l = 0.4122214708f * c.r + 0.5363325363f * c.g + 0.0514459929f * c.b;
    float m = 0.2119034982f * c.r + 0.6806995451f * c.g + 0.1073969566f * c.b;
    float s = 0.0883024619f * c.r + 0.2817188376f * c.g + 0.6299787005f * c.b;

    float l_ = std::cbrt(l);
    float m_ = std::cbrt(m);
    float s_ = std::cbrt(s);

    return OkLab{
        0.2104542553f * l_ + 0.7936177850f * m_ - 0.0040720468f * s_,
        1.9779984951f * l_ - 2.4285922050f * m_ + 0.4505937099f * s_,
        0.0259040371f * l_ + 0.7827717662f * m_ - 0.8086757660f * s_
    };
}

Vec3 oklab_to_linear(const OkLab& lab) {
    float l_ = lab.x + 0.3963377774f * lab.y + 0.2158037573f * lab.z;
    float m_ = lab.x - 0.1055613458f * lab.y - 0.0638541728f * lab.z;
    float s_ = lab.x - 0.0894841775f * lab.y - 1.2914855480f * lab.z;

    float l = l_ * l_ * l_;
    float m = m_ * m_ * m_;
    float s = s_ * s_ * s_;

    return Vec3{
        +4.0767416621f * l - 3.3077115913f * m + 0.2309699292f * s,
        -1.2684380046f * l + 2.6097574011f * m - 0.3413193965f * s,
        -0.0041960863f * l - 0.7034186147f * m + 1.7076147010f * s
    };
}

Color mix_oklab(const Color& a, const Color& b, float t) {
    if (!(t > 0.0f)) return a;
    if (t >= 1.0f) return b;

    OkLab lab_a = linear_to_oklab(srgb_to_linear(a));
    OkLab lab_b = linear_to_oklab(srgb_to_linear(b));
    OkLab blended = glm::mix(lab_a, lab_b, t);
    return linear_to_srgb(oklab_to_linear(blended));
}

} // namespace porchlight::core
