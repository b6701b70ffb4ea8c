#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cadence::render {

// CPU-side 2D raster target (RGBA8, one uint32_t per pixel).
// The ECS only ever passes surfaces by reference to drawers; it never
// allocates, resizes or reads one.
class Surface {
public:
    Surface() = default;
    Surface(uint32_t width, uint32_t height, std::string debug_name = {});

    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }
    const std::string& debug_name() const { return m_debug_name; }

    void resize(uint32_t width, uint32_t height);
    void clear(uint32_t color);

    // Out-of-range writes are ignored, out-of-range reads return 0
    void set_pixel(int32_t x, int32_t y, uint32_t color);
    uint32_t pixel(int32_t x, int32_t y) const;

    const std::vector<uint32_t>& pixels() const { return m_pixels; }

private:
    bool contains(int32_t x, int32_t y) const;

    uint32_t m_width = 0;
    uint32_t m_height = 0;
    std::string m_debug_name;
    std::vector<uint32_t> m_pixels;
};

// Pack 8-bit channels into the surface's pixel format
constexpr uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return (uint32_t(r) << 24) | (uint32_t(g) << 16) | (uint32_t(b) << 8) | uint32_t(a);
}

} // namespace cadence::render
