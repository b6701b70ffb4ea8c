#include <cadence/render/surface.hpp>
#include <algorithm>
#include <utility>

namespace cadence::render {

Surface::Surface(uint32_t width, uint32_t height, std::string debug_name)
    : m_debug_name(std::move(debug_name)) {
    resize(width, height);
}

void Surface::resize(uint32_t width, uint32_t height) {
    m_width = width;
    m_height = height;
    m_pixels.assign(static_cast<size_t>(width) * height, 0u);
}

void Surface::clear(uint32_t color) {
    std::fill(m_pixels.begin(), m_pixels.end(), color);
}

void Surface::set_pixel(int32_t x, int32_t y, uint32_t color) {
    if (!contains(x, y)) return;
    m_pixels[static_cast<size_t>(y) * m_width + static_cast<size_t>(x)] = color;
}

uint32_t Surface::pixel(int32_t x, int32_t y) const {
    if (!contains(x, y)) return 0;
    return m_pixels[static_cast<size_t>(y) * m_width + static_cast<size_t>(x)];
}

bool Surface::contains(int32_t x, int32_t y) const {
    return x >= 0 && y >= 0 &&
           static_cast<uint32_t>(x) < m_width &&
           static_cast<uint32_t>(y) < m_height;
}

} // namespace cadence::render
