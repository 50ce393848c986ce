#include "surface.hpp"
#include <SFML/Graphics/View.hpp>

RenderTargetSurface::RenderTargetSurface(sf::RenderTarget& target) : m_target(target) {}

vec2u RenderTargetSurface::getSize() const {
    return m_target.getSize();
}
void RenderTargetSurface::resize(vec2u size) {
    // keep one world unit per pixel instead of stretching the old view
    m_target.setView(sf::View(sf::FloatRect(0.f, 0.f, (float)size.x, (float)size.y)));
}
void RenderTargetSurface::clear(sf::Color color) {
    m_target.clear(color);
}
void RenderTargetSurface::draw(const sf::VertexArray& vertices) {
    m_target.draw(vertices);
}
