#ifndef PNET_SURFACE_HPP
#define PNET_SURFACE_HPP
#include "vec2.hpp"
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/VertexArray.hpp>

// raster the engine paints into, sized in pixels with the origin at the top left
class Surface {
public:
    virtual ~Surface() = default;
    virtual vec2u getSize() const = 0;
    // called after the host resized the backing target
    virtual void resize(vec2u size) = 0;
    virtual void clear(sf::Color color) = 0;
    virtual void draw(const sf::VertexArray& vertices) = 0;
};

// Surface over an sfml render target such as sf::RenderWindow
class RenderTargetSurface : public Surface {
    sf::RenderTarget& m_target;
public:
    explicit RenderTargetSurface(sf::RenderTarget& target);
    vec2u getSize() const override;
    void resize(vec2u size) override;
    void clear(sf::Color color) override;
    void draw(const sf::VertexArray& vertices) override;
};
#endif
