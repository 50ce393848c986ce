#ifndef PNET_RENDERER_HPP
#define PNET_RENDERER_HPP
#include "particle.hpp"
#include "surface.hpp"
#include <SFML/Graphics/VertexArray.hpp>
#include <cstdint>
#include <vector>

// pair of particles closer than the connection distance
struct Connection {
    uint32_t a;
    uint32_t b;
    float distance;
};

static constexpr unsigned disc_segments = 16U;

Color background_color(bool is_dark);
// alpha of a connection line, line_alpha - distance / line_fade clamped to [0, 1]
float connection_alpha(float distance, const SimParams& params);
Color connection_color(bool is_dark, float alpha);

// every unordered pair i < j with distance strictly below max_distance
void find_connections(const Particles& particles, float max_distance, std::vector<Connection>& out);
// appends one filled disc per particle as triangles
void build_discs(const Particles& particles, sf::VertexArray& out);
// appends every connection as a thin quad of params.line_width made of two triangles
void build_connections(const Particles& particles, const std::vector<Connection>& connections,
                       bool is_dark, const SimParams& params, sf::VertexArray& out);

/**
 * Paints one frame: clear, particle discs, then connection lines.
 * Vertex buffers are kept between frames to avoid reallocating.
 */
class Renderer {
    sf::VertexArray m_discs;
    sf::VertexArray m_lines;
    std::vector<Connection> m_connections;
public:
    Renderer();
    void render(const Particles& particles, bool is_dark, const SimParams& params, Surface& surface);
    const std::vector<Connection>& connections() const {
        return m_connections;
    }
};
#endif
