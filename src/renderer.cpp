#include "renderer.hpp"
#include "geometry_func.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

Color background_color(bool is_dark) {
    if(is_dark)
        return Color(15, 23, 42);
    return Color(248, 250, 252);
}
float connection_alpha(float distance, const SimParams& params) {
    if(!(params.line_fade > 0.f))
        return std::clamp(params.line_alpha, 0.f, 1.f);
    return std::clamp(params.line_alpha - distance / params.line_fade, 0.f, 1.f);
}
Color connection_color(bool is_dark, float alpha) {
    auto a = static_cast<uint8_t>(std::lround(std::clamp(alpha, 0.f, 1.f) * 255.f));
    if(is_dark)
        return Color(255, 255, 255, a);
    return Color(0, 0, 0, a);
}

void find_connections(const Particles& particles, float max_distance, std::vector<Connection>& out) {
    out.clear();
    const auto n = static_cast<uint32_t>(particles.count());
    const float max_q = max_distance * max_distance;
    for(uint32_t i = 0; i < n; i++) {
        for(uint32_t ii = i + 1; ii < n; ii++) {
            auto diff = particles.position[i] - particles.position[ii];
            auto q = qlen(diff);
            if(q < max_q) {
                out.push_back({i, ii, std::sqrt(q)});
            }
        }
    }
}

namespace {
const std::array<vec2f, disc_segments>& unitCircle() {
    static const std::array<vec2f, disc_segments> points = [] {
        std::array<vec2f, disc_segments> result;
        for(unsigned i = 0; i < disc_segments; i++) {
            auto a = 2.f * std::numbers::pi_v<float> * (float)i / (float)disc_segments;
            result[i] = {std::cos(a), std::sin(a)};
        }
        return result;
    }();
    return points;
}
}

void build_discs(const Particles& particles, sf::VertexArray& out) {
    out.setPrimitiveType(sf::Triangles);
    const auto& circle = unitCircle();
    for(size_t i = 0; i < particles.count(); i++) {
        auto center = particles.position[i];
        auto rad = particles.size[i];
        auto color = particles.color[i];
        for(unsigned s = 0; s < disc_segments; s++) {
            auto next = (s + 1) % disc_segments;
            out.append(sf::Vertex(center, color));
            out.append(sf::Vertex(center + circle[s] * rad, color));
            out.append(sf::Vertex(center + circle[next] * rad, color));
        }
    }
}

void build_connections(const Particles& particles, const std::vector<Connection>& connections,
                       bool is_dark, const SimParams& params, sf::VertexArray& out) {
    out.setPrimitiveType(sf::Triangles);
    const float half_width = params.line_width * 0.5f;
    for(const auto& c : connections) {
        auto from = particles.position[c.a];
        auto to = particles.position[c.b];
        auto dir = to - from;
        auto side = normalOrZero(vec2f(-dir.y, dir.x)) * half_width;
        auto color = connection_color(is_dark, connection_alpha(c.distance, params));

        out.append(sf::Vertex(from + side, color));
        out.append(sf::Vertex(to + side, color));
        out.append(sf::Vertex(to - side, color));

        out.append(sf::Vertex(from + side, color));
        out.append(sf::Vertex(to - side, color));
        out.append(sf::Vertex(from - side, color));
    }
}

Renderer::Renderer() : m_discs(sf::Triangles), m_lines(sf::Triangles) {}

void Renderer::render(const Particles& particles, bool is_dark, const SimParams& params, Surface& surface) {
    surface.clear(background_color(is_dark));

    m_discs.clear();
    build_discs(particles, m_discs);
    surface.draw(m_discs);

    find_connections(particles, params.connect_distance, m_connections);
    m_lines.clear();
    build_connections(particles, m_connections, is_dark, params, m_lines);
    surface.draw(m_lines);
}
