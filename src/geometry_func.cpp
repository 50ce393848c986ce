#include "geometry_func.hpp"
#include <algorithm>

vec2f normalOrZero(vec2f v) {
    auto l = length(v);
    if(!(l > 0.f) || !std::isfinite(l))
        return {0.f, 0.f};
    return v / l;
}
float wrapCoordinate(float value, float extent) {
    if(!(extent > 0.f) || !std::isfinite(value))
        return 0.f;
    if(value >= 0.f && value < extent)
        return value;
    auto r = std::fmod(value, extent);
    if(r < 0.f)
        r += extent;
    // fmod of a tiny negative value can round up to extent
    if(r >= extent)
        r = 0.f;
    return r;
}
vec2f wrapPoint(vec2f point, const AABB& area) {
    return {
        area.min.x + wrapCoordinate(point.x - area.min.x, area.width()),
        area.min.y + wrapCoordinate(point.y - area.min.y, area.height()),
    };
}
float linearFalloff(float distance, float radius) {
    if(!(radius > 0.f) || !(distance < radius))
        return 0.f;
    return std::clamp((radius - distance) / radius, 0.f, 1.f);
}
