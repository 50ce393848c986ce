#ifndef PNET_GEOMETRY_FUNC_HPP
#define PNET_GEOMETRY_FUNC_HPP
#include "AABB.hpp"

// unit vector of v, or {0, 0} when v has no length
vec2f normalOrZero(vec2f v);
// maps value into [0, extent) treating the axis as a ring; extent <= 0 maps to 0
float wrapCoordinate(float value, float extent);
// wraps point into [min, max) of area on both axes
vec2f wrapPoint(vec2f point, const AABB& area);
// linear falloff, 1 at distance 0 and 0 at radius and beyond
float linearFalloff(float distance, float radius);
#endif
