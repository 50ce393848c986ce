#ifndef PNET_AABB_HPP
#define PNET_AABB_HPP

#include "vec2.hpp"

// axis aligned box, used as the bounds of the drawing surface
struct AABB {
    vec2f min;
    vec2f max;

    float width() const {
        return max.x - min.x;
    }
    float height() const {
        return max.y - min.y;
    }

    static AABB CreateMinSize(vec2f min, vec2f size) {
        AABB  result{min, min+size};
        return result;
    }
};

#endif
