#ifndef PNET_VEC2_HPP
#define PNET_VEC2_HPP
#include <SFML/System/Vector2.hpp>
#include <cmath>
typedef sf::Vector2f vec2f;
typedef sf::Vector2u vec2u;
template<class Vec>
float qlen(Vec v) {
    return v.x * v.x + v.y * v.y;
}
template<class Vec>
float length(Vec v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}
template<class Vec>
float dot(Vec a, Vec b) {
    return a.x * b.x + a.y * b.y;
}
#endif// PNET_VEC2_HPP
