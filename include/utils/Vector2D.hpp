/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

namespace Bulwark {

// World-space 2D vector used for positions, headings and path geometry
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    // Unit vector, or the zero vector when this one has no length
    Vector2D normalized() const {
        float len = length();
        if (len <= 0.0f) {
            return Vector2D();
        }
        return Vector2D(m_x / len, m_y / len);
    }

    float dot(const Vector2D& v2) const { return m_x * v2.m_x + m_y * v2.m_y; }

    // Heading angle in radians, 0 pointing along +x
    float angle() const { return std::atan2(m_y, m_x); }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D& operator-=(const Vector2D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        return *this;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    // Unit heading from 'from' to 'to'; zero vector if they coincide
    static Vector2D direction(const Vector2D& from, const Vector2D& to) {
        return (to - from).normalized();
    }

    // Point a fraction t of the way from a to b
    static Vector2D lerp(const Vector2D& a, const Vector2D& b, float t) {
        return Vector2D(a.m_x + (b.m_x - a.m_x) * t, a.m_y + (b.m_y - a.m_y) * t);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

} // namespace Bulwark

#endif // VECTOR_2D_HPP
