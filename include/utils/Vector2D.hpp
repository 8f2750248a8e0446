/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

// A simple 2D vector class. The pitch is the x/y plane with +x toward the
// red goal and +y toward the top touchline.
class Vector2D {
public:
    // Constructors
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void set(float x, float y) { m_x = x; m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    bool isZero() const { return lengthSquared() < kEpsilon; }

    // Unit copy of this vector; a zero vector stays zero
    Vector2D normalized() const {
        float len = length();
        if (len <= 0.0f) return Vector2D();
        return Vector2D(m_x / len, m_y / len);
    }

    void normalize() { *this = normalized(); }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    // z component of the 3D cross product
    float cross(const Vector2D& v2) const {
        return m_x * v2.m_y - m_y * v2.m_x;
    }

    // Vector rotated 90 degrees counter-clockwise
    Vector2D perp() const { return Vector2D(-m_y, m_x); }

    // 1 if v2 lies counter-clockwise of this vector, -1 otherwise
    int sign(const Vector2D& v2) const { return cross(v2) >= 0.0f ? 1 : -1; }

    Vector2D rotated(float radians) const {
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return Vector2D(m_x * c - m_y * s, m_x * s + m_y * c);
    }

    // Clamp length to max
    void truncate(float max) {
        if (lengthSquared() > max * max) {
            normalize();
            (*this) *= max;
        }
    }

    // Mirror about a unit normal
    void reflect(const Vector2D& normal) {
        (*this) -= normal * (2.0f * dot(normal));
    }

    // Operator overloads
    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    friend Vector2D& operator+=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        return v1;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    friend Vector2D operator*(float scalar, const Vector2D& v) {
        return v * scalar;
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator-() const { return Vector2D(-m_x, -m_y); }

    friend Vector2D& operator-=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        return v1;
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    Vector2D& operator/=(float scalar) {
        m_x /= scalar;
        m_y /= scalar;
        return *this;
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    bool operator!=(const Vector2D& v2) const { return !(*this == v2); }

    // Needed by BOOST_CHECK_EQUAL
    friend std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
        return os << "(" << v.m_x << ", " << v.m_y << ")";
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    static constexpr float kEpsilon = 1e-8f;

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
