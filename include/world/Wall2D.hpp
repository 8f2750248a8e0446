/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WALL_2D_HPP
#define WALL_2D_HPP

#include "utils/Vector2D.hpp"

namespace Kickoff {

// Line segment collider. The normal is the unit vector facing the side
// agents are expected to stay on.
struct Wall2D
{
    Vector2D from;
    Vector2D to;
    Vector2D normal;

    Wall2D() = default;
    Wall2D(const Vector2D& a, const Vector2D& b, const Vector2D& facing)
        : from(a), to(b), normal(facing.normalized()) {}

    Vector2D center() const { return (from + to) * 0.5f; }
};

// Circular collider. Invisible obstacles still block movement; the flag
// only controls whether a renderer draws them.
struct Obstacle
{
    Vector2D center;
    float radius{0.0f};
    bool visible{true};
};

} // namespace Kickoff

#endif // WALL_2D_HPP
