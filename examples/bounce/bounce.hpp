// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef BOUNCE_BOUNCE_HPP
#define BOUNCE_BOUNCE_HPP

#include <stdexcept>

#include "geom/vector/vector_2d.hpp"

namespace bounce {

using geom::vector;

struct config {
    int steps = 100;
    float dt = 0.1f;
    float pos_x = 0.5f;
    float pos_y = 0.5f;
    float vel_x = 1.0f;
    float vel_y = 0.7f;
    float width = 4.0f;
    float height = 3.0f;
    bool quiet = false;
};

inline void validate(const config& cfg) {
    if (cfg.width <= 0 || cfg.height <= 0) {
        throw std::invalid_argument{"box size must be positive"};
    }
    if (cfg.dt <= 0) {
        throw std::invalid_argument{"time step must be positive"};
    }
    if (cfg.steps < 0) {
        throw std::invalid_argument{"step count must be non-negative"};
    }
}

struct state {
    vector box;
    vector pos;
    vector vel;
    float distance = 0;
    int bounces = 0;
};

// Starting point outside the box is moved onto its boundary
inline state initial_state(const config& cfg) {
    auto const box = vector::of(cfg.width, cfg.height);
    auto const pos = vector::of(cfg.pos_x, cfg.pos_y).clamp(vector::zero(), box);
    return {box, pos, vector::of(cfg.vel_x, cfg.vel_y)};
}

// Component of v where p touches a wall of the box gets reversed
inline vector reflect(vector v, const vector& p, const vector& box) {
    if (p.x <= 0 || p.x >= box.x) {
        v -= 2 * v.x_component();
    }
    if (p.y <= 0 || p.y >= box.y) {
        v -= 2 * v.y_component();
    }
    return v;
}

// A step that changes the velocity counts as one bounce, even in a corner
inline void step(state& s, float dt) {
    auto const next = (s.pos + s.vel * dt).clamp(vector::zero(), s.box);
    s.distance += (next - s.pos).length();
    s.pos = next;

    auto const reflected = reflect(s.vel, s.pos, s.box);
    if (reflected != s.vel) {
        ++s.bounces;
    }
    s.vel = reflected;
}

}  // namespace bounce

#endif  // BOUNCE_BOUNCE_HPP
