// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <fmt/core.h>
#include <lyra/lyra.hpp>

#include "bounce.hpp"
#include "geom/config.hpp"
#include "geom/vector.hpp"

auto make_config_parser(bounce::config& cfg) {
    return lyra::opt(cfg.steps, "N")["--steps"]  //
           ("number of time steps")
         | lyra::opt(cfg.dt, "T")["--dt"]  //
           ("time step size")
         | lyra::opt(cfg.pos_x, "X")["--x"]  //
           ("initial position, x coordinate")
         | lyra::opt(cfg.pos_y, "Y")["--y"]  //
           ("initial position, y coordinate")
         | lyra::opt(cfg.vel_x, "VX")["--vx"]  //
           ("velocity, x component")
         | lyra::opt(cfg.vel_y, "VY")["--vy"]  //
           ("velocity, y component")
         | lyra::opt(cfg.width, "W")["--width"]  //
           ("box width")
         | lyra::opt(cfg.height, "H")["--height"]  //
           ("box height")
         | lyra::opt(cfg.quiet)["--quiet"]  //
           ("print only the summary");
}

int main(int argc, char* argv[]) {
    bounce::config cfg;

    bool show_help = false;
    auto const cli = lyra::help(show_help) | make_config_parser(cfg);
    auto const result = cli.parse({argc, argv});

    if (!result) {
        std::cerr << "Error: " << result.errorMessage() << std::endl;
        std::cerr << cli << std::endl;
        std::exit(1);
    }

    if (show_help) {
        std::cout << cli << std::endl;
        std::exit(0);
    }

    try {
        bounce::validate(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << cli << std::endl;
        std::exit(1);
    }

    auto s = bounce::initial_state(cfg);
    auto const start = s.pos;

    fmt::print("geom {}\n", geom::version().full);

    for (int i = 1; i <= cfg.steps; ++i) {
        bounce::step(s, cfg.dt);
        if (!cfg.quiet) {
            fmt::print("{:5} {:.4f} {:.4f}\n", i, s.pos, s.vel);
        }
    }

    fmt::print("Steps:     {}\n", cfg.steps);
    fmt::print("Final:     {}\n", s.pos);
    fmt::print("Bounces:   {}\n", s.bounces);
    fmt::print("Distance:  {:.6}\n", s.distance);
    fmt::print("Net shift: {:.6}\n", (s.pos - start).length());
}
