#ifndef PNET_CONFIG_HPP
#define PNET_CONFIG_HPP
#include "params.hpp"
#include <string>

struct Config {
    unsigned width = 1280;
    unsigned height = 720;
    bool dark = true;
    bool alarming = false;
    unsigned framerate_limit = 0;
    float report_interval = 0.f;
    bool show_help = false;
    SimParams params;
};

std::string usage();
// flags come in "-x value" pairs; throws std::invalid_argument on unknown flags or bad values
Config parse_args(int argc, const char* const* argv);
#endif
