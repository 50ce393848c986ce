#include "config.hpp"
#include <cmath>
#include <stdexcept>

std::string usage() {
    return R"""(
Usage: particle-net [OPTIONS]
Options:
        -w [width]
        -h [height]
        -d [1/0 dark theme]
        -a [1/0 start alarming]
        -n [max amount of particles]
        -p [pixels of width per particle]
        -c [connection distance]
        -f [framerate limit, 0 uses vsync]
        -t [raporting time in seconds, 0 disables]
        --help
)""";
}

namespace {
int to_int(const std::string& flag, const std::string& arg) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(arg, &used);
    }catch(const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + flag + ": " + arg);
    }
    if(used != arg.size())
        throw std::invalid_argument("bad value for " + flag + ": " + arg);
    return v;
}
unsigned to_unsigned(const std::string& flag, const std::string& arg) {
    auto v = to_int(flag, arg);
    if(v < 0)
        throw std::invalid_argument(flag + " must not be negative");
    return static_cast<unsigned>(v);
}
float to_float(const std::string& flag, const std::string& arg) {
    size_t used = 0;
    float v = 0.f;
    try {
        v = std::stof(arg, &used);
    }catch(const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + flag + ": " + arg);
    }
    if(used != arg.size() || !std::isfinite(v))
        throw std::invalid_argument("bad value for " + flag + ": " + arg);
    return v;
}
bool to_bool(const std::string& flag, const std::string& arg) {
    if(arg == "1") return true;
    if(arg == "0") return false;
    throw std::invalid_argument(flag + " expects 1 or 0");
}
}

Config parse_args(int argc, const char* const* argv) {
    Config config;
    for(int i = 1; i < argc; i += 2) {
        std::string flag = argv[i];
        if(flag == "--help") {
            config.show_help = true;
            return config;
        }
        if(i + 1 >= argc)
            throw std::invalid_argument(flag + " requires an argument");
        std::string arg = argv[i+1];
        if(flag == "-w") {
            config.width = to_unsigned(flag, arg);
        }else if(flag == "-h") {
            config.height = to_unsigned(flag, arg);
        }else if(flag == "-d") {
            config.dark = to_bool(flag, arg);
        }else if(flag == "-a") {
            config.alarming = to_bool(flag, arg);
        }else if(flag == "-n") {
            config.params.max_particles = to_unsigned(flag, arg);
        }else if(flag == "-p") {
            config.params.pixels_per_particle = to_float(flag, arg);
            if(!(config.params.pixels_per_particle > 0.f))
                throw std::invalid_argument("-p must be positive");
        }else if(flag == "-c") {
            config.params.connect_distance = to_float(flag, arg);
        }else if(flag == "-f") {
            config.framerate_limit = to_unsigned(flag, arg);
        }else if(flag == "-t") {
            config.report_interval = to_float(flag, arg);
        }else {
            throw std::invalid_argument("unrecognized flag " + flag);
        }
    }
    if(config.width == 0 || config.height == 0)
        throw std::invalid_argument("window size must be positive");
    return config;
}
