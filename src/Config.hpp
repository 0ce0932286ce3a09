// src/Config.hpp
#pragma once
#include <optional>
#include <string>
#include "video/Display.hpp"

// Everything the command line can set.  Rates are per second; an empty
// optional means uncapped.
struct Config {
    std::string            rom_path;
    int                    debug          = 0;
    std::optional<double>  fps_limit;
    std::optional<double>  ips_limit;
    std::optional<int>     ipf;
    bool                   skip_frames    = true;
    bool                   reduce_flicker = true;
    std::optional<Palette> colors;
    int                    scale          = 8;
    double                 timer_speed    = 1.0;
};

// Parse argv.  Prints the problem and usage to stderr and returns nullopt
// on any invalid or conflicting option.  --ipf N is turned into an ips cap
// of N × fps here, so consumers only ever look at ips_limit.
std::optional<Config> parse_config(int argc, char* argv[]);

void print_usage(const char* prog);
