// src/Config.cpp
#include "Config.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

static bool parse_double(const char* s, double& out) {
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s, &end);
    return end != s && *end == '\0' && errno != ERANGE;
}

static bool parse_int(const char* s, int& out) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return false;
    out = static_cast<int>(v);
    return true;
}

// "c0,c1" or "c0,c1,c2,c3" in hex, with or without a 0x / # prefix.
static bool parse_colors(const std::string& arg, Palette& out) {
    std::vector<uint32_t> values;
    std::stringstream ss(arg);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty() && item[0] == '#') item.erase(0, 1);
        if (item.size() > 2 && item[0] == '0' && (item[1] == 'x' || item[1] == 'X'))
            item.erase(0, 2);
        if (item.empty()) return false;
        char* end = nullptr;
        unsigned long v = std::strtoul(item.c_str(), &end, 16);
        if (*end != '\0' || v > 0xFFFFFF) return false;
        values.push_back(static_cast<uint32_t>(v));
    }
    if (values.size() == 2) {
        out = {values[0], values[1], values[1], values[1]};
        return true;
    }
    if (values.size() == 4) {
        out = {values[0], values[1], values[2], values[3]};
        return true;
    }
    return false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <rom> [options]\n"
              << "  --debug N          verbosity (1: rates, 2: per-instruction dump)\n"
              << "  --fps F            cap frames per second\n"
              << "  --ips F            cap instructions per second\n"
              << "  --ipf N            instructions per frame (needs --fps, not with --ips)\n"
              << "  --no-skip-frames   block the CPU until each frame is shown\n"
              << "  --flicker          only send frames when the display changed\n"
              << "  --colors c0,c1[,c2,c3]  hex palette override\n"
              << "  --scale N          window scale (default 8)\n"
              << "  --timer-speed X    timer speed multiplier (default 1.0)\n";
}

static std::optional<Config> reject(const char* prog, const std::string& why) {
    std::cerr << "[CONFIG] " << why << "\n";
    print_usage(prog);
    return std::nullopt;
}

std::optional<Config> parse_config(int argc, char* argv[]) {
    const char* prog = argc > 0 ? argv[0] : "chipxo";
    Config cfg;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value  = i + 1 < argc;

        if (std::strcmp(arg, "--no-skip-frames") == 0) {
            cfg.skip_frames = false;
        } else if (std::strcmp(arg, "--flicker") == 0) {
            cfg.reduce_flicker = false;
        } else if (std::strcmp(arg, "--debug") == 0 && has_value) {
            if (!parse_int(argv[++i], cfg.debug) || cfg.debug < 0)
                return reject(prog, "--debug expects a non-negative integer");
        } else if (std::strcmp(arg, "--fps") == 0 && has_value) {
            double v;
            if (!parse_double(argv[++i], v) || v <= 0.0)
                return reject(prog, "--fps expects a positive number");
            cfg.fps_limit = v;
        } else if (std::strcmp(arg, "--ips") == 0 && has_value) {
            double v;
            if (!parse_double(argv[++i], v) || v <= 0.0)
                return reject(prog, "--ips expects a positive number");
            cfg.ips_limit = v;
        } else if (std::strcmp(arg, "--ipf") == 0 && has_value) {
            int v;
            if (!parse_int(argv[++i], v) || v <= 0)
                return reject(prog, "--ipf expects a positive integer");
            cfg.ipf = v;
        } else if (std::strcmp(arg, "--colors") == 0 && has_value) {
            Palette p;
            if (!parse_colors(argv[++i], p))
                return reject(prog, "--colors expects 2 or 4 hex colors");
            cfg.colors = p;
        } else if (std::strcmp(arg, "--scale") == 0 && has_value) {
            if (!parse_int(argv[++i], cfg.scale) || cfg.scale <= 0)
                return reject(prog, "--scale expects a positive integer");
        } else if (std::strcmp(arg, "--timer-speed") == 0 && has_value) {
            if (!parse_double(argv[++i], cfg.timer_speed) || cfg.timer_speed <= 0.0)
                return reject(prog, "--timer-speed expects a positive number");
        } else if (arg[0] == '-' && arg[1] == '-') {
            return reject(prog, std::string("Unknown or incomplete option: ") + arg);
        } else if (cfg.rom_path.empty()) {
            cfg.rom_path = arg;
        } else {
            return reject(prog, std::string("Unexpected argument: ") + arg);
        }
    }

    if (cfg.rom_path.empty())
        return reject(prog, "No ROM given");
    if (cfg.ipf) {
        if (cfg.ips_limit)
            return reject(prog, "--ipf and --ips are mutually exclusive");
        if (!cfg.fps_limit)
            return reject(prog, "--ipf requires --fps");
        cfg.ips_limit = *cfg.ipf * *cfg.fps_limit;
    }
    return cfg;
}
