#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace poly_scatter {

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag + ".");
    }
    return argv[++i];
}

inline int64_t parse_int64(const std::string& s) {
    size_t pos = 0;
    int64_t v = 0;
    try {
        v = std::stoll(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid number: " + s);
    }
    if (pos != s.size() || !std::isfinite(v)) {
        throw std::runtime_error("Invalid number: " + s);
    }
    return v;
}

}  // namespace poly_scatter
