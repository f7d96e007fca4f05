#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace poly_scatter {

// Ranges user-supplied parameters are clamped to; the lower bound doubles as the default
struct ParamLimits {
    double min_scale{1.0};
    double max_scale{10.0};
    int64_t min_seed{1};
    int64_t max_seed{99};
    double min_duration{5.0};
    double max_duration{30.0};
};

struct RunParams {
    double scale{1.0};
    uint64_t seed{1};
    double duration_seconds{5.0};
    bool terminate{false};  // close the display as soon as the run ends
};

[[nodiscard]] RunParams default_run_params(const ParamLimits& limits = {});

[[nodiscard]] double clamp_scale(double scale, const ParamLimits& limits = {});
[[nodiscard]] uint64_t clamp_seed(int64_t seed, const ParamLimits& limits = {});
[[nodiscard]] double clamp_duration(double seconds, const ParamLimits& limits = {});

// Only "y" / "Y" answer yes
[[nodiscard]] bool parse_yes_no(std::string_view answer);

// Asks for scale, seed, duration and the termination flag, in that order.
// An empty answer (or end of input) takes the default; numbers are clamped.
// Throws std::runtime_error on an unparseable number.
[[nodiscard]] RunParams prompt_run_params(std::istream& in, std::ostream& out, const ParamLimits& limits = {});

}  // namespace poly_scatter
