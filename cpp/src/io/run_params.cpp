#include "poly_scatter/io/run_params.hpp"
#include "poly_scatter/io/cli_parse.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace poly_scatter {
namespace {

std::string trimmed(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

template <typename T>
std::string format_default(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

// Empty string when the user just pressed enter (or input ended)
std::string ask(std::istream& in, std::ostream& out, const std::string& label, const std::string& default_text) {
    out << label << " (default is " << default_text << "): " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return {};
    }
    return trimmed(line);
}

}  // namespace

RunParams default_run_params(const ParamLimits& limits) {
    RunParams params;
    params.scale = limits.min_scale;
    params.seed = clamp_seed(limits.min_seed, limits);
    params.duration_seconds = limits.min_duration;
    params.terminate = false;
    return params;
}

double clamp_scale(double scale, const ParamLimits& limits) {
    return std::clamp(scale, limits.min_scale, limits.max_scale);
}

uint64_t clamp_seed(int64_t seed, const ParamLimits& limits) {
    return static_cast<uint64_t>(std::clamp(seed, limits.min_seed, limits.max_seed));
}

double clamp_duration(double seconds, const ParamLimits& limits) {
    return std::clamp(seconds, limits.min_duration, limits.max_duration);
}

bool parse_yes_no(std::string_view answer) {
    return answer == "y" || answer == "Y";
}

RunParams prompt_run_params(std::istream& in, std::ostream& out, const ParamLimits& limits) {
    RunParams params = default_run_params(limits);

    std::string answer = ask(in, out, "Scale factor", format_default(params.scale));
    if (!answer.empty()) {
        params.scale = clamp_scale(parse_double(answer), limits);
    }

    answer = ask(in, out, "Random seed", format_default(params.seed));
    if (!answer.empty()) {
        params.seed = clamp_seed(parse_int64(answer), limits);
    }

    answer = ask(in, out, "Duration (s)", format_default(params.duration_seconds));
    if (!answer.empty()) {
        params.duration_seconds = clamp_duration(parse_double(answer), limits);
    }

    answer = ask(in, out, "Terminate", "n");
    params.terminate = parse_yes_no(answer);
    return params;
}

}  // namespace poly_scatter
