#include "poly_scatter/io/catalogue.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <istream>
#include <optional>
#include <utility>

namespace poly_scatter {
namespace {

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

void warn(CatalogueLoadReport* report, std::string message) {
    if (report) {
        report->warnings.push_back(std::move(message));
    }
}

std::optional<double> parse_number(std::string_view s) {
    const std::string text(trim(s));
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range from stod
        return std::nullopt;
    }
}

// "(x, y" / "x, y)" / "(x,y)" -> point
std::optional<Vec2> parse_pair(std::string_view pair) {
    pair = trim(pair);
    if (!pair.empty() && pair.front() == '(') pair.remove_prefix(1);
    if (!pair.empty() && pair.back() == ')') pair.remove_suffix(1);

    const size_t comma = pair.find(',');
    if (comma == std::string_view::npos || pair.find(',', comma + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    const auto x = parse_number(pair.substr(0, comma));
    const auto y = parse_number(pair.substr(comma + 1));
    if (!x || !y) {
        return std::nullopt;
    }
    return Vec2{*x, *y};
}

}  // namespace

void Catalogue::insert(OutlinePtr outline) {
    std::string key = outline->name();
    entries_.insert_or_assign(std::move(key), std::move(outline));
}

OutlinePtr Catalogue::find(std::string_view name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<OutlinePtr> Catalogue::outlines() const {
    std::vector<OutlinePtr> out;
    out.reserve(entries_.size());
    for (const auto& [name, outline] : entries_) {
        out.push_back(outline);
    }
    return out;
}

std::vector<std::string> Catalogue::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, outline] : entries_) {
        out.push_back(name);
    }
    return out;
}

OutlinePtr parse_catalogue_line(std::string_view line, CatalogueLoadReport* report) {
    line = trim(line);
    if (line.empty()) {
        return nullptr;
    }

    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        if (report) ++report->skipped_lines;
        warn(report, "no ':' in line: " + std::string(line));
        return nullptr;
    }

    const std::string name(trim(line.substr(0, colon)));
    if (name.empty()) {
        if (report) ++report->skipped_lines;
        warn(report, "missing shape name in line: " + std::string(line));
        return nullptr;
    }

    std::string_view coords = trim(line.substr(colon + 1));
    Polygon points;
    size_t start = 0;
    while (start <= coords.size()) {
        size_t end = coords.find("),", start);
        const std::string_view pair = coords.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (auto p = parse_pair(pair)) {
            points.push_back(*p);
        } else if (!trim(pair).empty()) {
            if (report) ++report->skipped_pairs;
            warn(report, "bad coordinate pair '" + std::string(trim(pair)) + "' in shape '" + name + "'");
        }
        if (end == std::string_view::npos) break;
        start = end + 2;
    }

    if (points.size() < 3) {
        if (report) ++report->dropped_shapes;
        warn(report, "shape '" + name + "' dropped: " + std::to_string(points.size()) + " usable point(s)");
        return nullptr;
    }
    return Outline::create(name, std::move(points));
}

Catalogue parse_catalogue(std::istream& in, CatalogueLoadReport* report) {
    Catalogue catalogue;
    std::string line;
    while (std::getline(in, line)) {
        if (report) ++report->lines_read;
        if (OutlinePtr outline = parse_catalogue_line(line, report)) {
            catalogue.insert(std::move(outline));
        }
    }
    return catalogue;
}

Catalogue load_catalogue(const std::string& path, CatalogueLoadReport* report) {
    std::ifstream in(path);
    if (!in) {
        throw CatalogueError(path + " not found.");
    }
    Catalogue catalogue = parse_catalogue(in, report);
    if (catalogue.empty()) {
        throw CatalogueError("No valid shapes could be loaded from " + path + ".");
    }
    return catalogue;
}

}  // namespace poly_scatter
