#pragma once

#include "../core/outline.hpp"
#include <functional>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace poly_scatter {

// Fatal catalogue condition: missing source or no usable outline
class CatalogueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// What the parser skipped, one human-readable warning per skipped item
struct CatalogueLoadReport {
    size_t lines_read{0};
    size_t skipped_lines{0};
    size_t skipped_pairs{0};
    size_t dropped_shapes{0};
    std::vector<std::string> warnings;
};

// Name-ordered mapping from shape name to its immutable outline
class Catalogue {
public:
    using Map = std::map<std::string, OutlinePtr, std::less<>>;

    Catalogue() = default;

    // Replaces an existing entry with the same name
    void insert(OutlinePtr outline);

    // nullptr when the name is unknown
    [[nodiscard]] OutlinePtr find(std::string_view name) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const Map& entries() const { return entries_; }

    // Outlines in name order
    [[nodiscard]] std::vector<OutlinePtr> outlines() const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    Map entries_;
};

// Parse lines of the form `name: (x1,y1),(x2,y2),...`.
// Lines without a colon or a name are skipped, unparseable pairs are skipped
// one by one, and names left with fewer than 3 points are dropped.
[[nodiscard]] Catalogue parse_catalogue(std::istream& in, CatalogueLoadReport* report = nullptr);

// Parse one line; returns nullptr when the line yields no outline
[[nodiscard]] OutlinePtr parse_catalogue_line(std::string_view line, CatalogueLoadReport* report = nullptr);

// Throws CatalogueError when the file cannot be opened or yields no outline
[[nodiscard]] Catalogue load_catalogue(const std::string& path, CatalogueLoadReport* report = nullptr);

}  // namespace poly_scatter
