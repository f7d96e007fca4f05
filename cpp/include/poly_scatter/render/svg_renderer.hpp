#pragma once

#include "renderer.hpp"
#include "../constraints/canvas_bounds.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace poly_scatter {

// Writes the scene as a standalone SVG document when the session finishes.
// World y points up; the document is flipped so the picture matches a
// y-up display.
class SvgRenderer final : public Renderer {
public:
    // Empty path: nothing is written by finish(), write() can still be used
    SvgRenderer(std::string path, const CanvasBounds& canvas, std::string title = "");

    void draw(const Placement& placement, size_t scene_size) override;

    // Throws std::runtime_error when the file cannot be written
    void finish(const SessionSummary& summary) override;

    void write(std::ostream& out) const;

    [[nodiscard]] size_t shape_count() const { return shapes_.size(); }
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    struct Shape {
        Polygon vertices;
        Color color;
    };

    std::string path_;
    CanvasBounds canvas_;
    std::string title_;
    std::vector<Shape> shapes_;
};

}  // namespace poly_scatter
