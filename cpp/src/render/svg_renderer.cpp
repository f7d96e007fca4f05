#include "poly_scatter/render/svg_renderer.hpp"
#include "poly_scatter/session/session.hpp"

#include <fstream>
#include <ios>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace poly_scatter {
namespace {

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

}  // namespace

SvgRenderer::SvgRenderer(std::string path, const CanvasBounds& canvas, std::string title)
    : path_(std::move(path)), canvas_(canvas), title_(std::move(title)) {}

void SvgRenderer::draw(const Placement& placement, size_t scene_size) {
    (void)scene_size;
    PlacedFigure fig = placement_to_figure(placement);
    shapes_.push_back(Shape{std::move(fig.vertices), placement.color});
}

void SvgRenderer::write(std::ostream& out) const {
    const double width = canvas_.width();
    const double height = canvas_.height();
    auto to_screen_x = [&](double x) { return x - canvas_.min_x(); };
    auto to_screen_y = [&](double y) { return canvas_.max_y() - y; };

    out << R"(<?xml version="1.0" encoding="UTF-8" standalone="no"?>)" << "\n";
    out << R"(<svg xmlns="http://www.w3.org/2000/svg" version="1.1")";
    out << " width=\"" << width << "\" height=\"" << height << "\"";
    out << " viewBox=\"0 0 " << width << " " << height << "\">" << "\n";
    if (!title_.empty()) {
        out << "<title>" << xml_escape(title_) << "</title>\n";
    }
    out << R"(<rect x="0" y="0" width=")" << width << R"(" height=")" << height
        << R"(" fill="black" stroke="none"/>)" << "\n";

    const std::ios_base::fmtflags saved_flags = out.flags();
    const std::streamsize saved_precision = out.precision();
    out << std::fixed << std::setprecision(3);
    for (const auto& shape : shapes_) {
        out << R"(<polygon fill=")" << to_string(shape.color) << R"(" stroke="none" points=")";
        for (size_t i = 0; i < shape.vertices.size(); ++i) {
            if (i > 0) out << ' ';
            out << to_screen_x(shape.vertices[i].x) << ',' << to_screen_y(shape.vertices[i].y);
        }
        out << "\"/>\n";
    }
    out << "</svg>\n";
    out.flags(saved_flags);
    out.precision(saved_precision);
}

void SvgRenderer::finish(const SessionSummary& summary) {
    (void)summary;
    if (path_.empty()) {
        return;
    }
    std::ofstream ofs(path_);
    if (!ofs) {
        throw std::runtime_error("Failed to open SVG file: " + path_);
    }
    write(ofs);
    if (!ofs) {
        throw std::runtime_error("Failed to write SVG file: " + path_);
    }
}

}  // namespace poly_scatter
