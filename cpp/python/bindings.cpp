#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "poly_scatter/poly_scatter.hpp"

namespace py = pybind11;

namespace {

// Result of a headless run, owned by Python
struct RunResult {
    poly_scatter::SessionSummary summary;
    std::vector<poly_scatter::Placement> placements;
};

RunResult run_session(
    const poly_scatter::Catalogue& catalogue,
    const poly_scatter::CanvasBounds& canvas,
    const poly_scatter::SessionConfig& config,
    const std::string& svg_path
) {
    poly_scatter::SteadyClock clock;
    poly_scatter::NullRenderer null_renderer;
    poly_scatter::SvgRenderer svg_renderer(svg_path, canvas);
    poly_scatter::Renderer& renderer = svg_path.empty()
        ? static_cast<poly_scatter::Renderer&>(null_renderer)
        : static_cast<poly_scatter::Renderer&>(svg_renderer);

    RunResult result;
    {
        py::gil_scoped_release release;
        poly_scatter::Session session(catalogue, canvas, config, renderer, clock);
        result.summary = session.run();
        result.placements = session.registry().all();
    }
    return result;
}

py::array_t<double> world_vertices(const poly_scatter::Placement& p) {
    const size_t n = p.outline->size();
    py::array_t<double> out({static_cast<py::ssize_t>(n), static_cast<py::ssize_t>(2)});
    auto buf = out.mutable_unchecked<2>();
    for (size_t i = 0; i < n; ++i) {
        const poly_scatter::Vec2 v = p.world_vertex(i);
        buf(static_cast<py::ssize_t>(i), 0) = v.x;
        buf(static_cast<py::ssize_t>(i), 1) = v.y;
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(poly_scatter_cpp, m) {
    m.doc() = "C++ implementation of random non-overlapping polygon scattering";

    // Vec2
    py::class_<poly_scatter::Vec2>(m, "Vec2")
        .def(py::init<>())
        .def(py::init<double, double>())
        .def_readwrite("x", &poly_scatter::Vec2::x)
        .def_readwrite("y", &poly_scatter::Vec2::y)
        .def("__repr__", [](const poly_scatter::Vec2& v) {
            return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
        });

    py::enum_<poly_scatter::Color>(m, "Color")
        .value("Red", poly_scatter::Color::Red)
        .value("Blue", poly_scatter::Color::Blue)
        .value("Green", poly_scatter::Color::Green)
        .value("Yellow", poly_scatter::Color::Yellow)
        .value("Purple", poly_scatter::Color::Purple)
        .value("Orange", poly_scatter::Color::Orange)
        .value("White", poly_scatter::Color::White);

    // Outline
    py::class_<poly_scatter::Outline, std::shared_ptr<poly_scatter::Outline>>(m, "Outline")
        .def(py::init<std::string, poly_scatter::Polygon>(), py::arg("name"), py::arg("vertices"))
        .def("name", &poly_scatter::Outline::name)
        .def("vertices", &poly_scatter::Outline::vertices)
        .def("size", &poly_scatter::Outline::size)
        .def("centroid", &poly_scatter::Outline::centroid);

    // Placement
    py::class_<poly_scatter::Placement>(m, "Placement")
        .def(py::init([](poly_scatter::Vec2 anchor, std::shared_ptr<poly_scatter::Outline> outline,
                         double scale, poly_scatter::Color color) {
            return poly_scatter::Placement(anchor, std::move(outline), scale, color);
        }), py::arg("anchor"), py::arg("outline"), py::arg("scale") = 1.0,
            py::arg("color") = poly_scatter::Color::White)
        .def_readonly("anchor", &poly_scatter::Placement::anchor)
        .def_readonly("scale", &poly_scatter::Placement::scale)
        .def_readonly("color", &poly_scatter::Placement::color)
        .def("name", &poly_scatter::Placement::name)
        .def("world_centroid", &poly_scatter::Placement::world_centroid)
        .def("world_vertices", &world_vertices);

    // CanvasBounds
    py::class_<poly_scatter::CanvasBounds>(m, "CanvasBounds")
        .def(py::init<double, double, double, double>(),
            py::arg("min_x"), py::arg("max_x"), py::arg("min_y"), py::arg("max_y"))
        .def_static("from_display", &poly_scatter::CanvasBounds::from_display,
            py::arg("width"), py::arg("height"), py::arg("span") = 0.8)
        .def("min_x", &poly_scatter::CanvasBounds::min_x)
        .def("max_x", &poly_scatter::CanvasBounds::max_x)
        .def("min_y", &poly_scatter::CanvasBounds::min_y)
        .def("max_y", &poly_scatter::CanvasBounds::max_y);

    // OverlapOracle
    py::class_<poly_scatter::OverlapOracle::Config>(m, "OverlapConfig")
        .def(py::init<>())
        .def_readwrite("buffer", &poly_scatter::OverlapOracle::Config::buffer)
        .def_readwrite("distance_tolerance", &poly_scatter::OverlapOracle::Config::distance_tolerance);

    py::class_<poly_scatter::OverlapOracle>(m, "OverlapOracle")
        .def(py::init<>())
        .def(py::init<const poly_scatter::OverlapOracle::Config&>())
        .def("overlaps_pair", &poly_scatter::OverlapOracle::overlaps_pair)
        .def("buffer", &poly_scatter::OverlapOracle::buffer);

    // Catalogue
    py::class_<poly_scatter::Catalogue>(m, "Catalogue")
        .def(py::init<>())
        .def("size", &poly_scatter::Catalogue::size)
        .def("names", &poly_scatter::Catalogue::names)
        .def("find", [](const poly_scatter::Catalogue& self, const std::string& name) {
            poly_scatter::OutlinePtr outline = self.find(name);
            if (!outline) {
                throw py::key_error(name);
            }
            return outline->vertices();
        });

    py::register_exception<poly_scatter::CatalogueError>(m, "CatalogueError", PyExc_RuntimeError);

    m.def("load_catalogue", [](const std::string& path) {
        return poly_scatter::load_catalogue(path);
    }, py::arg("path"));

    // Session
    py::class_<poly_scatter::PlacementSearch::Config>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_attempts", &poly_scatter::PlacementSearch::Config::max_attempts)
        .def_readwrite("margin", &poly_scatter::PlacementSearch::Config::margin)
        .def_readwrite("fit_inside_canvas", &poly_scatter::PlacementSearch::Config::fit_inside_canvas);

    py::class_<poly_scatter::SessionConfig>(m, "SessionConfig")
        .def(py::init<>())
        .def_readwrite("duration_seconds", &poly_scatter::SessionConfig::duration_seconds)
        .def_readwrite("scale", &poly_scatter::SessionConfig::scale)
        .def_readwrite("seed", &poly_scatter::SessionConfig::seed)
        .def_readwrite("colors", &poly_scatter::SessionConfig::colors)
        .def_readwrite("overlap", &poly_scatter::SessionConfig::overlap)
        .def_readwrite("search", &poly_scatter::SessionConfig::search)
        .def_readwrite("verbose", &poly_scatter::SessionConfig::verbose);

    py::class_<poly_scatter::SessionSummary>(m, "SessionSummary")
        .def_readonly("elapsed_seconds", &poly_scatter::SessionSummary::elapsed_seconds)
        .def_readonly("placed", &poly_scatter::SessionSummary::placed)
        .def_readonly("rejected_deadline", &poly_scatter::SessionSummary::rejected_deadline)
        .def_readonly("rejected_exhausted", &poly_scatter::SessionSummary::rejected_exhausted)
        .def_readonly("attempts", &poly_scatter::SessionSummary::attempts)
        .def("rejected", &poly_scatter::SessionSummary::rejected);

    py::class_<RunResult>(m, "RunResult")
        .def_readonly("summary", &RunResult::summary)
        .def_readonly("placements", &RunResult::placements);

    m.def("run_session", &run_session,
        py::arg("catalogue"), py::arg("canvas"), py::arg("config"), py::arg("svg_path") = "");

    m.def("format_count_line", &poly_scatter::format_count_line, py::arg("tag"), py::arg("count"));
}
