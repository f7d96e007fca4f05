// Interactive viewer: same run as scatter_cli, drawn live in a GLFW window.
// The session is stepped from the frame loop with a small time slice per frame.
#include "poly_scatter/poly_scatter.hpp"
#include "poly_scatter/io/cli_parse.hpp"

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl2.h"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace poly_scatter;

namespace {

constexpr int kWindowWidth = 1000;
constexpr int kWindowHeight = 1000;
constexpr auto kStepSlice = std::chrono::milliseconds(12);

ImU32 to_imgui_color(Color color) {
    const Rgb rgb = to_rgb(color);
    return IM_COL32(rgb.r, rgb.g, rgb.b, 255);
}

// Keeps screen-ready copies of every committed placement and renames the window
class ViewerRenderer final : public Renderer {
public:
    ViewerRenderer(GLFWwindow* window, std::string tag)
        : window_(window), tag_(std::move(tag)) {
        update_title(0);
    }

    void draw(const Placement& placement, size_t scene_size) override {
        Shape shape;
        shape.vertices.reserve(placement.outline->size());
        for (size_t i = 0; i < placement.outline->size(); ++i) {
            shape.vertices.push_back(placement.world_vertex(i));
        }
        shape.color = to_imgui_color(placement.color);
        shapes_.push_back(std::move(shape));
        update_title(scene_size);
    }

    void finish(const SessionSummary& summary) override {
        update_title(summary.placed);
    }

    // World y points up, screen y points down
    void paint(ImDrawList* draw_list, ImVec2 origin, ImVec2 size, const CanvasBounds& view) const {
        const float sx = size.x / static_cast<float>(view.width());
        const float sy = size.y / static_cast<float>(view.height());
        const float s = std::min(sx, sy);

        std::vector<ImVec2> points;
        for (const auto& shape : shapes_) {
            points.clear();
            for (const auto& v : shape.vertices) {
                points.emplace_back(
                    origin.x + static_cast<float>(v.x - view.min_x()) * s,
                    origin.y + static_cast<float>(view.max_y() - v.y) * s
                );
            }
            draw_list->AddConcavePolyFilled(points.data(), static_cast<int>(points.size()), shape.color);
        }
    }

private:
    struct Shape {
        std::vector<Vec2> vertices;
        ImU32 color;
    };

    void update_title(size_t count) {
        const std::string title = format_count_line(tag_, count);
        glfwSetWindowTitle(window_, title.c_str());
    }

    GLFWwindow* window_;
    std::string tag_;
    std::vector<Shape> shapes_;
};

}  // namespace

int main(int argc, char** argv) {
    std::string shapes_path = "shapes.txt";
    std::string tag;
    double buffer = DEFAULT_BUFFER;
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--shapes") {
                shapes_path = require_arg(i, argc, argv, arg);
            } else if (arg == "--tag") {
                tag = require_arg(i, argc, argv, arg);
            } else if (arg == "--buffer") {
                buffer = parse_double(require_arg(i, argc, argv, arg));
            } else {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    CatalogueLoadReport report;
    Catalogue catalogue;
    try {
        catalogue = load_catalogue(shapes_path, &report);
    } catch (const CatalogueError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    for (const auto& warning : report.warnings) {
        std::cerr << "[Catalogue] " << warning << "\n";
    }

    RunParams params;
    try {
        params = prompt_run_params(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!glfwInit()) {
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    GLFWwindow* window = glfwCreateWindow(kWindowWidth, kWindowHeight, "poly_scatter", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();

    int exit_code = 0;
    try {
        const CanvasBounds canvas = CanvasBounds::from_display(kWindowWidth, kWindowHeight);
        const CanvasBounds view = CanvasBounds::from_display(kWindowWidth, kWindowHeight, 1.0);

        SessionConfig config;
        config.duration_seconds = params.duration_seconds;
        config.scale = params.scale;
        config.seed = params.seed;
        config.overlap.buffer = buffer;

        ViewerRenderer renderer(window, tag);
        SteadyClock clock;
        Session session(catalogue, canvas, config, renderer, clock);

        const WallTime started = std::chrono::system_clock::now();
        session.start();
        bool reported = false;

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            const auto slice_end = std::chrono::steady_clock::now() + kStepSlice;
            while (session.time_remaining() && std::chrono::steady_clock::now() < slice_end) {
                (void)session.step();
            }
            if (!session.time_remaining() && !reported) {
                const SessionSummary& summary = session.finish();
                const WallTime ended = std::chrono::system_clock::now();
                std::cout << format_summary(tag, started, ended, summary.placed) << "\n";
                std::cout << format_count_line(tag, summary.placed) << "\n";
                reported = true;
                if (params.terminate) {
                    glfwSetWindowShouldClose(window, GLFW_TRUE);
                }
            }

            ImGui_ImplOpenGL2_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            const ImGuiViewport* viewport = ImGui::GetMainViewport();
            ImGui::SetNextWindowPos(viewport->Pos);
            ImGui::SetNextWindowSize(viewport->Size);
            ImGui::Begin("Scene", nullptr,
                ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                ImGuiWindowFlags_NoBackground | ImGuiWindowFlags_NoSavedSettings);
            renderer.paint(ImGui::GetWindowDrawList(), viewport->Pos, viewport->Size, view);
            ImGui::End();

            ImGui::Render();
            int display_w = 0;
            int display_h = 0;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(window);
        }

        // Window closed early: still report what was placed
        if (!reported) {
            const SessionSummary& summary = session.finish();
            std::cout << format_summary(tag, started, std::chrono::system_clock::now(), summary.placed) << "\n";
            std::cout << format_count_line(tag, summary.placed) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return exit_code;
}
