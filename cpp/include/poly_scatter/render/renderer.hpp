#pragma once

#include "../core/placement.hpp"
#include <memory>

namespace poly_scatter {

struct SessionSummary;

class Renderer;
using RendererPtr = std::unique_ptr<Renderer>;

// Display side of a session. The session calls draw() exactly once per
// committed placement, after the placement is in the registry, and never
// looks at anything the renderer does.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual void draw(const Placement& placement, size_t scene_size) = 0;

    // End of the run; default: nothing to flush
    virtual void finish(const SessionSummary& summary) {
        (void)summary;
    }
};

class NullRenderer final : public Renderer {
public:
    void draw(const Placement& placement, size_t scene_size) override {
        (void)placement;
        (void)scene_size;
    }
};

}  // namespace poly_scatter
