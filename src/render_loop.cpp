#include <stdexcept>

#include "render_loop.h"

RenderLoop::RenderLoop(GLContext& gl, std::unique_ptr<RenderHandler> handler)
    : gl(gl),
      handler(std::move(handler))
{
    if (!this->handler)
        throw std::invalid_argument("RenderLoop needs a handler");
}

void RenderLoop::start() {
    if (current_stage != Stage::Created)
        throw std::logic_error("RenderLoop::start called twice");

    handler->init(gl);
    current_stage = Stage::Running;
}

void RenderLoop::on_redraw() {
    if (current_stage != Stage::Running)
        return;
    handler->draw(gl);
}

void RenderLoop::on_resize(int width, int height) {
    gl.viewport(0, 0, width, height);
}

void RenderLoop::on_close() {
    if (current_stage != Stage::Running)
        return;

    // Flip first so nothing can draw while exit is in progress.
    current_stage = Stage::Exited;
    handler->exit(gl);
}
