#ifndef RENDER_LOOP_H
#define RENDER_LOOP_H

#include "gl_context.h"
#include "render_handler.h"

#include <memory>

// Lifecycle dispatch for one RenderHandler. Knows nothing about the window
// system; GLFWApp translates its callbacks into these calls.
class RenderLoop {
public:
    enum class Stage {
        Created,
        Running,
        Exited,
    };

    RenderLoop(GLContext& gl, std::unique_ptr<RenderHandler> handler);

    // Runs handler init. Only valid once, from Created.
    void start();

    void on_redraw();
    void on_resize(int width, int height);

    // Runs handler exit if the handler is running. Repeated calls are ignored.
    void on_close();

    Stage stage() const { return current_stage; }
    bool running() const { return current_stage == Stage::Running; }

private:
    GLContext& gl;
    std::unique_ptr<RenderHandler> handler;
    Stage current_stage = Stage::Created;
};

#endif // RENDER_LOOP_H
