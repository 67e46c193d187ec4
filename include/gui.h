#ifndef GUI_H
#define GUI_H

#include "config.h"
#include "glew_context.h"
#include "gl_error.h"
#include "render_handler.h"
#include "render_loop.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <print>

struct GLFWwindow;

class GLFWApp {
public:
    GLFWApp();
    ~GLFWApp();

    void create(const AppConfig& config);
    void mainloop(std::unique_ptr<RenderHandler> handler);
    void cleanup();

    // Instance event handlers
    void on_key_press(int key, int action, int mods);
    void on_resize(int width, int height);

    // Static GLFW callbacks
    static void error_callback(int code, const char* description);
    static void key_callback(GLFWwindow* w, int key, int sc, int act, int mods);
    static void resize_callback(GLFWwindow* w, int width, int height);

private:
    GLFWwindow* window = nullptr;
    GLFWwindow* root_window = nullptr;

    std::unique_ptr<GLEWContext> context;
    std::unique_ptr<RenderLoop> loop;
};

// Opens the window described by config and runs Scene until it is closed.
// Returns the process exit code.
template <typename Scene>
int run_scene(const AppConfig& config) {
    try {
        GLFWApp app;
        app.create(config);
        app.mainloop(std::make_unique<Scene>());
    } catch (const GfxError& e) {
        std::println(std::cerr, "ERROR::{}: {}", to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#endif
