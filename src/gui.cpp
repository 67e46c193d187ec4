#include <GL/glew.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <iostream>
#include <print>

#include "gui.h"


GLFWApp::GLFWApp() {
    glfwSetErrorCallback(&GLFWApp::error_callback);

    if (!glfwInit())
        throw GfxError(ErrorKind::ContextCreation, "Failed to initialize GLFW");
}

GLFWApp::~GLFWApp() {
    cleanup();
    glfwTerminate();
}


void GLFWApp::error_callback(int code, const char* description) {
    std::println(std::cerr, "ERROR::GLFW: [{}] {}", code, description ? description : "(null)");
}

void GLFWApp::key_callback(GLFWwindow* w, int key, int sc, int act, int mods) {
    if (auto* app = static_cast<GLFWApp*>(glfwGetWindowUserPointer(w)))
        app->on_key_press(key, act, mods);
}

void GLFWApp::resize_callback(GLFWwindow* w, int width, int height) {
    if (auto* app = static_cast<GLFWApp*>(glfwGetWindowUserPointer(w)))
        app->on_resize(width, height);
}

// ------------------------------------------------------------
// GLFWApp: Create Window
// ------------------------------------------------------------

void GLFWApp::create(const AppConfig& config) {
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, config.gl_major);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, config.gl_minor);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    // The root context renders offscreen only, so its window is never shown
    if (config.root_context) {
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        root_window = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
        if (!root_window)
            throw GfxError(ErrorKind::ContextCreation, "Failed to create root context window");
        glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    }

    window = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, root_window);
    if (!window)
        throw GfxError(ErrorKind::ContextCreation, "Failed to create window");

    glfwMakeContextCurrent(window);
    glfwSwapInterval(config.vsync ? 1 : 0);
    glfwSetWindowUserPointer(window, this);

    // Register static callbacks
    glfwSetKeyCallback(window, &GLFWApp::key_callback);
    glfwSetFramebufferSizeCallback(window, &GLFWApp::resize_callback);

    // Core profiles need this for GLEW to resolve VAO entry points
    glewExperimental = GL_TRUE;
    GLenum glew_status = glewInit();
    if (glew_status != GLEW_OK) {
        throw GfxError(ErrorKind::LoaderInit,
                       reinterpret_cast<const char*>(glewGetErrorString(glew_status)));
    }
    // glewInit can leave a harmless GL_INVALID_ENUM behind
    glGetError();

    context = std::make_unique<GLEWContext>(window, root_window);

    int width, height;
    glfwGetFramebufferSize(window, &width, &height);
    context->viewport(0, 0, width, height);

    std::println("Created {}x{} window \"{}\" with OpenGL {}", width, height, config.title,
                 reinterpret_cast<const char*>(glGetString(GL_VERSION)));
}

// ------------------------------------------------------------
// GLFWApp: Main Loop
// ------------------------------------------------------------

void GLFWApp::mainloop(std::unique_ptr<RenderHandler> handler) {
    if (!window)
        throw GfxError(ErrorKind::ContextCreation, "mainloop called before create");

    loop = std::make_unique<RenderLoop>(*context, std::move(handler));
    loop->start();

    while (!glfwWindowShouldClose(window)) {
        loop->on_redraw();

        glfwSwapBuffers(window);
        glfwPollEvents();
    }

    // Handlers may have switched contexts; release happens on the window's own
    context->make_current(ContextRole::Surface);
    loop->on_close();
}

// ------------------------------------------------------------
// GLFWApp: Event Handlers
// ------------------------------------------------------------

void GLFWApp::on_resize(int width, int height) {
    if (loop)
        loop->on_resize(width, height);
}

void GLFWApp::on_key_press(int key, int action, int) {
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
        glfwSetWindowShouldClose(window, GLFW_TRUE);
}

// ------------------------------------------------------------
// Cleanup
// ------------------------------------------------------------

void GLFWApp::cleanup() {
    loop.reset();
    context.reset();

    if (window) {
        std::println("Cleanup");
        glfwDestroyWindow(window);
        window = nullptr;
    }
    if (root_window) {
        glfwDestroyWindow(root_window);
        root_window = nullptr;
    }
}
