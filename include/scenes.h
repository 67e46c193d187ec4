#ifndef SCENES_H
#define SCENES_H

#include <GL/glew.h>
#include <glm/glm.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>

#include "oglutil.h"
#include "render_handler.h"
#include "shader.h"

// Interleaved record used by the textured quad: position(3) color(4) uv(2).
struct ColorTexVertex {
    glm::vec3 position;
    glm::vec4 color;
    glm::vec2 tex_coord;
};

namespace quad {
    // Two triangles over the four corners, counter-clockwise.
    inline constexpr std::array<std::uint32_t, 6> indices = {
        0, 1, 2,
        0, 2, 3,
    };
}

// Offscreen target size used by both framebuffer scenes.
inline constexpr GLsizei OFFSCREEN_WIDTH = 800;
inline constexpr GLsizei OFFSCREEN_HEIGHT = 600;

// Clears the window red. No geometry.
class HelloWindow : public RenderHandler {
public:
    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
};

class HelloTriangle : public RenderHandler {
public:
    static inline const std::array<glm::vec3, 3> vertices = {{
        {-0.5f, -0.5f, 0.0f},
        { 0.5f, -0.5f, 0.0f},
        { 0.0f,  0.5f, 0.0f},
    }};

    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
    void exit(GLContext& gl) override;

private:
    std::optional<Shader> shader;
    GLuint vao = 0;
    GLuint vbo = 0;
};

// Indexed quad whose fragment color is driven by a time uniform.
class Shaders01 : public RenderHandler {
public:
    static inline const std::array<glm::vec3, 4> vertices = {{
        {-0.5f, -0.5f, 0.0f}, // bottom left
        { 0.5f, -0.5f, 0.0f}, // bottom right
        { 0.5f,  0.5f, 0.0f}, // top right
        {-0.5f,  0.5f, 0.0f}, // top left
    }};

    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
    void exit(GLContext& gl) override;

private:
    std::optional<Shader> shader;
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ebo = 0;
    GLint time_uniform = -1;
    std::chrono::steady_clock::time_point start_time;
};

// Indexed quad with per-vertex color and two blended textures.
class Textures01 : public RenderHandler {
public:
    static inline const std::array<ColorTexVertex, 4> vertices = {{
        {{-0.5f, -0.5f, 0.0f}, {1.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f}}, // bottom left
        {{ 0.5f, -0.5f, 0.0f}, {0.0f, 1.0f, 0.0f, 1.0f}, {0.0f, 1.0f}}, // bottom right
        {{ 0.5f,  0.5f, 0.0f}, {0.0f, 0.0f, 1.0f, 1.0f}, {1.0f, 1.0f}}, // top right
        {{-0.5f,  0.5f, 0.0f}, {0.5f, 0.5f, 0.5f, 1.0f}, {1.0f, 0.0f}}, // top left
    }};

    static constexpr const char* face_texture = "assets/awesomeface.png";
    static constexpr const char* wall_texture = "assets/wall.png";

    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
    void exit(GLContext& gl) override;

private:
    std::optional<Shader> shader;
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ebo = 0;
    GLuint texture0 = 0;
    GLuint texture1 = 0;
    GLint time_uniform = -1;
    std::chrono::steady_clock::time_point start_time;
};

// Renders into an offscreen renderbuffer and blits it to the window, all on
// the window's context.
class Framebuffers01 : public RenderHandler {
public:
    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
    void exit(GLContext& gl) override;

private:
    oglutil::ColorTarget target;
};

// Same picture as Framebuffers01, but rendered on the root context and blitted
// from the surface context through the shared renderbuffer. Needs an app
// created with AppConfig::root_context.
class Framebuffers02 : public RenderHandler {
public:
    void init(GLContext& gl) override;
    void draw(GLContext& gl) override;
    void exit(GLContext& gl) override;

private:
    oglutil::ColorTarget root_target;
    GLuint surface_read_framebuffer = 0;
};

#endif // SCENES_H
