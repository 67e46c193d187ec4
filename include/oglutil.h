#ifndef OGLUTIL_H
#define OGLUTIL_H
#include <GL/glew.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "gl_context.h"


namespace oglutil {
    // Raw view of a typed sequence for buffer uploads. Only element types
    // with a fixed memory layout are accepted.
    template <typename T>
    std::span<const std::byte> as_bytes(std::span<const T> data) {
        static_assert(std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>,
                      "buffer uploads need a trivially copyable, standard layout element type");
        return std::as_bytes(data);
    }

    template <typename T>
    void upload_buffer(GLContext &gl, GLenum target, std::span<const T> data, GLenum usage = GL_STATIC_DRAW) {
        gl.buffer_data(target, as_bytes(data), usage);
    }

    // One slot of an interleaved vertex record.
    struct VertexAttribute {
        GLuint location;
        GLint components;
        GLenum type;
        GLsizei stride;
        GLintptr offset;
    };

    // Sets the pointer and enables every attribute on the bound VAO/VBO.
    void describe_layout(GLContext &gl, std::span<const VertexAttribute> layout);

    GLuint compile_shader(GLContext &gl, GLenum type, std::string_view source);
    GLuint link_program(GLContext &gl, GLuint vertex_shader, GLuint fragment_shader);

    GLenum pixel_format_for(int channels);
    GLuint load_texture(GLContext &gl, GLenum unit, const std::string &path);

    // Offscreen color target: an RGB8 renderbuffer on COLOR_ATTACHMENT0.
    struct ColorTarget {
        GLuint framebuffer = 0;
        GLuint renderbuffer = 0;
        GLsizei width = 0;
        GLsizei height = 0;
    };

    ColorTarget create_color_target(GLContext &gl, GLsizei width, GLsizei height);
    GLuint attach_renderbuffer_for_read(GLContext &gl, GLuint renderbuffer);
    void check_framebuffer_complete(GLContext &gl, GLenum target);
    void blit_to_default(GLContext &gl, GLuint read_framebuffer, Extent source, Extent destination);

    // Throws GfxError(GLError) if the driver reports a pending error.
    void check_gl_error(GLContext &gl, const char *where);
}

#endif
