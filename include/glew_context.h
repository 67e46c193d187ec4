#ifndef GLEW_CONTEXT_H
#define GLEW_CONTEXT_H

#include "gl_context.h"

struct GLFWwindow;

// GLContext backed by the GLEW-loaded driver functions of a GLFW window.
// root_window is optional; it must share objects with surface_window.
class GLEWContext : public GLContext {
public:
    GLEWContext(GLFWwindow* surface_window, GLFWwindow* root_window = nullptr);

    GLuint create_shader(GLenum type) override;
    void shader_source(GLuint shader, std::string_view source) override;
    void compile_shader(GLuint shader) override;
    bool get_shader_compile_status(GLuint shader) override;
    std::string get_shader_info_log(GLuint shader) override;
    void delete_shader(GLuint shader) override;

    GLuint create_program() override;
    void attach_shader(GLuint program, GLuint shader) override;
    void detach_shader(GLuint program, GLuint shader) override;
    void link_program(GLuint program) override;
    bool get_program_link_status(GLuint program) override;
    std::string get_program_info_log(GLuint program) override;
    void use_program(GLuint program) override;
    void delete_program(GLuint program) override;

    std::optional<GLint> get_uniform_location(GLuint program, const std::string& name) override;
    void uniform_1f(GLint location, float value) override;
    void uniform_1i(GLint location, int value) override;

    GLuint create_vertex_array() override;
    void bind_vertex_array(GLuint vao) override;
    void delete_vertex_array(GLuint vao) override;
    GLuint create_buffer() override;
    void bind_buffer(GLenum target, GLuint buffer) override;
    void buffer_data(GLenum target, std::span<const std::byte> data, GLenum usage) override;
    void delete_buffer(GLuint buffer) override;
    void vertex_attrib_pointer_f32(GLuint index, GLint size, GLenum type, bool normalized,
                                   GLsizei stride, GLintptr offset) override;
    void enable_vertex_attrib_array(GLuint index) override;

    GLuint create_texture() override;
    void active_texture(GLenum unit) override;
    void bind_texture(GLenum target, GLuint texture) override;
    void tex_parameter_i32(GLenum target, GLenum parameter, GLint value) override;
    void tex_image_2d(GLenum target, GLint level, GLint internal_format, GLsizei width,
                      GLsizei height, GLenum format, GLenum type,
                      std::span<const std::byte> pixels) override;
    void pixel_store_i32(GLenum parameter, GLint value) override;
    void generate_mipmap(GLenum target) override;
    void delete_texture(GLuint texture) override;

    GLuint create_framebuffer() override;
    void bind_framebuffer(GLenum target, GLuint framebuffer) override;
    void delete_framebuffer(GLuint framebuffer) override;
    GLuint create_renderbuffer() override;
    void bind_renderbuffer(GLenum target, GLuint renderbuffer) override;
    void renderbuffer_storage(GLenum target, GLenum internal_format, GLsizei width,
                              GLsizei height) override;
    void delete_renderbuffer(GLuint renderbuffer) override;
    void framebuffer_renderbuffer(GLenum target, GLenum attachment, GLenum renderbuffer_target,
                                  GLuint renderbuffer) override;
    GLenum check_framebuffer_status(GLenum target) override;
    void blit_framebuffer(GLint src_x0, GLint src_y0, GLint src_x1, GLint src_y1,
                          GLint dst_x0, GLint dst_y0, GLint dst_x1, GLint dst_y1,
                          GLbitfield mask, GLenum filter) override;

    void clear_color(float r, float g, float b, float a) override;
    void clear(GLbitfield mask) override;
    void viewport(GLint x, GLint y, GLsizei width, GLsizei height) override;
    void draw_arrays(GLenum mode, GLint first, GLsizei count) override;
    void draw_elements(GLenum mode, GLsizei count, GLenum type, GLintptr offset) override;

    GLenum get_error() override;
    void finish() override;

    void make_current(ContextRole role) override;
    Extent drawable_size() const override;

private:
    GLFWwindow* surface_window;
    GLFWwindow* root_window;
};

#endif // GLEW_CONTEXT_H
