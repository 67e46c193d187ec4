#ifndef GL_CONTEXT_H
#define GL_CONTEXT_H

#include <GL/glew.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// Which of the window's contexts should be current. Root only exists when the
// app was created with a shared offscreen context.
enum class ContextRole {
    Surface,
    Root,
};

struct Extent {
    int width = 0;
    int height = 0;
};

// The GL entry points used by scenes and helpers. GLEWContext forwards to the
// loaded driver functions; tests substitute a recorder.
class GLContext {
public:
    virtual ~GLContext() = default;

    // Shaders and programs
    virtual GLuint create_shader(GLenum type) = 0;
    virtual void shader_source(GLuint shader, std::string_view source) = 0;
    virtual void compile_shader(GLuint shader) = 0;
    virtual bool get_shader_compile_status(GLuint shader) = 0;
    virtual std::string get_shader_info_log(GLuint shader) = 0;
    virtual void delete_shader(GLuint shader) = 0;

    virtual GLuint create_program() = 0;
    virtual void attach_shader(GLuint program, GLuint shader) = 0;
    virtual void detach_shader(GLuint program, GLuint shader) = 0;
    virtual void link_program(GLuint program) = 0;
    virtual bool get_program_link_status(GLuint program) = 0;
    virtual std::string get_program_info_log(GLuint program) = 0;
    virtual void use_program(GLuint program) = 0;
    virtual void delete_program(GLuint program) = 0;

    // Returns nullopt when the program has no active uniform of that name.
    virtual std::optional<GLint> get_uniform_location(GLuint program, const std::string& name) = 0;
    virtual void uniform_1f(GLint location, float value) = 0;
    virtual void uniform_1i(GLint location, int value) = 0;

    // Vertex state
    virtual GLuint create_vertex_array() = 0;
    virtual void bind_vertex_array(GLuint vao) = 0;
    virtual void delete_vertex_array(GLuint vao) = 0;
    virtual GLuint create_buffer() = 0;
    virtual void bind_buffer(GLenum target, GLuint buffer) = 0;
    virtual void buffer_data(GLenum target, std::span<const std::byte> data, GLenum usage) = 0;
    virtual void delete_buffer(GLuint buffer) = 0;
    virtual void vertex_attrib_pointer_f32(GLuint index, GLint size, GLenum type, bool normalized,
                                           GLsizei stride, GLintptr offset) = 0;
    virtual void enable_vertex_attrib_array(GLuint index) = 0;

    // Textures
    virtual GLuint create_texture() = 0;
    virtual void active_texture(GLenum unit) = 0;
    virtual void bind_texture(GLenum target, GLuint texture) = 0;
    virtual void tex_parameter_i32(GLenum target, GLenum parameter, GLint value) = 0;
    virtual void tex_image_2d(GLenum target, GLint level, GLint internal_format, GLsizei width,
                              GLsizei height, GLenum format, GLenum type,
                              std::span<const std::byte> pixels) = 0;
    virtual void pixel_store_i32(GLenum parameter, GLint value) = 0;
    virtual void generate_mipmap(GLenum target) = 0;
    virtual void delete_texture(GLuint texture) = 0;

    // Framebuffers
    virtual GLuint create_framebuffer() = 0;
    virtual void bind_framebuffer(GLenum target, GLuint framebuffer) = 0;
    virtual void delete_framebuffer(GLuint framebuffer) = 0;
    virtual GLuint create_renderbuffer() = 0;
    virtual void bind_renderbuffer(GLenum target, GLuint renderbuffer) = 0;
    virtual void renderbuffer_storage(GLenum target, GLenum internal_format, GLsizei width,
                                      GLsizei height) = 0;
    virtual void delete_renderbuffer(GLuint renderbuffer) = 0;
    virtual void framebuffer_renderbuffer(GLenum target, GLenum attachment,
                                          GLenum renderbuffer_target, GLuint renderbuffer) = 0;
    virtual GLenum check_framebuffer_status(GLenum target) = 0;
    virtual void blit_framebuffer(GLint src_x0, GLint src_y0, GLint src_x1, GLint src_y1,
                                  GLint dst_x0, GLint dst_y0, GLint dst_x1, GLint dst_y1,
                                  GLbitfield mask, GLenum filter) = 0;

    // Drawing
    virtual void clear_color(float r, float g, float b, float a) = 0;
    virtual void clear(GLbitfield mask) = 0;
    virtual void viewport(GLint x, GLint y, GLsizei width, GLsizei height) = 0;
    virtual void draw_arrays(GLenum mode, GLint first, GLsizei count) = 0;
    virtual void draw_elements(GLenum mode, GLsizei count, GLenum type, GLintptr offset) = 0;

    virtual GLenum get_error() = 0;
    virtual void finish() = 0;

    // Context management
    virtual void make_current(ContextRole role) = 0;
    virtual Extent drawable_size() const = 0;
};

#endif // GL_CONTEXT_H
