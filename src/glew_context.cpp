#include <GL/glew.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <cstdint>

#include "gl_error.h"
#include "glew_context.h"

namespace {

// glGen* and glCreate* hand back 0 when the driver could not allocate a name.
GLuint checked_name(GLuint name, const char* what) {
    if (name == 0)
        throw GfxError(ErrorKind::ResourceCreation, std::string("Failed to create ") + what);
    return name;
}

const void* offset_pointer(GLintptr offset) {
    return reinterpret_cast<const void*>(static_cast<std::uintptr_t>(offset));
}

} // namespace

GLEWContext::GLEWContext(GLFWwindow* surface_window, GLFWwindow* root_window)
    : surface_window(surface_window),
      root_window(root_window)
{
}

// ------------------------------------------------------------
// Shaders and programs
// ------------------------------------------------------------

GLuint GLEWContext::create_shader(GLenum type) {
    return checked_name(glCreateShader(type), "shader");
}

void GLEWContext::shader_source(GLuint shader, std::string_view source) {
    const GLchar* text = source.data();
    const GLint length = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &text, &length);
}

void GLEWContext::compile_shader(GLuint shader) {
    glCompileShader(shader);
}

bool GLEWContext::get_shader_compile_status(GLuint shader) {
    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    return ok == GL_TRUE;
}

std::string GLEWContext::get_shader_info_log(GLuint shader) {
    GLint len = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1)
        return {};
    std::string log(static_cast<size_t>(len), '\0');
    GLsizei written = 0;
    glGetShaderInfoLog(shader, len, &written, log.data());
    log.resize(static_cast<size_t>(written));
    return log;
}

void GLEWContext::delete_shader(GLuint shader) {
    glDeleteShader(shader);
}

GLuint GLEWContext::create_program() {
    return checked_name(glCreateProgram(), "program");
}

void GLEWContext::attach_shader(GLuint program, GLuint shader) {
    glAttachShader(program, shader);
}

void GLEWContext::detach_shader(GLuint program, GLuint shader) {
    glDetachShader(program, shader);
}

void GLEWContext::link_program(GLuint program) {
    glLinkProgram(program);
}

bool GLEWContext::get_program_link_status(GLuint program) {
    GLint ok = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    return ok == GL_TRUE;
}

std::string GLEWContext::get_program_info_log(GLuint program) {
    GLint len = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1)
        return {};
    std::string log(static_cast<size_t>(len), '\0');
    GLsizei written = 0;
    glGetProgramInfoLog(program, len, &written, log.data());
    log.resize(static_cast<size_t>(written));
    return log;
}

void GLEWContext::use_program(GLuint program) {
    glUseProgram(program);
}

void GLEWContext::delete_program(GLuint program) {
    glDeleteProgram(program);
}

std::optional<GLint> GLEWContext::get_uniform_location(GLuint program, const std::string& name) {
    GLint location = glGetUniformLocation(program, name.c_str());
    if (location < 0)
        return std::nullopt;
    return location;
}

void GLEWContext::uniform_1f(GLint location, float value) {
    glUniform1f(location, value);
}

void GLEWContext::uniform_1i(GLint location, int value) {
    glUniform1i(location, value);
}

// ------------------------------------------------------------
// Vertex state
// ------------------------------------------------------------

GLuint GLEWContext::create_vertex_array() {
    GLuint vao = 0;
    glGenVertexArrays(1, &vao);
    return checked_name(vao, "vertex array");
}

void GLEWContext::bind_vertex_array(GLuint vao) {
    glBindVertexArray(vao);
}

void GLEWContext::delete_vertex_array(GLuint vao) {
    glDeleteVertexArrays(1, &vao);
}

GLuint GLEWContext::create_buffer() {
    GLuint buffer = 0;
    glGenBuffers(1, &buffer);
    return checked_name(buffer, "buffer");
}

void GLEWContext::bind_buffer(GLenum target, GLuint buffer) {
    glBindBuffer(target, buffer);
}

void GLEWContext::buffer_data(GLenum target, std::span<const std::byte> data, GLenum usage) {
    glBufferData(target, static_cast<GLsizeiptr>(data.size()), data.data(), usage);
}

void GLEWContext::delete_buffer(GLuint buffer) {
    glDeleteBuffers(1, &buffer);
}

void GLEWContext::vertex_attrib_pointer_f32(GLuint index, GLint size, GLenum type, bool normalized,
                                            GLsizei stride, GLintptr offset) {
    glVertexAttribPointer(index, size, type, normalized ? GL_TRUE : GL_FALSE, stride,
                          offset_pointer(offset));
}

void GLEWContext::enable_vertex_attrib_array(GLuint index) {
    glEnableVertexAttribArray(index);
}

// ------------------------------------------------------------
// Textures
// ------------------------------------------------------------

GLuint GLEWContext::create_texture() {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    return checked_name(texture, "texture");
}

void GLEWContext::active_texture(GLenum unit) {
    glActiveTexture(unit);
}

void GLEWContext::bind_texture(GLenum target, GLuint texture) {
    glBindTexture(target, texture);
}

void GLEWContext::tex_parameter_i32(GLenum target, GLenum parameter, GLint value) {
    glTexParameteri(target, parameter, value);
}

void GLEWContext::tex_image_2d(GLenum target, GLint level, GLint internal_format, GLsizei width,
                               GLsizei height, GLenum format, GLenum type,
                               std::span<const std::byte> pixels) {
    glTexImage2D(target, level, internal_format, width, height, 0, format, type,
                 pixels.empty() ? nullptr : pixels.data());
}

void GLEWContext::pixel_store_i32(GLenum parameter, GLint value) {
    glPixelStorei(parameter, value);
}

void GLEWContext::generate_mipmap(GLenum target) {
    glGenerateMipmap(target);
}

void GLEWContext::delete_texture(GLuint texture) {
    glDeleteTextures(1, &texture);
}

// ------------------------------------------------------------
// Framebuffers
// ------------------------------------------------------------

GLuint GLEWContext::create_framebuffer() {
    GLuint framebuffer = 0;
    glGenFramebuffers(1, &framebuffer);
    return checked_name(framebuffer, "framebuffer");
}

void GLEWContext::bind_framebuffer(GLenum target, GLuint framebuffer) {
    glBindFramebuffer(target, framebuffer);
}

void GLEWContext::delete_framebuffer(GLuint framebuffer) {
    glDeleteFramebuffers(1, &framebuffer);
}

GLuint GLEWContext::create_renderbuffer() {
    GLuint renderbuffer = 0;
    glGenRenderbuffers(1, &renderbuffer);
    return checked_name(renderbuffer, "renderbuffer");
}

void GLEWContext::bind_renderbuffer(GLenum target, GLuint renderbuffer) {
    glBindRenderbuffer(target, renderbuffer);
}

void GLEWContext::renderbuffer_storage(GLenum target, GLenum internal_format, GLsizei width,
                                       GLsizei height) {
    glRenderbufferStorage(target, internal_format, width, height);
}

void GLEWContext::delete_renderbuffer(GLuint renderbuffer) {
    glDeleteRenderbuffers(1, &renderbuffer);
}

void GLEWContext::framebuffer_renderbuffer(GLenum target, GLenum attachment,
                                           GLenum renderbuffer_target, GLuint renderbuffer) {
    glFramebufferRenderbuffer(target, attachment, renderbuffer_target, renderbuffer);
}

GLenum GLEWContext::check_framebuffer_status(GLenum target) {
    return glCheckFramebufferStatus(target);
}

void GLEWContext::blit_framebuffer(GLint src_x0, GLint src_y0, GLint src_x1, GLint src_y1,
                                   GLint dst_x0, GLint dst_y0, GLint dst_x1, GLint dst_y1,
                                   GLbitfield mask, GLenum filter) {
    glBlitFramebuffer(src_x0, src_y0, src_x1, src_y1, dst_x0, dst_y0, dst_x1, dst_y1, mask,
                      filter);
}

// ------------------------------------------------------------
// Drawing
// ------------------------------------------------------------

void GLEWContext::clear_color(float r, float g, float b, float a) {
    glClearColor(r, g, b, a);
}

void GLEWContext::clear(GLbitfield mask) {
    glClear(mask);
}

void GLEWContext::viewport(GLint x, GLint y, GLsizei width, GLsizei height) {
    glViewport(x, y, width, height);
}

void GLEWContext::draw_arrays(GLenum mode, GLint first, GLsizei count) {
    glDrawArrays(mode, first, count);
}

void GLEWContext::draw_elements(GLenum mode, GLsizei count, GLenum type, GLintptr offset) {
    glDrawElements(mode, count, type, offset_pointer(offset));
}

GLenum GLEWContext::get_error() {
    return glGetError();
}

void GLEWContext::finish() {
    glFinish();
}

// ------------------------------------------------------------
// Context management
// ------------------------------------------------------------

void GLEWContext::make_current(ContextRole role) {
    if (role == ContextRole::Root) {
        if (!root_window)
            throw GfxError(ErrorKind::ContextCreation, "No root context was created for this window");
        glfwMakeContextCurrent(root_window);
        return;
    }
    glfwMakeContextCurrent(surface_window);
}

Extent GLEWContext::drawable_size() const {
    Extent size;
    glfwGetFramebufferSize(surface_window, &size.width, &size.height);
    return size;
}
