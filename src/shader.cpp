#include "shader.h"
#include "gl_error.h"
#include "oglutil.h"
#include "utils.h"

Shader::Shader(GLContext& gl, const std::string& vertex_path, const std::string& fragment_path)
    : Shader(gl, utl::read_file(vertex_path), utl::read_file(fragment_path), FromSource{})
{
}

Shader::Shader(GLContext& gl, const std::string& vertex_src, const std::string& fragment_src,
               FromSource)
    : gl(&gl)
{
    GLuint vertex_shader = oglutil::compile_shader(gl, GL_VERTEX_SHADER, vertex_src);

    GLuint fragment_shader = 0;
    try {
        fragment_shader = oglutil::compile_shader(gl, GL_FRAGMENT_SHADER, fragment_src);
        program = oglutil::link_program(gl, vertex_shader, fragment_shader);
    } catch (const GfxError&) {
        gl.delete_shader(vertex_shader);
        if (fragment_shader)
            gl.delete_shader(fragment_shader);
        throw;
    }

    // Linked into the program, the stage objects are no longer needed
    gl.delete_shader(vertex_shader);
    gl.delete_shader(fragment_shader);
}

Shader Shader::from_source(GLContext& gl, const std::string& vertex_src,
                           const std::string& fragment_src) {
    return Shader(gl, vertex_src, fragment_src, FromSource{});
}

void Shader::use() const {
    gl->use_program(program);
}

std::optional<GLint> Shader::uniform(const std::string& name) const {
    return gl->get_uniform_location(program, name);
}

GLint Shader::require_uniform(const std::string& name) const {
    if (auto location = uniform(name))
        return *location;
    throw GfxError(ErrorKind::MissingUniform, "No active uniform named '" + name + "'");
}

void Shader::set_float(GLint location, float value) const {
    gl->uniform_1f(location, value);
}

void Shader::set_int(GLint location, int value) const {
    gl->uniform_1i(location, value);
}

void Shader::destroy() {
    if (program) {
        gl->delete_program(program);
        program = 0;
    }
}
