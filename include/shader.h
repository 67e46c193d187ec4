#ifndef SHADER_H
#define SHADER_H

#include <GL/glew.h>

#include <optional>
#include <string>

#include "gl_context.h"

// A linked vertex + fragment program built from two GLSL files.
class Shader {
public:
    Shader(GLContext& gl, const std::string& vertex_path, const std::string& fragment_path);

    static Shader from_source(GLContext& gl, const std::string& vertex_src,
                              const std::string& fragment_src);

    void use() const;
    GLuint id() const { return program; }

    // nullopt when the program has no active uniform called name.
    std::optional<GLint> uniform(const std::string& name) const;
    // Same lookup, but a missing uniform is a GfxError(MissingUniform).
    GLint require_uniform(const std::string& name) const;

    void set_float(GLint location, float value) const;
    void set_int(GLint location, int value) const;

    void destroy();

private:
    struct FromSource {};
    Shader(GLContext& gl, const std::string& vertex_src, const std::string& fragment_src, FromSource);

    GLContext* gl;
    GLuint program = 0;
};

#endif // SHADER_H
