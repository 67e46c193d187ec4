#ifndef GL_ERROR_H
#define GL_ERROR_H

#include <stdexcept>
#include <string>
#include <string_view>

// Failure classes surfaced by the GL helpers and the window bootstrap.
enum class ErrorKind {
    ContextCreation,
    LoaderInit,
    ResourceCreation,
    ShaderCompile,
    ProgramLink,
    MissingUniform,
    AssetLoad,
    UnsupportedImageFormat,
    FramebufferIncomplete,
    GLError,
};

// Decoded glGetError() values.
enum class GLErrorCode {
    NoError,
    InvalidEnum,
    InvalidValue,
    InvalidOperation,
    InvalidFramebufferOperation,
    OutOfMemory,
    Unknown,
};

GLErrorCode decode_gl_error(unsigned int code);

std::string_view to_string(ErrorKind kind);
std::string_view to_string(GLErrorCode code);

class GfxError : public std::runtime_error {
public:
    GfxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), error_kind(kind) {}

    ErrorKind kind() const { return error_kind; }

private:
    ErrorKind error_kind;
};

#endif // GL_ERROR_H
