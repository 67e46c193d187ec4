#include <GL/glew.h>

#include "gl_error.h"

GLErrorCode decode_gl_error(unsigned int code) {
    switch (code) {
        case GL_NO_ERROR:                      return GLErrorCode::NoError;
        case GL_INVALID_ENUM:                  return GLErrorCode::InvalidEnum;
        case GL_INVALID_VALUE:                 return GLErrorCode::InvalidValue;
        case GL_INVALID_OPERATION:             return GLErrorCode::InvalidOperation;
        case GL_INVALID_FRAMEBUFFER_OPERATION: return GLErrorCode::InvalidFramebufferOperation;
        case GL_OUT_OF_MEMORY:                 return GLErrorCode::OutOfMemory;
        default:                               return GLErrorCode::Unknown;
    }
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ContextCreation:        return "CONTEXT";
        case ErrorKind::LoaderInit:             return "GLEW";
        case ErrorKind::ResourceCreation:       return "RESOURCE";
        case ErrorKind::ShaderCompile:          return "SHADER::COMPILE";
        case ErrorKind::ProgramLink:            return "SHADER::LINK";
        case ErrorKind::MissingUniform:         return "SHADER::UNIFORM";
        case ErrorKind::AssetLoad:              return "ASSET";
        case ErrorKind::UnsupportedImageFormat: return "IMAGE::FORMAT";
        case ErrorKind::FramebufferIncomplete:  return "FRAMEBUFFER";
        case ErrorKind::GLError:                return "GL";
    }
    return "UNKNOWN";
}

std::string_view to_string(GLErrorCode code) {
    switch (code) {
        case GLErrorCode::NoError:                     return "NoError";
        case GLErrorCode::InvalidEnum:                 return "InvalidEnum";
        case GLErrorCode::InvalidValue:                return "InvalidValue";
        case GLErrorCode::InvalidOperation:            return "InvalidOperation";
        case GLErrorCode::InvalidFramebufferOperation: return "InvalidFramebufferOperation";
        case GLErrorCode::OutOfMemory:                 return "OutOfMemory";
        case GLErrorCode::Unknown:                     return "Unknown";
    }
    return "Unknown";
}
