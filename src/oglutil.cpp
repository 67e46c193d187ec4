#include <format>
#include <iostream>
#include <print>

#include <oglutil.h>

#include "gl_error.h"
#include "image.h"

namespace oglutil {

namespace {

const char *stage_name(GLenum type) {
  return type == GL_VERTEX_SHADER ? "vertex" : type == GL_FRAGMENT_SHADER ? "fragment" : "other";
}

} // namespace

void describe_layout(GLContext &gl, std::span<const VertexAttribute> layout) {
  for (const VertexAttribute &attr : layout) {
    gl.vertex_attrib_pointer_f32(attr.location, attr.components, attr.type, false, attr.stride,
                                 attr.offset);
    gl.enable_vertex_attrib_array(attr.location);
  }
}

GLuint compile_shader(GLContext &gl, GLenum type, std::string_view source) {
  GLuint shader = gl.create_shader(type);
  gl.shader_source(shader, source);
  gl.compile_shader(shader);

  if (!gl.get_shader_compile_status(shader)) {
    std::string log = gl.get_shader_info_log(shader);
    gl.delete_shader(shader);
    throw GfxError(ErrorKind::ShaderCompile,
                   std::format("{} shader: {}", stage_name(type), log.empty() ? "(no info log)" : log));
  }

  // Drivers put warnings in the info log of shaders that compiled fine.
  std::string warnings = gl.get_shader_info_log(shader);
  if (!warnings.empty())
    std::println(std::cerr, "WARNING::SHADER: {} shader: {}", stage_name(type), warnings);

  return shader;
}

GLuint link_program(GLContext &gl, GLuint vertex_shader, GLuint fragment_shader) {
  GLuint program = gl.create_program();
  gl.attach_shader(program, vertex_shader);
  gl.attach_shader(program, fragment_shader);
  gl.link_program(program);

  if (!gl.get_program_link_status(program)) {
    std::string log = gl.get_program_info_log(program);
    gl.delete_program(program);
    throw GfxError(ErrorKind::ProgramLink, log.empty() ? "(no info log)" : log);
  }

  gl.detach_shader(program, vertex_shader);
  gl.detach_shader(program, fragment_shader);
  return program;
}

GLenum pixel_format_for(int channels) {
  switch (channels) {
  case 3:
    return GL_RGB;
  case 4:
    return GL_RGBA;
  default:
    throw GfxError(ErrorKind::UnsupportedImageFormat,
                   std::format("{} channel images are not supported", channels));
  }
}

GLuint load_texture(GLContext &gl, GLenum unit, const std::string &path) {
  Image img = load_image(path);
  GLenum format = pixel_format_for(img.channels);

  gl.active_texture(unit);
  GLuint texture = gl.create_texture();
  gl.bind_texture(GL_TEXTURE_2D, texture);

  gl.tex_parameter_i32(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
  gl.tex_parameter_i32(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_REPEAT);
  gl.tex_parameter_i32(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  gl.tex_parameter_i32(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

  // RGB rows are not 4-byte aligned for odd widths.
  gl.pixel_store_i32(GL_UNPACK_ALIGNMENT, 1);
  gl.tex_image_2d(GL_TEXTURE_2D, 0, static_cast<GLint>(format), img.width, img.height, format,
                  GL_UNSIGNED_BYTE, std::as_bytes(std::span<const unsigned char>(img.pixels)));
  gl.generate_mipmap(GL_TEXTURE_2D);

  std::println("Loaded texture {} ({}x{}, {} channels) on unit {}", path, img.width, img.height,
               img.channels, unit - GL_TEXTURE0);
  return texture;
}

ColorTarget create_color_target(GLContext &gl, GLsizei width, GLsizei height) {
  ColorTarget target;
  target.width = width;
  target.height = height;

  target.framebuffer = gl.create_framebuffer();
  gl.bind_framebuffer(GL_DRAW_FRAMEBUFFER, target.framebuffer);

  target.renderbuffer = gl.create_renderbuffer();
  gl.bind_renderbuffer(GL_RENDERBUFFER, target.renderbuffer);
  gl.renderbuffer_storage(GL_RENDERBUFFER, GL_RGB8, width, height);

  gl.framebuffer_renderbuffer(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER,
                              target.renderbuffer);
  check_framebuffer_complete(gl, GL_DRAW_FRAMEBUFFER);
  return target;
}

// Framebuffers are per context; renderbuffers are shared. A context that did
// not create the target reads it through its own framebuffer.
GLuint attach_renderbuffer_for_read(GLContext &gl, GLuint renderbuffer) {
  GLuint framebuffer = gl.create_framebuffer();
  gl.bind_framebuffer(GL_READ_FRAMEBUFFER, framebuffer);
  gl.framebuffer_renderbuffer(GL_READ_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER,
                              renderbuffer);
  check_framebuffer_complete(gl, GL_READ_FRAMEBUFFER);
  return framebuffer;
}

void check_framebuffer_complete(GLContext &gl, GLenum target) {
  GLenum status = gl.check_framebuffer_status(target);
  if (status != GL_FRAMEBUFFER_COMPLETE)
    throw GfxError(ErrorKind::FramebufferIncomplete,
                   std::format("Framebuffer status 0x{:04X}", status));
}

void blit_to_default(GLContext &gl, GLuint read_framebuffer, Extent source, Extent destination) {
  gl.bind_framebuffer(GL_READ_FRAMEBUFFER, read_framebuffer);
  gl.bind_framebuffer(GL_DRAW_FRAMEBUFFER, 0);
  gl.blit_framebuffer(0, 0, source.width, source.height, 0, 0, destination.width,
                      destination.height, GL_COLOR_BUFFER_BIT, GL_LINEAR);
}

void check_gl_error(GLContext &gl, const char *where) {
  GLenum code = gl.get_error();
  if (code == GL_NO_ERROR)
    return;
  throw GfxError(ErrorKind::GLError,
                 std::format("{}: {} (0x{:04X})", where, to_string(decode_gl_error(code)), code));
}

} // namespace oglutil
