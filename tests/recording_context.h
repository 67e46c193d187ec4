#ifndef RECORDING_CONTEXT_H
#define RECORDING_CONTEXT_H

#include "gl_context.h"

#include <array>
#include <deque>
#include <map>
#include <string>
#include <vector>

// GLContext that keeps a log of what was asked of it instead of talking to a
// driver. Object names are handed out sequentially from 1.
class RecordingContext : public GLContext {
public:
    struct BufferUpload {
        GLenum target;
        GLuint buffer;
        std::vector<std::byte> bytes;
        GLenum usage;
    };

    struct DrawElements {
        GLenum mode;
        GLsizei count;
        GLenum type;
        GLintptr offset;
    };

    struct Blit {
        GLuint read_framebuffer;
        GLuint draw_framebuffer;
        ContextRole role;
        std::array<GLint, 8> rect;
        GLbitfield mask;
        GLenum filter;
    };

    struct Attribute {
        GLuint index;
        GLint size;
        GLenum type;
        GLsizei stride;
        GLintptr offset;
        bool enabled;
    };

    // Knobs
    bool compile_ok = true;
    bool link_ok = true;
    std::string shader_log;
    std::string program_log;
    std::map<std::string, GLint> uniforms;
    GLenum framebuffer_status = GL_FRAMEBUFFER_COMPLETE;
    std::deque<GLenum> pending_errors;
    Extent surface_size{1024, 768};

    // Record
    std::vector<std::string> calls;
    std::vector<std::array<GLint, 4>> viewports;
    std::vector<BufferUpload> uploads;
    std::vector<DrawElements> element_draws;
    std::vector<std::array<GLint, 3>> array_draws;
    std::vector<Blit> blits;
    std::vector<Attribute> attributes;
    std::map<GLint, float> float_uniforms;
    std::map<GLint, int> int_uniforms;
    std::map<GLuint, ContextRole> framebuffer_owner;
    std::vector<GLuint> deleted_framebuffers;
    std::vector<ContextRole> context_switches;
    ContextRole current = ContextRole::Surface;
    int textures_uploaded = 0;

    GLuint create_shader(GLenum) override { calls.push_back("create_shader"); return next(); }
    void shader_source(GLuint, std::string_view) override { calls.push_back("shader_source"); }
    void compile_shader(GLuint) override { calls.push_back("compile_shader"); }
    bool get_shader_compile_status(GLuint) override { return compile_ok; }
    std::string get_shader_info_log(GLuint) override { return shader_log; }
    void delete_shader(GLuint) override { calls.push_back("delete_shader"); }

    GLuint create_program() override { calls.push_back("create_program"); return next(); }
    void attach_shader(GLuint, GLuint) override { calls.push_back("attach_shader"); }
    void detach_shader(GLuint, GLuint) override { calls.push_back("detach_shader"); }
    void link_program(GLuint) override { calls.push_back("link_program"); }
    bool get_program_link_status(GLuint) override { return link_ok; }
    std::string get_program_info_log(GLuint) override { return program_log; }
    void use_program(GLuint) override { calls.push_back("use_program"); }
    void delete_program(GLuint) override { calls.push_back("delete_program"); }

    std::optional<GLint> get_uniform_location(GLuint, const std::string& name) override {
        auto it = uniforms.find(name);
        if (it == uniforms.end())
            return std::nullopt;
        return it->second;
    }
    void uniform_1f(GLint location, float value) override { float_uniforms[location] = value; }
    void uniform_1i(GLint location, int value) override { int_uniforms[location] = value; }

    GLuint create_vertex_array() override { calls.push_back("create_vertex_array"); return next(); }
    void bind_vertex_array(GLuint) override { calls.push_back("bind_vertex_array"); }
    void delete_vertex_array(GLuint) override { calls.push_back("delete_vertex_array"); }
    GLuint create_buffer() override { calls.push_back("create_buffer"); return next(); }
    void bind_buffer(GLenum target, GLuint buffer) override {
        calls.push_back("bind_buffer");
        bound_buffers[target] = buffer;
    }
    void buffer_data(GLenum target, std::span<const std::byte> data, GLenum usage) override {
        calls.push_back("buffer_data");
        uploads.push_back({target, bound_buffers[target], {data.begin(), data.end()}, usage});
    }
    void delete_buffer(GLuint) override { calls.push_back("delete_buffer"); }
    void vertex_attrib_pointer_f32(GLuint index, GLint size, GLenum type, bool, GLsizei stride,
                                   GLintptr offset) override {
        attributes.push_back({index, size, type, stride, offset, false});
    }
    void enable_vertex_attrib_array(GLuint index) override {
        for (auto& attr : attributes)
            if (attr.index == index)
                attr.enabled = true;
    }

    GLuint create_texture() override { calls.push_back("create_texture"); return next(); }
    void active_texture(GLenum) override { calls.push_back("active_texture"); }
    void bind_texture(GLenum, GLuint) override { calls.push_back("bind_texture"); }
    void tex_parameter_i32(GLenum, GLenum, GLint) override { calls.push_back("tex_parameter"); }
    void tex_image_2d(GLenum, GLint, GLint, GLsizei, GLsizei, GLenum, GLenum,
                      std::span<const std::byte>) override {
        calls.push_back("tex_image_2d");
        ++textures_uploaded;
    }
    void pixel_store_i32(GLenum, GLint) override { calls.push_back("pixel_store"); }
    void generate_mipmap(GLenum) override { calls.push_back("generate_mipmap"); }
    void delete_texture(GLuint) override { calls.push_back("delete_texture"); }

    GLuint create_framebuffer() override {
        calls.push_back("create_framebuffer");
        GLuint name = next();
        framebuffer_owner[name] = current;
        return name;
    }
    void bind_framebuffer(GLenum target, GLuint framebuffer) override {
        calls.push_back("bind_framebuffer");
        if (target == GL_READ_FRAMEBUFFER || target == GL_FRAMEBUFFER)
            read_framebuffer = framebuffer;
        if (target == GL_DRAW_FRAMEBUFFER || target == GL_FRAMEBUFFER)
            draw_framebuffer = framebuffer;
    }
    void delete_framebuffer(GLuint framebuffer) override {
        calls.push_back("delete_framebuffer");
        deleted_framebuffers.push_back(framebuffer);
    }
    GLuint create_renderbuffer() override { calls.push_back("create_renderbuffer"); return next(); }
    void bind_renderbuffer(GLenum, GLuint) override { calls.push_back("bind_renderbuffer"); }
    void renderbuffer_storage(GLenum, GLenum, GLsizei, GLsizei) override {
        calls.push_back("renderbuffer_storage");
    }
    void delete_renderbuffer(GLuint) override { calls.push_back("delete_renderbuffer"); }
    void framebuffer_renderbuffer(GLenum, GLenum, GLenum, GLuint) override {
        calls.push_back("framebuffer_renderbuffer");
    }
    GLenum check_framebuffer_status(GLenum) override { return framebuffer_status; }
    void blit_framebuffer(GLint sx0, GLint sy0, GLint sx1, GLint sy1, GLint dx0, GLint dy0,
                          GLint dx1, GLint dy1, GLbitfield mask, GLenum filter) override {
        calls.push_back("blit_framebuffer");
        blits.push_back({read_framebuffer, draw_framebuffer, current,
                         {sx0, sy0, sx1, sy1, dx0, dy0, dx1, dy1}, mask, filter});
    }

    void clear_color(float, float, float, float) override { calls.push_back("clear_color"); }
    void clear(GLbitfield) override { calls.push_back("clear"); }
    void viewport(GLint x, GLint y, GLsizei width, GLsizei height) override {
        viewports.push_back({x, y, width, height});
    }
    void draw_arrays(GLenum mode, GLint first, GLsizei count) override {
        calls.push_back("draw_arrays");
        array_draws.push_back({static_cast<GLint>(mode), first, count});
    }
    void draw_elements(GLenum mode, GLsizei count, GLenum type, GLintptr offset) override {
        calls.push_back("draw_elements");
        element_draws.push_back({mode, count, type, offset});
    }

    GLenum get_error() override {
        if (pending_errors.empty())
            return GL_NO_ERROR;
        GLenum code = pending_errors.front();
        pending_errors.pop_front();
        return code;
    }
    void finish() override { calls.push_back("finish"); }

    void make_current(ContextRole role) override {
        calls.push_back(role == ContextRole::Root ? "make_current_root" : "make_current_surface");
        context_switches.push_back(role);
        current = role;
    }
    Extent drawable_size() const override { return surface_size; }

    int count(const std::string& name) const {
        int n = 0;
        for (const auto& c : calls)
            if (c == name)
                ++n;
        return n;
    }

private:
    GLuint next() { return ++last_name; }

    GLuint last_name = 0;
    GLuint read_framebuffer = 0;
    GLuint draw_framebuffer = 0;
    std::map<GLenum, GLuint> bound_buffers;
};

#endif // RECORDING_CONTEXT_H
