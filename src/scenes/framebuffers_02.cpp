#include "scenes.h"

void Framebuffers02::init(GLContext& gl) {
    // The root context owns the render target
    gl.make_current(ContextRole::Root);
    root_target = oglutil::create_color_target(gl, OFFSCREEN_WIDTH, OFFSCREEN_HEIGHT);

    // root_target.framebuffer means nothing on the surface context; only the
    // renderbuffer is shared, so the surface gets its own framebuffer for it
    gl.make_current(ContextRole::Surface);
    surface_read_framebuffer = oglutil::attach_renderbuffer_for_read(gl, root_target.renderbuffer);
}

void Framebuffers02::draw(GLContext& gl) {
    gl.make_current(ContextRole::Root);
    gl.bind_framebuffer(GL_DRAW_FRAMEBUFFER, root_target.framebuffer);
    gl.clear_color(1.0f, 0.0f, 0.0f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);
    oglutil::check_gl_error(gl, "root context clear");

    // Rendering must land in the renderbuffer before another context reads it
    gl.finish();

    gl.make_current(ContextRole::Surface);
    oglutil::blit_to_default(gl, surface_read_framebuffer,
                             {root_target.width, root_target.height}, gl.drawable_size());
    oglutil::check_gl_error(gl, "surface context blit");
}

void Framebuffers02::exit(GLContext& gl) {
    gl.make_current(ContextRole::Surface);
    gl.delete_framebuffer(surface_read_framebuffer);

    gl.make_current(ContextRole::Root);
    gl.delete_framebuffer(root_target.framebuffer);
    gl.delete_renderbuffer(root_target.renderbuffer);

    gl.make_current(ContextRole::Surface);
}
