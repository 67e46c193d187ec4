#include "scenes.h"

void Framebuffers01::init(GLContext& gl) {
    target = oglutil::create_color_target(gl, OFFSCREEN_WIDTH, OFFSCREEN_HEIGHT);
}

void Framebuffers01::draw(GLContext& gl) {
    gl.bind_framebuffer(GL_DRAW_FRAMEBUFFER, target.framebuffer);
    gl.clear_color(1.0f, 0.0f, 0.0f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);

    oglutil::blit_to_default(gl, target.framebuffer, {target.width, target.height},
                             gl.drawable_size());
    oglutil::check_gl_error(gl, "framebuffer blit");
}

void Framebuffers01::exit(GLContext& gl) {
    gl.delete_framebuffer(target.framebuffer);
    gl.delete_renderbuffer(target.renderbuffer);
}
