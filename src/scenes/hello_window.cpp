#include "scenes.h"

void HelloWindow::init(GLContext&) {}

void HelloWindow::draw(GLContext& gl) {
    gl.clear_color(1.0f, 0.0f, 0.0f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);
}
