#ifndef RENDER_HANDLER_H
#define RENDER_HANDLER_H

#include "gl_context.h"

// Per-scene state driven by RenderLoop. init runs once with a current
// context, draw once per frame, exit once before the context goes away.
class RenderHandler {
public:
    virtual ~RenderHandler() = default;

    virtual void init(GLContext& gl) = 0;
    virtual void draw(GLContext&) {}
    virtual void exit(GLContext&) {}
};

#endif // RENDER_HANDLER_H
