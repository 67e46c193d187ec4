#ifndef CONFIG_H
#define CONFIG_H

#include <string>

struct AppConfig {
    std::string title = "Learning OpenGL";
    int width = 1024;
    int height = 768;
    bool vsync = true;

    int gl_major = 3;
    int gl_minor = 3;

    // Also create a hidden window whose context shares objects with the
    // visible one, reachable through GLContext::make_current(ContextRole::Root).
    bool root_context = false;
};

#endif // CONFIG_H
