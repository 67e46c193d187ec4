#include "gui.h"
#include "scenes.h"

int main() {
    return run_scene<Framebuffers02>({
        .title = "Learning OpenGL",
        .width = 800,
        .height = 600,
        .root_context = true,
    });
}
