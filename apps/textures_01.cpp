#include "gui.h"
#include "scenes.h"

int main() {
    return run_scene<Textures01>({
        .title = "Textures",
        .width = 1024,
        .height = 768,
    });
}
