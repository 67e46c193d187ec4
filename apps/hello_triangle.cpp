#include "gui.h"
#include "scenes.h"

int main() {
    return run_scene<HelloTriangle>({
        .title = "Hello Triangle",
        .width = 1024,
        .height = 768,
    });
}
