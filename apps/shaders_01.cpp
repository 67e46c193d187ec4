#include "gui.h"
#include "scenes.h"

int main() {
    return run_scene<Shaders01>({
        .title = "Shaders",
        .width = 1024,
        .height = 768,
    });
}
