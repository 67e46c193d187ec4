#include "gui.h"
#include "scenes.h"

int main() {
    return run_scene<HelloWindow>({
        .title = "Hello Window",
        .width = 1024,
        .height = 768,
    });
}
