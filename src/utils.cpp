#include <fstream>
#include <sstream>
#include <string>

#include "gl_error.h"
#include "utils.h"


namespace utl{

// Reads a whole text file, e.g. GLSL source, relative to the working directory
std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw GfxError(ErrorKind::AssetLoad, "Could not open " + path);
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw GfxError(ErrorKind::AssetLoad, "Could not read " + path);
    }
    return contents.str();
}

// shaders/<scene>/<stage>.glsl, the layout the build copies next to the binaries
std::string shader_path(const std::string& scene, const std::string& stage) {
    return "shaders/" + scene + "/" + stage + ".glsl";
}

}
