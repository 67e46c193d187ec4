#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <memory>

#include "gl_error.h"
#include "image.h"

Image load_image(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> data(
        stbi_load(path.c_str(), &width, &height, &channels, 0), &stbi_image_free);

    if (!data) {
        const char* reason = stbi_failure_reason();
        throw GfxError(ErrorKind::AssetLoad,
                       "Failed to decode " + path + ": " + (reason ? reason : "unknown reason"));
    }

    Image img;
    img.width = width;
    img.height = height;
    img.channels = channels;
    const size_t size = static_cast<size_t>(width) * height * channels;
    img.pixels.assign(data.get(), data.get() + size);
    return img;
}
