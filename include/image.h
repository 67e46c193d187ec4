#ifndef IMAGE_H
#define IMAGE_H

#include <string>
#include <vector>

// Decoded 8-bit image, rows top to bottom, channels interleaved.
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<unsigned char> pixels;
};

// Decodes PNG/JPEG/BMP/TGA with stb_image, keeping the file's own channel
// count. Throws GfxError(AssetLoad) when the file cannot be decoded.
Image load_image(const std::string& path);

#endif // IMAGE_H
