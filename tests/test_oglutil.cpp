#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <vector>

#include <glm/glm.hpp>

#include "gl_error.h"
#include "oglutil.h"
#include "recording_context.h"

TEST(AsBytes, CoversEveryElementByteForByte) {
    const std::vector<float> values = {-0.5f, 0.25f, 1.0f, 3.5f, 0.0f};
    auto bytes = oglutil::as_bytes(std::span<const float>(values));

    ASSERT_EQ(bytes.size(), values.size() * sizeof(float));
    EXPECT_EQ(std::memcmp(bytes.data(), values.data(), bytes.size()), 0);
}

TEST(AsBytes, WorksForVertexRecords) {
    const glm::vec3 positions[] = {{1.0f, 2.0f, 3.0f}, {4.0f, 5.0f, 6.0f}};
    auto bytes = oglutil::as_bytes(std::span<const glm::vec3>(positions));

    ASSERT_EQ(bytes.size(), 2 * sizeof(glm::vec3));
    EXPECT_EQ(std::memcmp(bytes.data(), positions, bytes.size()), 0);
}

TEST(AsBytes, EmptySequenceGivesEmptyView) {
    std::vector<std::uint32_t> none;
    EXPECT_TRUE(oglutil::as_bytes(std::span<const std::uint32_t>(none)).empty());
}

TEST(UploadBuffer, SendsTheTypedDataToTheBoundBuffer) {
    RecordingContext gl;
    const std::uint32_t indices[] = {0, 1, 2, 0, 2, 3};

    GLuint ebo = gl.create_buffer();
    gl.bind_buffer(GL_ELEMENT_ARRAY_BUFFER, ebo);
    oglutil::upload_buffer(gl, GL_ELEMENT_ARRAY_BUFFER, std::span<const std::uint32_t>(indices));

    ASSERT_EQ(gl.uploads.size(), 1u);
    const auto& upload = gl.uploads.front();
    EXPECT_EQ(upload.target, static_cast<GLenum>(GL_ELEMENT_ARRAY_BUFFER));
    EXPECT_EQ(upload.buffer, ebo);
    EXPECT_EQ(upload.usage, static_cast<GLenum>(GL_STATIC_DRAW));
    ASSERT_EQ(upload.bytes.size(), sizeof(indices));
    EXPECT_EQ(std::memcmp(upload.bytes.data(), indices, sizeof(indices)), 0);
}

TEST(DescribeLayout, SetsAndEnablesEverySlot) {
    RecordingContext gl;
    const oglutil::VertexAttribute layout[] = {
        {0, 3, GL_FLOAT, 36, 0},
        {1, 4, GL_FLOAT, 36, 12},
        {2, 2, GL_FLOAT, 36, 28},
    };
    oglutil::describe_layout(gl, layout);

    ASSERT_EQ(gl.attributes.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(gl.attributes[i].index, layout[i].location);
        EXPECT_EQ(gl.attributes[i].size, layout[i].components);
        EXPECT_EQ(gl.attributes[i].stride, 36);
        EXPECT_EQ(gl.attributes[i].offset, layout[i].offset);
        EXPECT_TRUE(gl.attributes[i].enabled);
    }
}

TEST(CompileShader, FailureCarriesDriverLog) {
    RecordingContext gl;
    gl.compile_ok = false;
    gl.shader_log = "0:3(1): error: syntax error, unexpected '}'";

    try {
        oglutil::compile_shader(gl, GL_FRAGMENT_SHADER, "void main() { }");
        FAIL() << "expected GfxError";
    } catch (const GfxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ShaderCompile);
        EXPECT_NE(std::string(e.what()).find("unexpected '}'"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("fragment"), std::string::npos);
    }
    EXPECT_EQ(gl.count("delete_shader"), 1);
}

TEST(LinkProgram, FailureIsProgramLink) {
    RecordingContext gl;
    gl.link_ok = false;
    gl.program_log = "error: vertex output 'texCoord' not consumed";

    try {
        oglutil::link_program(gl, 1, 2);
        FAIL() << "expected GfxError";
    } catch (const GfxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProgramLink);
        EXPECT_NE(std::string(e.what()).find("texCoord"), std::string::npos);
    }
    EXPECT_EQ(gl.count("delete_program"), 1);
}

TEST(PixelFormat, MapsRgbAndRgba) {
    EXPECT_EQ(oglutil::pixel_format_for(3), static_cast<GLenum>(GL_RGB));
    EXPECT_EQ(oglutil::pixel_format_for(4), static_cast<GLenum>(GL_RGBA));
}

TEST(PixelFormat, OtherChannelCountsAreUnsupported) {
    for (int channels : {1, 2, 5}) {
        try {
            oglutil::pixel_format_for(channels);
            FAIL() << channels << " channels accepted";
        } catch (const GfxError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::UnsupportedImageFormat);
        }
    }
}

TEST(LoadTexture, RepeatWrapLinearFilterOnRequestedUnit) {
    RecordingContext gl;
    GLuint texture = oglutil::load_texture(gl, GL_TEXTURE1, "assets/wall.png");

    EXPECT_NE(texture, 0u);
    EXPECT_EQ(gl.textures_uploaded, 1);
    EXPECT_EQ(gl.count("tex_parameter"), 4);
    EXPECT_EQ(gl.count("generate_mipmap"), 1);
}

TEST(LoadTexture, MissingFileIsAssetLoad) {
    RecordingContext gl;
    try {
        oglutil::load_texture(gl, GL_TEXTURE0, "assets/does_not_exist.png");
        FAIL() << "expected GfxError";
    } catch (const GfxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AssetLoad);
    }
    EXPECT_EQ(gl.textures_uploaded, 0);
}

TEST(Framebuffer, IncompleteTargetThrows) {
    RecordingContext gl;
    gl.framebuffer_status = GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT;

    try {
        oglutil::create_color_target(gl, 800, 600);
        FAIL() << "expected GfxError";
    } catch (const GfxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FramebufferIncomplete);
    }
}

TEST(Framebuffer, BlitCoversSourceAndDestination) {
    RecordingContext gl;
    auto target = oglutil::create_color_target(gl, 800, 600);
    oglutil::blit_to_default(gl, target.framebuffer, {800, 600}, {1024, 768});

    ASSERT_EQ(gl.blits.size(), 1u);
    const auto& blit = gl.blits.front();
    EXPECT_EQ(blit.read_framebuffer, target.framebuffer);
    EXPECT_EQ(blit.draw_framebuffer, 0u);
    std::array<GLint, 8> expected = {0, 0, 800, 600, 0, 0, 1024, 768};
    EXPECT_EQ(blit.rect, expected);
    EXPECT_EQ(blit.mask, static_cast<GLbitfield>(GL_COLOR_BUFFER_BIT));
    EXPECT_EQ(blit.filter, static_cast<GLenum>(GL_LINEAR));
}

TEST(CheckGlError, DecodesPendingError) {
    RecordingContext gl;
    EXPECT_NO_THROW(oglutil::check_gl_error(gl, "idle"));

    gl.pending_errors.push_back(GL_INVALID_OPERATION);
    try {
        oglutil::check_gl_error(gl, "blit");
        FAIL() << "expected GfxError";
    } catch (const GfxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::GLError);
        EXPECT_NE(std::string(e.what()).find("InvalidOperation"), std::string::npos);
    }
}
