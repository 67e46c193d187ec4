#include <cstddef>

#include "scenes.h"
#include "utils.h"

void Textures01::init(GLContext& gl) {
    shader.emplace(gl, utl::shader_path("textures_01", "vertex"),
                   utl::shader_path("textures_01", "fragment"));

    time_uniform = shader->require_uniform("time");
    GLint face_sampler = shader->require_uniform("imageTexture1");
    GLint wall_sampler = shader->require_uniform("imageTexture2");

    // Samplers read from the texture unit with the same number
    shader->use();
    shader->set_float(time_uniform, 0.0f);
    shader->set_int(face_sampler, 0);
    shader->set_int(wall_sampler, 1);

    vao = gl.create_vertex_array();
    vbo = gl.create_buffer();
    gl.bind_vertex_array(vao);
    gl.bind_buffer(GL_ARRAY_BUFFER, vbo);
    oglutil::upload_buffer(gl, GL_ARRAY_BUFFER, std::span<const ColorTexVertex>(vertices));

    ebo = gl.create_buffer();
    gl.bind_buffer(GL_ELEMENT_ARRAY_BUFFER, ebo);
    oglutil::upload_buffer(gl, GL_ELEMENT_ARRAY_BUFFER, std::span<const std::uint32_t>(quad::indices));

    constexpr GLsizei stride = sizeof(ColorTexVertex);
    const oglutil::VertexAttribute layout[] = {
        {0, 3, GL_FLOAT, stride, offsetof(ColorTexVertex, position)},
        {1, 4, GL_FLOAT, stride, offsetof(ColorTexVertex, color)},
        {2, 2, GL_FLOAT, stride, offsetof(ColorTexVertex, tex_coord)},
    };
    oglutil::describe_layout(gl, layout);

    texture0 = oglutil::load_texture(gl, GL_TEXTURE0, face_texture);
    texture1 = oglutil::load_texture(gl, GL_TEXTURE1, wall_texture);

    start_time = std::chrono::steady_clock::now();
}

void Textures01::draw(GLContext& gl) {
    gl.clear_color(0.0f, 0.2f, 0.2f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);

    shader->use();
    std::chrono::duration<float> elapsed = std::chrono::steady_clock::now() - start_time;
    shader->set_float(time_uniform, elapsed.count());

    gl.active_texture(GL_TEXTURE0);
    gl.bind_texture(GL_TEXTURE_2D, texture0);
    gl.active_texture(GL_TEXTURE1);
    gl.bind_texture(GL_TEXTURE_2D, texture1);

    gl.bind_vertex_array(vao);
    gl.draw_elements(GL_TRIANGLES, static_cast<GLsizei>(quad::indices.size()), GL_UNSIGNED_INT, 0);
}

void Textures01::exit(GLContext& gl) {
    gl.delete_texture(texture0);
    gl.delete_texture(texture1);
    gl.delete_buffer(ebo);
    gl.delete_buffer(vbo);
    gl.delete_vertex_array(vao);
    if (shader)
        shader->destroy();
}
