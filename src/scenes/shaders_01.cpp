#include "scenes.h"
#include "utils.h"

void Shaders01::init(GLContext& gl) {
    shader.emplace(gl, utl::shader_path("shaders_01", "vertex"),
                   utl::shader_path("shaders_01", "fragment"));

    time_uniform = shader->require_uniform("time");
    shader->use();
    shader->set_float(time_uniform, 0.0f);

    vao = gl.create_vertex_array();
    vbo = gl.create_buffer();
    gl.bind_vertex_array(vao);
    gl.bind_buffer(GL_ARRAY_BUFFER, vbo);
    oglutil::upload_buffer(gl, GL_ARRAY_BUFFER, std::span<const glm::vec3>(vertices));

    // Element buffer binding is part of the VAO state
    ebo = gl.create_buffer();
    gl.bind_buffer(GL_ELEMENT_ARRAY_BUFFER, ebo);
    oglutil::upload_buffer(gl, GL_ELEMENT_ARRAY_BUFFER, std::span<const std::uint32_t>(quad::indices));

    const oglutil::VertexAttribute layout[] = {
        {0, 3, GL_FLOAT, sizeof(glm::vec3), 0},
    };
    oglutil::describe_layout(gl, layout);

    start_time = std::chrono::steady_clock::now();
}

void Shaders01::draw(GLContext& gl) {
    gl.clear_color(0.0f, 0.2f, 0.2f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);

    shader->use();
    std::chrono::duration<float> elapsed = std::chrono::steady_clock::now() - start_time;
    shader->set_float(time_uniform, elapsed.count());

    gl.bind_vertex_array(vao);
    gl.draw_elements(GL_TRIANGLES, static_cast<GLsizei>(quad::indices.size()), GL_UNSIGNED_INT, 0);
}

void Shaders01::exit(GLContext& gl) {
    gl.delete_buffer(ebo);
    gl.delete_buffer(vbo);
    gl.delete_vertex_array(vao);
    if (shader)
        shader->destroy();
}
