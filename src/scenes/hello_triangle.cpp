#include "scenes.h"
#include "utils.h"

void HelloTriangle::init(GLContext& gl) {
    shader.emplace(gl, utl::shader_path("hello_triangle", "vertex"),
                   utl::shader_path("hello_triangle", "fragment"));

    // The VAO records the attribute setup below, like a preset
    vao = gl.create_vertex_array();
    vbo = gl.create_buffer();
    gl.bind_vertex_array(vao);
    gl.bind_buffer(GL_ARRAY_BUFFER, vbo);
    oglutil::upload_buffer(gl, GL_ARRAY_BUFFER, std::span<const glm::vec3>(vertices));

    const oglutil::VertexAttribute layout[] = {
        {0, 3, GL_FLOAT, sizeof(glm::vec3), 0}, // location = 0: position
    };
    oglutil::describe_layout(gl, layout);
}

void HelloTriangle::draw(GLContext& gl) {
    gl.clear_color(0.0f, 0.8f, 0.8f, 1.0f);
    gl.clear(GL_COLOR_BUFFER_BIT);

    shader->use();
    gl.bind_vertex_array(vao);
    gl.draw_arrays(GL_TRIANGLES, 0, static_cast<GLsizei>(vertices.size()));
}

void HelloTriangle::exit(GLContext& gl) {
    gl.delete_buffer(vbo);
    gl.delete_vertex_array(vao);
    if (shader)
        shader->destroy();
}
