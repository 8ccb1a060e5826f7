#include "game/particle_render.h"
#include "raymath.h"
#include "rlgl.h"
#include "external/glad.h"
#include <stdio.h>

static bool try_load_shader(Shader *shader, const char *vert_path, const char *frag_path) {
    if (shader->id != 0) {
        return true;
    }
    if (FileExists(vert_path) && FileExists(frag_path)) {
        *shader = LoadShader(vert_path, frag_path);
    }
    return shader->id != 0;
}

bool particle_render_init(ParticleRenderer *renderer) {
    const char *paths[][2] = {
        {"data/shaders/particles.vert", "data/shaders/particles.frag"},
        {"../data/shaders/particles.vert", "../data/shaders/particles.frag"},
        {"../../data/shaders/particles.vert", "../../data/shaders/particles.frag"}
    };

    *renderer = ParticleRenderer{};
    for (int i = 0; i < 3; i++) {
        if (try_load_shader(&renderer->shader, paths[i][0], paths[i][1])) {
            break;
        }
    }
    if (renderer->shader.id == 0) {
        fprintf(stderr, "render: particle shaders not found\n");
        return false;
    }

    renderer->loc_view_proj = GetShaderLocation(renderer->shader, "u_view_proj");
    renderer->loc_point_size = GetShaderLocation(renderer->shader, "u_point_size");
    renderer->loc_color = GetShaderLocation(renderer->shader, "u_color");

    // Attribute-less draw still needs a bound VAO in a core profile
    glGenVertexArrays(1, &renderer->vao);
    renderer->ready = renderer->vao != 0;
    return renderer->ready;
}

void particle_render_shutdown(ParticleRenderer *renderer) {
    if (renderer->vao) {
        glDeleteVertexArrays(1, &renderer->vao);
        renderer->vao = 0;
    }
    if (renderer->shader.id != 0) {
        UnloadShader(renderer->shader);
        renderer->shader.id = 0;
    }
    renderer->ready = false;
}

void particle_render_draw(const ParticleRenderer *renderer, Camera3D camera,
                          unsigned int position_ssbo, uint32_t count, float point_size, Color color) {
    if (!renderer || !renderer->ready || !position_ssbo || count == 0) return;

    rlDrawRenderBatchActive();

    int width = GetRenderWidth();
    int height = GetRenderHeight();
    Matrix view = GetCameraMatrix(camera);
    Matrix proj = MatrixPerspective(DEG2RAD * camera.fovy,
                                    (float)width / (float)(height > 0 ? height : 1),
                                    0.05f, 100.0f);
    Matrix vp = MatrixMultiply(view, proj);
    Vector4 tint = ColorNormalize(color);

    glUseProgram(renderer->shader.id);
    glUniformMatrix4fv(renderer->loc_view_proj, 1, GL_FALSE, MatrixToFloatV(vp).v);
    glUniform1f(renderer->loc_point_size, point_size);
    glUniform4f(renderer->loc_color, tint.x, tint.y, tint.z, tint.w);

    glEnable(GL_PROGRAM_POINT_SIZE);
    glEnable(GL_DEPTH_TEST);
    glBindVertexArray(renderer->vao);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 0, position_ssbo);
    glDrawArrays(GL_POINTS, 0, (GLsizei)count);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 0, 0);
    glBindVertexArray(0);
    glDisable(GL_PROGRAM_POINT_SIZE);
    glUseProgram(0);
}
