#ifndef DROPLET_PARTICLE_RENDER_H
#define DROPLET_PARTICLE_RENDER_H

#include <stdbool.h>
#include <stdint.h>
#include "raylib.h"

// Draws the simulation's position buffer as round points, straight from the SSBO
typedef struct ParticleRenderer {
    Shader shader;
    unsigned int vao;
    int loc_view_proj;
    int loc_point_size;
    int loc_color;
    bool ready;
} ParticleRenderer;

bool particle_render_init(ParticleRenderer *renderer);
void particle_render_shutdown(ParticleRenderer *renderer);
void particle_render_draw(const ParticleRenderer *renderer, Camera3D camera,
                          unsigned int position_ssbo, uint32_t count, float point_size, Color color);

#endif
