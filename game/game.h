#ifndef DROPLET_GAME_H
#define DROPLET_GAME_H

#include <stdbool.h>
#include <stdint.h>
#include "raylib.h"

typedef struct GameState GameState;

typedef struct GameConfig {
    uint32_t max_particles;      // ring capacity of each particle store
    uint32_t emit_interval;      // frames between fountain bursts
    uint32_t emit_batch;
    bool allow_software;         // accept llvmpipe-class GL renderers
} GameConfig;

// Reads DROPLET_MAX_PARTICLES and DROPLET_ALLOW_SOFT on top of the defaults
GameConfig game_default_config(void);

// Requires a current OpenGL 4.3 context (InitWindow)
GameState *game_create(GameConfig cfg, uint64_t seed);
void game_destroy(GameState *game);
// Returns false once the simulation has halted on a fatal error
bool game_update_fixed(GameState *game, float dt);
void game_render(const GameState *game, Camera3D camera);
void game_render_ui(const GameState *game, int screen_w, int screen_h);

int game_get_particle_count(const GameState *game);
// Process exit code for the current state (0 while running cleanly)
int game_exit_code(const GameState *game);

#endif
