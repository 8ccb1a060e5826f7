// Droplet - fountain demo glue
// GL compute device + FLECS world + point renderer

#include "game/game.h"
#include "game/particle_render.h"
#include "engine/gpu/GlComputeDevice.h"
#include "src/World.h"
#include "src/config/SimulationConfig.h"
#include <stdio.h>

struct GameState {
    droplet::GlComputeDevice* device;
    droplet::World* world;
    ParticleRenderer renderer;
    droplet::SimError status;
};

GameConfig game_default_config(void) {
    GameConfig cfg;
    cfg.max_particles = droplet::envUint("DROPLET_MAX_PARTICLES", 65536u);
    cfg.emit_interval = 1;
    cfg.emit_batch = 32;
    cfg.allow_software = droplet::envUint("DROPLET_ALLOW_SOFT", 0u) != 0;
    return cfg;
}

GameState* game_create(GameConfig cfg, uint64_t seed) {
    droplet::SimError err = droplet::SimError::None;

    droplet::GlDeviceConfig deviceCfg;
    deviceCfg.allowSoftwareRenderer = cfg.allow_software;
    droplet::GlComputeDevice* device = droplet::GlComputeDevice::create(deviceCfg, &err);
    if (!device) {
        fprintf(stderr, "game: compute device unavailable (%s)\n", droplet::simErrorName(err));
        return nullptr;
    }

    droplet::WorldDesc desc;
    desc.config = droplet::SimulationConfig::fountainSpray();
    droplet::applyEnvironmentOverrides(&desc.config);
    desc.store.capacity = cfg.max_particles;
    desc.store.maxNeighbors = desc.config.maxNeighbors;

    droplet::World* world = new droplet::World();
    err = world->init(*device, desc);
    if (err != droplet::SimError::None) {
        fprintf(stderr, "game: world setup failed (%s)\n", droplet::simErrorName(err));
        delete world;
        device->destroy();
        return nullptr;
    }

    components::Emitter emitter;
    emitter.position = {0.0f, 0.2f, 0.0f};
    emitter.velocity = {1.0f, 3.0f, 0.0f};
    emitter.interval = cfg.emit_interval;
    emitter.batchSize = cfg.emit_batch;
    emitter.jitter = 0.05f;
    rng_seed(&emitter.rng, seed);
    world->createEmitter(emitter);

    GameState* state = new GameState();
    state->device = device;
    state->world = world;
    state->status = droplet::SimError::None;
    if (!particle_render_init(&state->renderer)) {
        fprintf(stderr, "game: particles will not be drawn\n");
    }
    return state;
}

void game_destroy(GameState* game) {
    if (!game) return;
    particle_render_shutdown(&game->renderer);
    // World releases its buffers through the device, so it goes first
    delete game->world;
    game->device->destroy();
    delete game;
}

bool game_update_fixed(GameState* game, float dt) {
    if (droplet::isFatal(game->status)) {
        return false;
    }
    game->status = game->world->update(dt);
    return !droplet::isFatal(game->status);
}

void game_render(const GameState* game, Camera3D camera) {
    const droplet::ParticleStore* front = game->world->renderStore();
    if (!front) return;
    particle_render_draw(&game->renderer, camera, game->device->glBufferName(front->position()),
                         front->count(), 6.0f, (Color){90, 170, 255, 255});
}

void game_render_ui(const GameState* game, int screen_w, int screen_h) {
    (void)screen_h;
    DrawFPS(10, 10);
    DrawText(TextFormat("particles: %d", game_get_particle_count(game)), 10, 34, 20, RAYWHITE);
    if (droplet::isFatal(game->status)) {
        DrawText(TextFormat("halted: %s", droplet::simErrorName(game->status)), screen_w - 260, 10, 20, RED);
    }
}

int game_get_particle_count(const GameState* game) {
    const droplet::ParticleStore* front = game->world->renderStore();
    return front ? (int)front->count() : 0;
}

int game_exit_code(const GameState* game) {
    return droplet::isFatal(game->status) ? 1 : 0;
}
