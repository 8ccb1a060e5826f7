#include "raylib.h"
#include "rlgl.h"
#include <stdlib.h>
#include <cstdio>

#include "engine/platform/engine.h"
#include "game/game.h"

int main(void) {
    #if defined(__linux__)
    setenv("MESA_LOADER_DRIVER_OVERRIDE", "zink", 0);
    #endif

    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT | FLAG_MSAA_4X_HINT);

    EngineConfig cfg = {
        .window_w = 1280,
        .window_h = 720,
        .target_fps = 60,
        .tick_hz = 60,
        .vsync = true,
        .dev_mode = true
    };

    InitWindow(cfg.window_w, cfg.window_h, "Droplet");
    if (cfg.vsync) {
        SetWindowState(FLAG_VSYNC_HINT);
    }
    SetTargetFPS(cfg.target_fps);

    EngineContext engine = {0};
    engine_init(&engine, cfg);

    Camera3D camera = {0};
    camera.position = (Vector3){5.0f, 3.5f, 6.0f};
    camera.target = (Vector3){0.0f, 0.8f, 0.0f};
    camera.up = (Vector3){0.0f, 1.0f, 0.0f};
    camera.fovy = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;

    GameState *game = game_create(game_default_config(), 0xC0FFEEu);
    if (!game) {
        CloseWindow();
        return 1;
    }

    bool running = true;
    while (running && !WindowShouldClose()) {
        float real_dt = GetFrameTime();

        int screen_w = GetRenderWidth();
        int screen_h = GetRenderHeight();

        int steps = engine_time_update(&engine, real_dt);
        for (int i = 0; i < steps && running; ++i) {
            running = game_update_fixed(game, engine_tick_dt(&engine));
        }

        BeginDrawing();
        rlViewport(0, 0, screen_w, screen_h);
        ClearBackground((Color){18, 24, 32, 255});
        BeginMode3D(camera);
        DrawCubeWires((Vector3){0.0f, 1.25f, 0.0f}, 4.0f, 3.5f, 4.0f, (Color){80, 90, 110, 255});
        EndMode3D();
        game_render(game, camera);
        game_render_ui(game, screen_w, screen_h);
        EndDrawing();
    }

    int code = game_exit_code(game);
    if (code != 0) {
        fprintf(stderr, "droplet: simulation halted, exiting with %d\n", code);
    }
    game_destroy(game);
    CloseWindow();
    return code;
}
