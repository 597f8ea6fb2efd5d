/**
 * MintCrate - Collision Example
 *
 * Runs a short headless room: a player box falls onto a tilemap floor,
 * walks into a coin, and a simulated mouse cursor hovers over a button.
 * Each frame follows the usual order: clear flags, move, query, react.
 *
 * Output goes to the console and to /tmp/mintcrate.log.
 */

#include "mintcrate/mintcrate.h"
#include <stdio.h>
#include <stdlib.h>

/* Behavior codes used by this room */
#define BEHAVIOR_SOLID   MINTCRATE_BEHAVIOR_SOLID
#define BEHAVIOR_SPIKES  2

static const int ROOM_COLS = 10;
static const int ROOM_ROWS = 6;
static const float TILE_SIZE = 16.0f;
static const int FRAME_COUNT = 90;

static const int32_t ROOM_LAYOUT[ROOM_ROWS][ROOM_COLS] = {
    {1, 0, 0, 0, 0, 0, 0, 0, 0, 1},
    {1, 0, 0, 0, 0, 0, 0, 0, 0, 1},
    {1, 0, 0, 0, 0, 0, 0, 0, 0, 1},
    {1, 0, 0, 0, 0, 0, 0, 0, 0, 1},
    {1, 0, 0, 0, 0, 0, 2, 2, 0, 1},
    {1, 1, 1, 1, 1, 1, 1, 1, 1, 1},
};

typedef struct RoomState {
    MintCrate_CollisionScene *scene;
    MintCrate_Active *player;
    MintCrate_Active *coin;
    MintCrate_Active *button;
    float velocity_y;
    bool grounded;
    bool coin_collected;
    bool was_hovered;
} RoomState;

static MintCrate_BehaviorGrid *build_layout(void) {
    const int32_t *rows[ROOM_ROWS];
    int lengths[ROOM_ROWS];
    for (int r = 0; r < ROOM_ROWS; r++) {
        rows[r] = ROOM_LAYOUT[r];
        lengths[r] = ROOM_COLS;
    }
    return mintcrate_behavior_grid_from_rows(rows, lengths, ROOM_ROWS);
}

static bool room_init(RoomState *room) {
    MintCrate_CollisionSceneConfig config = MINTCRATE_COLLISION_SCENE_DEFAULT;
    config.max_actives = 16;
    config.cell_width = TILE_SIZE;
    config.cell_height = TILE_SIZE;

    room->scene = mintcrate_collision_scene_create(&config);
    if (!room->scene) return false;

    MintCrate_BehaviorGrid *grid = build_layout();
    if (!grid) return false;
    bool loaded = mintcrate_collision_scene_load_layout(room->scene, grid, 0.0f, 0.0f);
    mintcrate_behavior_grid_destroy(grid);
    if (!loaded) return false;

    /* Player origin is at its feet */
    MintCrate_ColliderDef player_def = MINTCRATE_COLLIDER_DEF_DEFAULT;
    player_def.offset_x = -6.0f;
    player_def.offset_y = -14.0f;
    player_def.width = 12.0f;
    player_def.height = 14.0f;
    room->player = mintcrate_active_create("player", &player_def, 40.0f, 20.0f);

    MintCrate_ColliderDef coin_def = MINTCRATE_COLLIDER_DEF_DEFAULT;
    coin_def.radius = 4.0f;
    room->coin = mintcrate_active_create("coin", &coin_def, 84.0f, 74.0f);

    MintCrate_ColliderDef button_def = MINTCRATE_COLLIDER_DEF_DEFAULT;
    button_def.width = 32.0f;
    button_def.height = 12.0f;
    room->button = mintcrate_active_create("button", &button_def, 112.0f, 4.0f);

    if (!room->player || !room->coin || !room->button) return false;

    return mintcrate_collision_scene_add_active(room->scene, room->player) &&
           mintcrate_collision_scene_add_active(room->scene, room->coin) &&
           mintcrate_collision_scene_add_active(room->scene, room->button);
}

static void room_shutdown(RoomState *room) {
    mintcrate_collision_scene_destroy(room->scene);
    mintcrate_active_destroy(room->button);
    mintcrate_active_destroy(room->coin);
    mintcrate_active_destroy(room->player);
}

static void room_update(RoomState *room, int frame) {
    mintcrate_collision_scene_begin_frame(room->scene);

    /* Gravity, then walk right once landed */
    room->velocity_y += 0.5f;
    if (room->velocity_y > 6.0f) room->velocity_y = 6.0f;
    mintcrate_active_move(room->player, room->grounded ? 1.0f : 0.0f, room->velocity_y);

    /* Push the player out of the floor */
    MintCrate_MaskHit hits[8];
    int hit_count = mintcrate_collision_scene_test_behavior(
        room->scene, room->player, BEHAVIOR_SOLID, hits, 8);

    for (int i = 0; i < hit_count; i++) {
        float bottom = mintcrate_active_get_bottom_edge(room->player);
        if (room->velocity_y > 0.0f && bottom > hits[i].top_edge_y &&
            mintcrate_active_get_top_edge(room->player) < hits[i].top_edge_y) {
            mintcrate_active_move(room->player, 0.0f, hits[i].top_edge_y - bottom);
            room->velocity_y = 0.0f;
            if (!room->grounded) {
                mintcrate_log_info(MINTCRATE_LOG_GAME, "Frame %d: player landed at y=%.1f",
                                   frame, (double)mintcrate_active_get_y(room->player));
            }
            room->grounded = true;
        }
    }

    if (mintcrate_collision_test_behavior_any(room->player, BEHAVIOR_SPIKES,
                                              mintcrate_collision_scene_get_masks(room->scene))) {
        mintcrate_log_warning(MINTCRATE_LOG_GAME, "Frame %d: player is on spikes", frame);
    }

    if (!room->coin_collected && mintcrate_collision_test_actives(room->player, room->coin)) {
        room->coin_collected = true;
        mintcrate_log_info(MINTCRATE_LOG_GAME, "Frame %d: coin collected", frame);
    }

    /* Cursor sweeps across the top of the room */
    float mouse_x = (float)(frame * 2);
    float mouse_y = 8.0f;
    bool hovered = mintcrate_collision_test_point(room->button, mouse_x, mouse_y);
    if (hovered != room->was_hovered) {
        mintcrate_log_info(MINTCRATE_LOG_GAME, "Frame %d: button %s", frame,
                           hovered ? "hovered" : "left");
        room->was_hovered = hovered;
    }
}

int main(int argc, char *argv[]) {
    (void)argc;
    (void)argv;

    if (!mintcrate_log_init()) {
        mintcrate_log_and_clear_error(MINTCRATE_LOG_CORE);
    }
    mintcrate_log_info(MINTCRATE_LOG_CORE, "MintCrate %d.%d.%d collision example",
                       MINTCRATE_VERSION_MAJOR, MINTCRATE_VERSION_MINOR, MINTCRATE_VERSION_PATCH);

    RoomState room = {};
    if (!room_init(&room)) {
        mintcrate_log_error(MINTCRATE_LOG_ROOM, "Failed to set up room");
        mintcrate_log_and_clear_error(MINTCRATE_LOG_ROOM);
        room_shutdown(&room);
        mintcrate_log_shutdown();
        return EXIT_FAILURE;
    }

    for (int frame = 0; frame < FRAME_COUNT; frame++) {
        room_update(&room, frame);
    }

    printf("Player finished at (%.1f, %.1f), grounded=%s, coin=%s\n",
           (double)mintcrate_active_get_x(room.player),
           (double)mintcrate_active_get_y(room.player),
           room.grounded ? "yes" : "no",
           room.coin_collected ? "collected" : "missed");

    room_shutdown(&room);
    mintcrate_log_shutdown();
    return EXIT_SUCCESS;
}
