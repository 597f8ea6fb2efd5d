/**
 * @file collision_query.h
 * @brief Per-frame collision queries for game logic
 *
 * Game code tests Actives against each other, against the tilemap's
 * collision masks for one behavior code, and against a point (normally the
 * mouse cursor). Every test records its outcome in the collider flags, which
 * debug overlays read back. Flags accumulate over a frame and are cleared once
 * at the start of the next one.
 *
 * The mask set is always passed in explicitly, either directly or through the
 * room's MintCrate_CollisionScene. There is no global "current tilemap".
 *
 * Usage (with a scene owned by the room):
 *   MintCrate_CollisionSceneConfig config = MINTCRATE_COLLISION_SCENE_DEFAULT;
 *   MintCrate_CollisionScene *scene = mintcrate_collision_scene_create(&config);
 *
 *   mintcrate_collision_scene_add_active(scene, player);
 *   mintcrate_collision_scene_add_active(scene, coin);
 *   mintcrate_collision_scene_load_layout(scene, behaviors, 16.0f, 16.0f);
 *
 *   // Each frame
 *   mintcrate_collision_scene_begin_frame(scene);
 *
 *   if (mintcrate_collision_test_actives(player, coin)) {
 *       // Pick up coin
 *   }
 *
 *   MintCrate_MaskHit hits[8];
 *   int count = mintcrate_collision_scene_test_behavior(scene, player, BEHAVIOR_SOLID, hits, 8);
 *   for (int i = 0; i < count; i++) {
 *       // Push player out using hits[i].top_edge_y etc.
 *   }
 *
 *   if (mintcrate_collision_test_point(button, mouse_x, mouse_y)) {
 *       // Hover highlight
 *   }
 *
 *   // Cleanup (Actives are borrowed and destroyed by their owner)
 *   mintcrate_collision_scene_destroy(scene);
 */

#ifndef MINTCRATE_COLLISION_QUERY_H
#define MINTCRATE_COLLISION_QUERY_H

#include "mintcrate/active.h"
#include "mintcrate/collision_mask.h"

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Data Structures
 * ============================================================================ */

/** Edges of a tilemap mask that an Active overlapped, in pixels */
typedef struct MintCrate_MaskHit {
    float left_edge_x;
    float right_edge_x;
    float top_edge_y;
    float bottom_edge_y;
} MintCrate_MaskHit;

/* ============================================================================
 * Frame Queries
 * ============================================================================ */

/**
 * Clear the per-frame flags of every listed Active and every mask.
 * Call once per frame before any query. Calling it again is harmless.
 *
 * @param actives Array of Actives (NULL entries are skipped)
 * @param count Number of entries in actives
 * @param masks Current mask set (NULL when no tilemap is active)
 *
 * Thread Safety: NOT thread-safe
 */
void mintcrate_collision_reset_frame(MintCrate_Active *const *actives, int count,
                                     MintCrate_CollisionMaskSet *masks);

/**
 * Test two Actives' colliders for overlap.
 * On overlap both colliders are marked as colliding.
 *
 * @return true if the colliders overlap (false if either has no collider)
 *
 * Thread Safety: NOT thread-safe
 */
bool mintcrate_collision_test_actives(MintCrate_Active *a, MintCrate_Active *b);

/**
 * Test an Active against every mask of one behavior code.
 *
 * Every mask of the code is tested, and every overlapping mask is marked as
 * colliding, even when out_hits fills up before the end.
 *
 * The result is empty both when nothing overlaps and when no tilemap is
 * active (masks == NULL). Behavior codes are not validated: a code without
 * masks gives an empty result. Use mintcrate_collision_masks_has_code() to
 * enforce a set of known codes.
 *
 * @param active Active to test
 * @param code Behavior code to filter for
 * @param masks Current mask set (can be NULL)
 * @param out_hits Array to fill with overlapped mask edges (can be NULL if max_hits is 0)
 * @param max_hits Capacity of out_hits
 * @return Number of hits written to out_hits
 *
 * Thread Safety: NOT thread-safe
 */
int mintcrate_collision_test_behavior(MintCrate_Active *active, int32_t code,
                                      MintCrate_CollisionMaskSet *masks,
                                      MintCrate_MaskHit *out_hits, int max_hits);

/**
 * Test whether an Active overlaps any mask of one behavior code.
 * Marks flags exactly like mintcrate_collision_test_behavior().
 *
 * Thread Safety: NOT thread-safe
 */
bool mintcrate_collision_test_behavior_any(MintCrate_Active *active, int32_t code,
                                           MintCrate_CollisionMaskSet *masks);

/**
 * Test whether a point (usually the mouse cursor, in room coordinates) is
 * over an Active's collider. The result is stored as the collider's
 * mouse-over flag.
 *
 * @return true if the point is inside the collider
 *
 * Thread Safety: NOT thread-safe
 */
bool mintcrate_collision_test_point(MintCrate_Active *active, float px, float py);

/* ============================================================================
 * Collision Scene
 * ============================================================================ */

typedef struct MintCrate_CollisionScene MintCrate_CollisionScene;

/** Configuration for a collision scene */
typedef struct MintCrate_CollisionSceneConfig {
    int max_actives;        /**< Maximum registered Actives (default: 1024) */
    float cell_width;       /**< Default tile width in pixels (default: 16) */
    float cell_height;      /**< Default tile height in pixels (default: 16) */
} MintCrate_CollisionSceneConfig;

/** Default scene configuration */
#define MINTCRATE_COLLISION_SCENE_DEFAULT { \
    .max_actives = 1024, \
    .cell_width = 16.0f, \
    .cell_height = 16.0f \
}

/**
 * Create a collision scene.
 * Caller OWNS the returned pointer and MUST call mintcrate_collision_scene_destroy().
 *
 * @param config Configuration (NULL for defaults)
 * @return Scene, or NULL on failure
 *
 * Thread Safety: NOT thread-safe
 */
MintCrate_CollisionScene *mintcrate_collision_scene_create(
    const MintCrate_CollisionSceneConfig *config);

/**
 * Destroy a collision scene and its mask set.
 * Registered Actives are NOT destroyed.
 * Safe to call with NULL.
 */
void mintcrate_collision_scene_destroy(MintCrate_CollisionScene *scene);

/**
 * Register an Active so begin_frame clears its flags.
 *
 * @return true on success, false if full, NULL, or already registered
 */
bool mintcrate_collision_scene_add_active(MintCrate_CollisionScene *scene,
                                          MintCrate_Active *active);

/**
 * Unregister an Active. Registration order of the others is kept.
 *
 * @return true if it was registered
 */
bool mintcrate_collision_scene_remove_active(MintCrate_CollisionScene *scene,
                                             MintCrate_Active *active);

/**
 * Check whether an Active is registered.
 */
bool mintcrate_collision_scene_has_active(const MintCrate_CollisionScene *scene,
                                          const MintCrate_Active *active);

int mintcrate_collision_scene_get_active_count(const MintCrate_CollisionScene *scene);
int mintcrate_collision_scene_get_capacity(const MintCrate_CollisionScene *scene);

/**
 * Activate a tilemap layout: compile its behavior grid and replace the
 * current mask set. The previous set is destroyed only if compilation
 * succeeds; on failure it stays active.
 *
 * @param scene Collision scene
 * @param grid Behavior grid of the layout
 * @param cell_width Tile width in pixels (0 uses the configured default)
 * @param cell_height Tile height in pixels (0 uses the configured default)
 * @return true on success
 *
 * Thread Safety: NOT thread-safe
 */
bool mintcrate_collision_scene_load_layout(MintCrate_CollisionScene *scene,
                                           const MintCrate_BehaviorGrid *grid,
                                           float cell_width, float cell_height);

/**
 * Activate a tilemap layout that has no behavior data. Every non-empty tile
 * becomes MINTCRATE_BEHAVIOR_SOLID.
 *
 * @param tiles Row-major tile indices (cols * rows entries)
 * @return true on success
 */
bool mintcrate_collision_scene_load_tiles(MintCrate_CollisionScene *scene,
                                          const MintCrate_TileID *tiles, int cols, int rows,
                                          float cell_width, float cell_height);

/**
 * Deactivate the current layout and destroy its masks.
 */
void mintcrate_collision_scene_clear_layout(MintCrate_CollisionScene *scene);

/**
 * Check whether a layout is active.
 */
bool mintcrate_collision_scene_has_layout(const MintCrate_CollisionScene *scene);

/**
 * Get the current mask set.
 * The pointer is owned by the scene and is invalidated by the next
 * load_layout, load_tiles, clear_layout or destroy.
 *
 * @return Mask set, or NULL when no layout is active
 */
MintCrate_CollisionMaskSet *mintcrate_collision_scene_get_masks(MintCrate_CollisionScene *scene);

/**
 * Start a frame: clear the flags of every registered Active and every mask.
 *
 * Thread Safety: NOT thread-safe
 */
void mintcrate_collision_scene_begin_frame(MintCrate_CollisionScene *scene);

/**
 * mintcrate_collision_test_behavior() against the scene's current masks.
 */
int mintcrate_collision_scene_test_behavior(MintCrate_CollisionScene *scene,
                                            MintCrate_Active *active, int32_t code,
                                            MintCrate_MaskHit *out_hits, int max_hits);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_COLLISION_QUERY_H */
