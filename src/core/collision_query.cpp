/**
 * @file collision_query.cpp
 * @brief Per-frame collision queries and the room-owned collision scene
 */

#include "mintcrate/mintcrate.h"
#include "mintcrate/collision.h"
#include "mintcrate/collision_query.h"
#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include "mintcrate/validate.h"
#include "active_internal.h"

#include <stdlib.h>
#include <string.h>

struct MintCrate_CollisionScene {
    MintCrate_Active **actives;         /* Borrowed */
    int active_count;
    int max_actives;
    MintCrate_CollisionMaskSet *masks;  /* Owned, NULL when no layout */
    float cell_width;
    float cell_height;
};

/* ============================================================================
 * Frame Queries
 * ============================================================================ */

void mintcrate_collision_reset_frame(MintCrate_Active *const *actives, int count,
                                     MintCrate_CollisionMaskSet *masks) {
    if (actives) {
        for (int i = 0; i < count; i++) {
            mintcrate_shape_reset_flags(mintcrate_active_collider_shape(actives[i]));
        }
    }

    mintcrate_collision_masks_reset_flags(masks);
}

bool mintcrate_collision_test_actives(MintCrate_Active *a, MintCrate_Active *b) {
    return mintcrate_collision_intersects(mintcrate_active_collider_shape(a),
                                          mintcrate_active_collider_shape(b));
}

int mintcrate_collision_test_behavior(MintCrate_Active *active, int32_t code,
                                      MintCrate_CollisionMaskSet *masks,
                                      MintCrate_MaskHit *out_hits, int max_hits) {
    MintCrate_Shape *shape = mintcrate_active_collider_shape(active);
    if (!shape || !masks) return 0;

    MINTCRATE_WARN_IF(max_hits > 0 && !out_hits, MINTCRATE_LOG_COLLISION,
                      "max_hits given without an output array");

    int mask_count = 0;
    MintCrate_Shape *rects = mintcrate_collision_masks_get(masks, code, &mask_count);

    int written = 0;
    for (int i = 0; i < mask_count; i++) {
        MintCrate_Shape *rect = &rects[i];
        if (!mintcrate_collision_intersects(shape, rect)) {
            continue;
        }

        if (out_hits && written < max_hits) {
            MintCrate_MaskHit *hit = &out_hits[written++];
            hit->left_edge_x = rect->x;
            hit->right_edge_x = rect->x + rect->w;
            hit->top_edge_y = rect->y;
            hit->bottom_edge_y = rect->y + rect->h;
        }
    }

    return written;
}

bool mintcrate_collision_test_behavior_any(MintCrate_Active *active, int32_t code,
                                           MintCrate_CollisionMaskSet *masks) {
    MintCrate_MaskHit hit;
    return mintcrate_collision_test_behavior(active, code, masks, &hit, 1) > 0;
}

bool mintcrate_collision_test_point(MintCrate_Active *active, float px, float py) {
    return mintcrate_collision_contains_point(mintcrate_active_collider_shape(active), px, py);
}

/* ============================================================================
 * Collision Scene Lifecycle
 * ============================================================================ */

MintCrate_CollisionScene *mintcrate_collision_scene_create(
    const MintCrate_CollisionSceneConfig *config)
{
    MintCrate_CollisionSceneConfig cfg = MINTCRATE_COLLISION_SCENE_DEFAULT;
    if (config) cfg = *config;

    if (cfg.max_actives <= 0) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionScene: max_actives must be positive (%d)", cfg.max_actives);
        return NULL;
    }
    if (!(cfg.cell_width > 0.0f) || !(cfg.cell_height > 0.0f)) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionScene: Cell size must be positive (%.2f x %.2f)",
                                 (double)cfg.cell_width, (double)cfg.cell_height);
        return NULL;
    }

    MintCrate_CollisionScene *scene = MINTCRATE_ALLOC(MintCrate_CollisionScene);
    if (!scene) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "CollisionScene: Failed to allocate scene");
        return NULL;
    }

    scene->actives = MINTCRATE_ALLOC_ARRAY(MintCrate_Active *, cfg.max_actives);
    if (!scene->actives) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "CollisionScene: Failed to allocate %d active slots", cfg.max_actives);
        free(scene);
        return NULL;
    }

    scene->max_actives = cfg.max_actives;
    scene->cell_width = cfg.cell_width;
    scene->cell_height = cfg.cell_height;

    return scene;
}

void mintcrate_collision_scene_destroy(MintCrate_CollisionScene *scene) {
    if (!scene) return;
    mintcrate_collision_masks_destroy(scene->masks);
    free(scene->actives);
    free(scene);
}

/* ============================================================================
 * Active Registration
 * ============================================================================ */

static int find_active(const MintCrate_CollisionScene *scene, const MintCrate_Active *active) {
    for (int i = 0; i < scene->active_count; i++) {
        if (scene->actives[i] == active) return i;
    }
    return -1;
}

bool mintcrate_collision_scene_add_active(MintCrate_CollisionScene *scene,
                                          MintCrate_Active *active) {
    MINTCRATE_VALIDATE_PTRS2_RET(scene, active, false);

    if (find_active(scene, active) >= 0) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionScene: Active '%s' is already registered",
                                 mintcrate_active_get_name(active));
        return false;
    }

    if (scene->active_count >= scene->max_actives) {
        mintcrate_set_error_code(MINTCRATE_ERR_CAPACITY,
                                 "CollisionScene: Maximum actives reached (%d)", scene->max_actives);
        mintcrate_log_warning(MINTCRATE_LOG_COLLISION,
                              "Scene full, '%s' not registered", mintcrate_active_get_name(active));
        return false;
    }

    scene->actives[scene->active_count++] = active;
    return true;
}

bool mintcrate_collision_scene_remove_active(MintCrate_CollisionScene *scene,
                                             MintCrate_Active *active) {
    if (!scene || !active) return false;

    int index = find_active(scene, active);
    if (index < 0) return false;

    memmove(&scene->actives[index], &scene->actives[index + 1],
            (size_t)(scene->active_count - index - 1) * sizeof(MintCrate_Active *));
    scene->active_count--;
    scene->actives[scene->active_count] = NULL;
    return true;
}

bool mintcrate_collision_scene_has_active(const MintCrate_CollisionScene *scene,
                                          const MintCrate_Active *active) {
    return scene && active && find_active(scene, active) >= 0;
}

int mintcrate_collision_scene_get_active_count(const MintCrate_CollisionScene *scene) {
    return scene ? scene->active_count : 0;
}

int mintcrate_collision_scene_get_capacity(const MintCrate_CollisionScene *scene) {
    return scene ? scene->max_actives : 0;
}

/* ============================================================================
 * Layouts
 * ============================================================================ */

bool mintcrate_collision_scene_load_layout(MintCrate_CollisionScene *scene,
                                           const MintCrate_BehaviorGrid *grid,
                                           float cell_width, float cell_height) {
    MINTCRATE_VALIDATE_PTRS2_RET(scene, grid, false);

    float cw = (cell_width == 0.0f) ? scene->cell_width : cell_width;
    float ch = (cell_height == 0.0f) ? scene->cell_height : cell_height;

    MintCrate_CollisionMaskSet *masks = mintcrate_collision_masks_compile(grid, cw, ch);
    if (!masks) {
        mintcrate_log_error(MINTCRATE_LOG_TILEMAP, "Layout rejected, keeping previous masks: %s",
                            mintcrate_get_last_error());
        return false;
    }

    /* Replace, never patch, the previous layout's masks */
    mintcrate_collision_masks_destroy(scene->masks);
    scene->masks = masks;

    int cols = 0, rows = 0;
    mintcrate_behavior_grid_get_size(grid, &cols, &rows);
    mintcrate_log_info(MINTCRATE_LOG_TILEMAP,
                       "Layout activated: %dx%d cells, %d masks across %d behavior codes",
                       cols, rows,
                       mintcrate_collision_masks_get_total(masks),
                       mintcrate_collision_masks_get_code_count(masks));
    return true;
}

bool mintcrate_collision_scene_load_tiles(MintCrate_CollisionScene *scene,
                                          const MintCrate_TileID *tiles, int cols, int rows,
                                          float cell_width, float cell_height) {
    MINTCRATE_VALIDATE_PTR_RET(scene, false);

    MintCrate_BehaviorGrid *grid = mintcrate_behavior_grid_from_tiles(tiles, cols, rows);
    if (!grid) {
        mintcrate_log_error(MINTCRATE_LOG_TILEMAP, "Layout rejected, keeping previous masks: %s",
                            mintcrate_get_last_error());
        return false;
    }

    bool loaded = mintcrate_collision_scene_load_layout(scene, grid, cell_width, cell_height);
    mintcrate_behavior_grid_destroy(grid);
    return loaded;
}

void mintcrate_collision_scene_clear_layout(MintCrate_CollisionScene *scene) {
    if (!scene) return;
    mintcrate_collision_masks_destroy(scene->masks);
    scene->masks = NULL;
}

bool mintcrate_collision_scene_has_layout(const MintCrate_CollisionScene *scene) {
    return scene && scene->masks;
}

MintCrate_CollisionMaskSet *mintcrate_collision_scene_get_masks(MintCrate_CollisionScene *scene) {
    return scene ? scene->masks : NULL;
}

/* ============================================================================
 * Frame
 * ============================================================================ */

void mintcrate_collision_scene_begin_frame(MintCrate_CollisionScene *scene) {
    if (!scene) return;
    mintcrate_collision_reset_frame(scene->actives, scene->active_count, scene->masks);
}

int mintcrate_collision_scene_test_behavior(MintCrate_CollisionScene *scene,
                                            MintCrate_Active *active, int32_t code,
                                            MintCrate_MaskHit *out_hits, int max_hits) {
    if (!scene) return 0;
    return mintcrate_collision_test_behavior(active, code, scene->masks, out_hits, max_hits);
}
