/**
 * @file active.h
 * @brief Movable entities ("Actives") and the colliders they own
 *
 * An Active is a named object with a logical position and one collider.
 * The collider is a shape plus a fixed offset from the Active's origin; its
 * position is re-derived by every position setter, so it always equals
 * (x + offset_x, y + offset_y). There is no other way to move it.
 *
 * Collider definitions follow the resource rules of the framework:
 * - width + height (both non-zero) define a rectangle,
 * - radius defines a circle,
 * - the two are mutually exclusive, and at least one must be given.
 * A NULL definition creates an Active with no collider, which never collides.
 *
 * Usage:
 *   MintCrate_ColliderDef def = MINTCRATE_COLLIDER_DEF_DEFAULT;
 *   def.offset_x = -8.0f;
 *   def.offset_y = -16.0f;
 *   def.width = 16.0f;
 *   def.height = 16.0f;
 *
 *   MintCrate_Active *player = mintcrate_active_create("player", &def, 64.0f, 96.0f);
 *   if (!player) {
 *       SDL_Log("%s", mintcrate_get_last_error());
 *   }
 *
 *   mintcrate_active_move(player, 2.0f, 0.0f);
 *   float feet = mintcrate_active_get_bottom_edge(player);
 *
 *   mintcrate_active_destroy(player);
 */

#ifndef MINTCRATE_ACTIVE_H
#define MINTCRATE_ACTIVE_H

#include "mintcrate/shape.h"

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Constants
 * ============================================================================ */

/** Maximum stored name length, including terminator (longer names are truncated) */
#define MINTCRATE_ACTIVE_NAME_MAX 64

/* ============================================================================
 * Collider Definition
 * ============================================================================ */

/** Collider definition, as declared alongside an Active's resources */
typedef struct MintCrate_ColliderDef {
    float offset_x;     /**< Offset from the Active's origin to the shape origin */
    float offset_y;
    float width;        /**< Rectangle width (0 for circles) */
    float height;       /**< Rectangle height (0 for circles) */
    float radius;       /**< Circle radius (0 for rectangles) */
} MintCrate_ColliderDef;

/** Empty definition; fill in either width/height or radius */
#define MINTCRATE_COLLIDER_DEF_DEFAULT { \
    .offset_x = 0.0f, \
    .offset_y = 0.0f, \
    .width = 0.0f, \
    .height = 0.0f, \
    .radius = 0.0f \
}

/** Collider owned by an Active */
typedef struct MintCrate_Collider {
    MintCrate_Shape shape;
    float offset_x;
    float offset_y;
} MintCrate_Collider;

/**
 * Validate a collider definition.
 * On failure the error buffer names the rule that was broken.
 *
 * @param def Definition to check
 * @return true if the definition describes exactly one rectangle or circle
 *
 * Thread Safety: Thread-safe (error buffer is thread-local)
 */
bool mintcrate_collider_def_validate(const MintCrate_ColliderDef *def);

/**
 * Get the shape kind a definition produces.
 *
 * @return MINTCRATE_SHAPE_CIRCLE if radius is non-zero, MINTCRATE_SHAPE_NONE
 *         for NULL, otherwise MINTCRATE_SHAPE_RECTANGLE
 */
MintCrate_ShapeKind mintcrate_collider_def_get_kind(const MintCrate_ColliderDef *def);

/* ============================================================================
 * Active Lifecycle
 * ============================================================================ */

typedef struct MintCrate_Active MintCrate_Active;

/**
 * Create an Active.
 * Caller OWNS the returned pointer and MUST call mintcrate_active_destroy().
 *
 * @param name Display name (NULL for none)
 * @param def Collider definition (NULL for no collider)
 * @param x Initial X position
 * @param y Initial Y position
 * @return Active, or NULL on failure (invalid definition, allocation failure)
 */
MintCrate_Active *mintcrate_active_create(const char *name,
                                          const MintCrate_ColliderDef *def,
                                          float x, float y);

/**
 * Destroy an Active.
 * Safe to call with NULL. Remove it from any collision scene first.
 */
void mintcrate_active_destroy(MintCrate_Active *active);

/**
 * Get the Active's name.
 *
 * @return Internal string (empty if unnamed, "" for NULL)
 */
const char *mintcrate_active_get_name(const MintCrate_Active *active);

/* ============================================================================
 * Position
 * ============================================================================ */

float mintcrate_active_get_x(const MintCrate_Active *active);
float mintcrate_active_get_y(const MintCrate_Active *active);

/**
 * Set the X position; the collider follows.
 */
void mintcrate_active_set_x(MintCrate_Active *active, float x);

/**
 * Set the Y position; the collider follows.
 */
void mintcrate_active_set_y(MintCrate_Active *active, float y);

/**
 * Set both coordinates; the collider follows.
 */
void mintcrate_active_set_position(MintCrate_Active *active, float x, float y);

/**
 * Move by a delta; the collider follows.
 */
void mintcrate_active_move(MintCrate_Active *active, float dx, float dy);

/* ============================================================================
 * Collider Queries
 * ============================================================================ */

/**
 * Get a read-only view of the Active's collider shape.
 * Intended for debug overlays and diagnostics.
 *
 * @return Internal shape, or NULL if active is NULL
 */
const MintCrate_Shape *mintcrate_active_get_collider(const MintCrate_Active *active);

/**
 * Check whether the Active has a collider (shape kind is not NONE).
 */
bool mintcrate_active_has_collider(const MintCrate_Active *active);

/** Rectangle collider width (0 for other kinds) */
float mintcrate_active_get_width(const MintCrate_Active *active);

/** Rectangle collider height (0 for other kinds) */
float mintcrate_active_get_height(const MintCrate_Active *active);

/** Circle collider radius (0 for other kinds) */
float mintcrate_active_get_radius(const MintCrate_Active *active);

/**
 * Collider bounding edges in world space.
 * For rectangles these are the rectangle's sides, for circles the sides of
 * the circle's bounding square, and for no collider the collider origin.
 */
float mintcrate_active_get_left_edge(const MintCrate_Active *active);
float mintcrate_active_get_right_edge(const MintCrate_Active *active);
float mintcrate_active_get_top_edge(const MintCrate_Active *active);
float mintcrate_active_get_bottom_edge(const MintCrate_Active *active);

/**
 * Check whether the collider overlapped anything this frame.
 */
bool mintcrate_active_is_colliding(const MintCrate_Active *active);

/**
 * Check whether the last point test found the cursor over the collider.
 */
bool mintcrate_active_is_mouse_over(const MintCrate_Active *active);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_ACTIVE_H */
