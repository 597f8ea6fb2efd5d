/**
 * @file shape.h
 * @brief Collider shapes shared by entities and tilemap collision masks
 *
 * A MintCrate_Shape is a small value type: a kind tag, an origin, the size
 * fields for that kind, and the two per-frame flags written by the collision
 * tests. Rectangles are anchored at their top-left corner, circles at their
 * center.
 *
 * Usage:
 *   MintCrate_Shape wall = mintcrate_shape_rect(0.0f, 0.0f, 32.0f, 16.0f);
 *   MintCrate_Shape ball = mintcrate_shape_circle(40.0f, 8.0f, 6.0f);
 *
 *   if (mintcrate_collision_intersects(&wall, &ball)) {
 *       // wall.colliding and ball.colliding are now true
 *   }
 */

#ifndef MINTCRATE_SHAPE_H
#define MINTCRATE_SHAPE_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Enumerations
 * ============================================================================ */

/** Shape kind */
typedef enum MintCrate_ShapeKind {
    MINTCRATE_SHAPE_NONE = 0,       /**< No collider; never collides */
    MINTCRATE_SHAPE_RECTANGLE = 1,  /**< Axis-aligned rectangle (x, y, w, h) */
    MINTCRATE_SHAPE_CIRCLE = 2      /**< Circle (center x, y and radius r) */
} MintCrate_ShapeKind;

/* ============================================================================
 * Data Structures
 * ============================================================================ */

/** Collider shape */
typedef struct MintCrate_Shape {
    MintCrate_ShapeKind kind;
    float x, y;           /**< Top-left (rectangle) or center (circle) */
    float w, h;           /**< Rectangle size, zero for other kinds */
    float r;              /**< Circle radius, zero for other kinds */
    bool colliding;       /**< Overlapped another shape this frame */
    bool mouse_over;      /**< Result of the last point test */
} MintCrate_Shape;

/* ============================================================================
 * Construction
 * ============================================================================ */

/**
 * Create a shape that never collides.
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_Shape mintcrate_shape_none(void);

/**
 * Create a rectangle shape.
 * Zero or negative sizes are accepted; such a rectangle never overlaps
 * anything because the strict overlap inequalities cannot hold.
 *
 * @param x Left edge
 * @param y Top edge
 * @param w Width
 * @param h Height
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_Shape mintcrate_shape_rect(float x, float y, float w, float h);

/**
 * Create a circle shape.
 * A zero radius is accepted and behaves as a point.
 *
 * @param x Center X
 * @param y Center Y
 * @param r Radius
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_Shape mintcrate_shape_circle(float x, float y, float r);

/**
 * Clear both per-frame flags.
 * Safe to call with NULL.
 */
void mintcrate_shape_reset_flags(MintCrate_Shape *shape);

/**
 * Get a display name for a shape kind ("none", "rectangle", "circle").
 *
 * @return Static string, never NULL
 */
const char *mintcrate_shape_kind_name(MintCrate_ShapeKind kind);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_SHAPE_H */
