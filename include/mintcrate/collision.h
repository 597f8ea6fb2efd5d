/**
 * @file collision.h
 * @brief Shape intersection and point containment tests
 *
 * Two layers of the same tests:
 * - Pure geometry (`mintcrate_collision_shapes_overlap`,
 *   `mintcrate_collision_point_in_shape`) reads both shapes and never writes.
 * - Flag-applying tests (`mintcrate_collision_intersects`,
 *   `mintcrate_collision_contains_point`) run the same geometry and record the
 *   result in the shapes' per-frame flags. Game code normally reaches these
 *   through the query functions in collision_query.h.
 *
 * Boundary rules:
 * - Rectangle vs rectangle: open intervals, touching edges do not overlap.
 * - Circle vs circle: center distance strictly less than the radius sum.
 * - Rectangle vs circle: distance from the circle center to the nearest point
 *   of the rectangle less than OR EQUAL to the radius. This differs from the
 *   two cases above and existing content depends on it.
 * - Point in rectangle: half-open, [x, x+w) by [y, y+h).
 * - Point in circle: distance less than or equal to the radius.
 * - Any test involving a MINTCRATE_SHAPE_NONE shape is false.
 *
 * Usage:
 *   MintCrate_Shape player = mintcrate_shape_circle(px, py, 6.0f);
 *   MintCrate_Shape crate = mintcrate_shape_rect(64.0f, 64.0f, 16.0f, 16.0f);
 *
 *   // Pure test, flags untouched
 *   bool touching = mintcrate_collision_shapes_overlap(&player, &crate);
 *
 *   // Same test, sets player.colliding / crate.colliding on overlap
 *   mintcrate_collision_intersects(&player, &crate);
 */

#ifndef MINTCRATE_COLLISION_H
#define MINTCRATE_COLLISION_H

#include "mintcrate/shape.h"

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Pure Geometry
 * ============================================================================ */

/**
 * Test two shapes for overlap without touching their flags.
 *
 * @param a First shape (NULL is treated as MINTCRATE_SHAPE_NONE)
 * @param b Second shape (NULL is treated as MINTCRATE_SHAPE_NONE)
 * @return true if the shapes overlap
 *
 * Thread Safety: Thread-safe (read-only)
 */
bool mintcrate_collision_shapes_overlap(const MintCrate_Shape *a, const MintCrate_Shape *b);

/**
 * Test if a point lies inside a shape without touching its flags.
 *
 * @param shape Shape to test (NULL is treated as MINTCRATE_SHAPE_NONE)
 * @param px Point X
 * @param py Point Y
 * @return true if the point is inside
 *
 * Thread Safety: Thread-safe (read-only)
 */
bool mintcrate_collision_point_in_shape(const MintCrate_Shape *shape, float px, float py);

/* ============================================================================
 * Flag-Applying Tests
 * ============================================================================ */

/**
 * Test two shapes for overlap and mark both as colliding on overlap.
 *
 * Returns false without any mutation if either shape is NULL or of kind
 * MINTCRATE_SHAPE_NONE. A miss never clears a flag set earlier in the frame.
 *
 * @param a First shape
 * @param b Second shape
 * @return true if the shapes overlap
 *
 * Thread Safety: NOT thread-safe (writes both shapes)
 */
bool mintcrate_collision_intersects(MintCrate_Shape *a, MintCrate_Shape *b);

/**
 * Test if a point lies inside a shape and store the result in mouse_over.
 *
 * Returns false without any mutation if the shape is NULL or of kind
 * MINTCRATE_SHAPE_NONE.
 *
 * @param shape Shape to test
 * @param px Point X
 * @param py Point Y
 * @return true if the point is inside
 *
 * Thread Safety: NOT thread-safe (writes the shape)
 */
bool mintcrate_collision_contains_point(MintCrate_Shape *shape, float px, float py);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_COLLISION_H */
