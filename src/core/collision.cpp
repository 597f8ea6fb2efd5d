/**
 * @file collision.cpp
 * @brief Shape intersection and point containment tests
 */

#include "mintcrate/collision.h"

#include <math.h>

/* ============================================================================
 * Math Helpers
 * ============================================================================ */

static inline float clampf(float v, float min_v, float max_v) {
    if (v < min_v) return min_v;
    if (v > max_v) return max_v;
    return v;
}

static inline float distancef(float ax, float ay, float bx, float by) {
    float dx = ax - bx;
    float dy = ay - by;
    return sqrtf(dx * dx + dy * dy);
}

/* ============================================================================
 * Shape Pair Tests
 * ============================================================================ */

static bool rect_vs_rect(const MintCrate_Shape *a, const MintCrate_Shape *b) {
    return a->x < b->x + b->w
        && a->x + a->w > b->x
        && a->y < b->y + b->h
        && a->y + a->h > b->y;
}

static bool circle_vs_circle(const MintCrate_Shape *a, const MintCrate_Shape *b) {
    return distancef(a->x, a->y, b->x, b->y) < a->r + b->r;
}

/* Nearest point of the rectangle to the circle center, then a non-strict
 * radius check. */
static bool rect_vs_circle(const MintCrate_Shape *rect, const MintCrate_Shape *circle) {
    float nearest_x = clampf(circle->x, rect->x, rect->x + rect->w);
    float nearest_y = clampf(circle->y, rect->y, rect->y + rect->h);
    return distancef(circle->x, circle->y, nearest_x, nearest_y) <= circle->r;
}

/* ============================================================================
 * Pure Geometry
 * ============================================================================ */

bool mintcrate_collision_shapes_overlap(const MintCrate_Shape *a, const MintCrate_Shape *b) {
    if (!a || !b) return false;

    switch (a->kind) {
        case MINTCRATE_SHAPE_NONE:
            return false;

        case MINTCRATE_SHAPE_RECTANGLE:
            switch (b->kind) {
                case MINTCRATE_SHAPE_NONE:      return false;
                case MINTCRATE_SHAPE_RECTANGLE: return rect_vs_rect(a, b);
                case MINTCRATE_SHAPE_CIRCLE:    return rect_vs_circle(a, b);
            }
            break;

        case MINTCRATE_SHAPE_CIRCLE:
            switch (b->kind) {
                case MINTCRATE_SHAPE_NONE:      return false;
                case MINTCRATE_SHAPE_RECTANGLE: return rect_vs_circle(b, a);
                case MINTCRATE_SHAPE_CIRCLE:    return circle_vs_circle(a, b);
            }
            break;
    }

    return false;
}

bool mintcrate_collision_point_in_shape(const MintCrate_Shape *shape, float px, float py) {
    if (!shape) return false;

    switch (shape->kind) {
        case MINTCRATE_SHAPE_NONE:
            return false;

        case MINTCRATE_SHAPE_RECTANGLE:
            return px >= shape->x
                && py >= shape->y
                && px < shape->x + shape->w
                && py < shape->y + shape->h;

        case MINTCRATE_SHAPE_CIRCLE:
            return distancef(px, py, shape->x, shape->y) <= shape->r;
    }

    return false;
}

/* ============================================================================
 * Flag-Applying Tests
 * ============================================================================ */

bool mintcrate_collision_intersects(MintCrate_Shape *a, MintCrate_Shape *b) {
    if (!mintcrate_collision_shapes_overlap(a, b)) {
        return false;
    }

    a->colliding = true;
    b->colliding = true;
    return true;
}

bool mintcrate_collision_contains_point(MintCrate_Shape *shape, float px, float py) {
    if (!shape || shape->kind == MINTCRATE_SHAPE_NONE) {
        return false;
    }

    bool inside = mintcrate_collision_point_in_shape(shape, px, py);
    shape->mouse_over = inside;
    return inside;
}
