/**
 * @file active.cpp
 * @brief Movable entities and their colliders
 */

#include "mintcrate/mintcrate.h"
#include "mintcrate/active.h"
#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include "active_internal.h"

#include <stdio.h>
#include <stdlib.h>

struct MintCrate_Active {
    char name[MINTCRATE_ACTIVE_NAME_MAX];
    float x, y;
    MintCrate_Collider collider;
};

/* ============================================================================
 * Collider Definition
 * ============================================================================ */

bool mintcrate_collider_def_validate(const MintCrate_ColliderDef *def) {
    if (!def) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "Collider: Definition is NULL");
        return false;
    }

    if (def->width < 0.0f || def->height < 0.0f || def->radius < 0.0f) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_COLLIDER,
                                 "Collider: Dimensions cannot be negative (w=%.2f, h=%.2f, r=%.2f)",
                                 (double)def->width, (double)def->height, (double)def->radius);
        return false;
    }

    if (def->width == 0.0f && def->height == 0.0f && def->radius == 0.0f) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_COLLIDER,
                                 "Collider: Non-zero dimensions must be provided");
        return false;
    }

    if ((def->width != 0.0f || def->height != 0.0f) && def->radius != 0.0f) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_COLLIDER,
                                 "Collider: Width/height cannot be specified along with radius, "
                                 "they are mutually exclusive");
        return false;
    }

    if (def->width != 0.0f && def->height == 0.0f) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_COLLIDER,
                                 "Collider: Width was non-zero, but height was not");
        return false;
    }

    if (def->width == 0.0f && def->height != 0.0f) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_COLLIDER,
                                 "Collider: Height was non-zero, but width was not");
        return false;
    }

    return true;
}

MintCrate_ShapeKind mintcrate_collider_def_get_kind(const MintCrate_ColliderDef *def) {
    if (!def) return MINTCRATE_SHAPE_NONE;
    return def->radius != 0.0f ? MINTCRATE_SHAPE_CIRCLE : MINTCRATE_SHAPE_RECTANGLE;
}

/* Shape origin is always the entity origin plus the fixed offset */
static void collider_sync(MintCrate_Collider *collider, float x, float y) {
    collider->shape.x = x + collider->offset_x;
    collider->shape.y = y + collider->offset_y;
}

/* ============================================================================
 * Active Lifecycle
 * ============================================================================ */

MintCrate_Active *mintcrate_active_create(const char *name,
                                          const MintCrate_ColliderDef *def,
                                          float x, float y)
{
    if (def && !mintcrate_collider_def_validate(def)) {
        mintcrate_log_error(MINTCRATE_LOG_COLLISION, "Invalid collider for '%s': %s",
                            name ? name : "", mintcrate_get_last_error());
        return NULL;
    }

    MintCrate_Active *active = MINTCRATE_ALLOC(MintCrate_Active);
    if (!active) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "Active: Failed to allocate '%s'", name ? name : "");
        return NULL;
    }

    snprintf(active->name, sizeof(active->name), "%s", name ? name : "");
    active->x = x;
    active->y = y;

    switch (mintcrate_collider_def_get_kind(def)) {
        case MINTCRATE_SHAPE_NONE:
            active->collider.shape = mintcrate_shape_none();
            break;
        case MINTCRATE_SHAPE_RECTANGLE:
            active->collider.shape = mintcrate_shape_rect(0.0f, 0.0f, def->width, def->height);
            break;
        case MINTCRATE_SHAPE_CIRCLE:
            active->collider.shape = mintcrate_shape_circle(0.0f, 0.0f, def->radius);
            break;
    }

    if (def) {
        active->collider.offset_x = def->offset_x;
        active->collider.offset_y = def->offset_y;
    }
    collider_sync(&active->collider, x, y);

    return active;
}

void mintcrate_active_destroy(MintCrate_Active *active) {
    free(active);
}

const char *mintcrate_active_get_name(const MintCrate_Active *active) {
    return active ? active->name : "";
}

/* ============================================================================
 * Position
 * ============================================================================ */

float mintcrate_active_get_x(const MintCrate_Active *active) {
    return active ? active->x : 0.0f;
}

float mintcrate_active_get_y(const MintCrate_Active *active) {
    return active ? active->y : 0.0f;
}

void mintcrate_active_set_x(MintCrate_Active *active, float x) {
    if (!active) return;
    active->x = x;
    collider_sync(&active->collider, active->x, active->y);
}

void mintcrate_active_set_y(MintCrate_Active *active, float y) {
    if (!active) return;
    active->y = y;
    collider_sync(&active->collider, active->x, active->y);
}

void mintcrate_active_set_position(MintCrate_Active *active, float x, float y) {
    if (!active) return;
    active->x = x;
    active->y = y;
    collider_sync(&active->collider, active->x, active->y);
}

void mintcrate_active_move(MintCrate_Active *active, float dx, float dy) {
    if (!active) return;
    mintcrate_active_set_position(active, active->x + dx, active->y + dy);
}

/* ============================================================================
 * Collider Queries
 * ============================================================================ */

MintCrate_Shape *mintcrate_active_collider_shape(MintCrate_Active *active) {
    return active ? &active->collider.shape : NULL;
}

const MintCrate_Shape *mintcrate_active_get_collider(const MintCrate_Active *active) {
    return active ? &active->collider.shape : NULL;
}

bool mintcrate_active_has_collider(const MintCrate_Active *active) {
    return active && active->collider.shape.kind != MINTCRATE_SHAPE_NONE;
}

float mintcrate_active_get_width(const MintCrate_Active *active) {
    return active ? active->collider.shape.w : 0.0f;
}

float mintcrate_active_get_height(const MintCrate_Active *active) {
    return active ? active->collider.shape.h : 0.0f;
}

float mintcrate_active_get_radius(const MintCrate_Active *active) {
    return active ? active->collider.shape.r : 0.0f;
}

float mintcrate_active_get_left_edge(const MintCrate_Active *active) {
    if (!active) return 0.0f;
    const MintCrate_Shape *s = &active->collider.shape;
    return s->kind == MINTCRATE_SHAPE_CIRCLE ? s->x - s->r : s->x;
}

float mintcrate_active_get_right_edge(const MintCrate_Active *active) {
    if (!active) return 0.0f;
    const MintCrate_Shape *s = &active->collider.shape;
    return s->kind == MINTCRATE_SHAPE_CIRCLE ? s->x + s->r : s->x + s->w;
}

float mintcrate_active_get_top_edge(const MintCrate_Active *active) {
    if (!active) return 0.0f;
    const MintCrate_Shape *s = &active->collider.shape;
    return s->kind == MINTCRATE_SHAPE_CIRCLE ? s->y - s->r : s->y;
}

float mintcrate_active_get_bottom_edge(const MintCrate_Active *active) {
    if (!active) return 0.0f;
    const MintCrate_Shape *s = &active->collider.shape;
    return s->kind == MINTCRATE_SHAPE_CIRCLE ? s->y + s->r : s->y + s->h;
}

bool mintcrate_active_is_colliding(const MintCrate_Active *active) {
    return active && active->collider.shape.colliding;
}

bool mintcrate_active_is_mouse_over(const MintCrate_Active *active) {
    return active && active->collider.shape.mouse_over;
}
