#include "mintcrate/shape.h"

MintCrate_Shape mintcrate_shape_none(void) {
    MintCrate_Shape shape = {};
    shape.kind = MINTCRATE_SHAPE_NONE;
    return shape;
}

MintCrate_Shape mintcrate_shape_rect(float x, float y, float w, float h) {
    MintCrate_Shape shape = {};
    shape.kind = MINTCRATE_SHAPE_RECTANGLE;
    shape.x = x;
    shape.y = y;
    shape.w = w;
    shape.h = h;
    return shape;
}

MintCrate_Shape mintcrate_shape_circle(float x, float y, float r) {
    MintCrate_Shape shape = {};
    shape.kind = MINTCRATE_SHAPE_CIRCLE;
    shape.x = x;
    shape.y = y;
    shape.r = r;
    return shape;
}

void mintcrate_shape_reset_flags(MintCrate_Shape *shape) {
    if (!shape) return;
    shape->colliding = false;
    shape->mouse_over = false;
}

const char *mintcrate_shape_kind_name(MintCrate_ShapeKind kind) {
    switch (kind) {
        case MINTCRATE_SHAPE_NONE:      return "none";
        case MINTCRATE_SHAPE_RECTANGLE: return "rectangle";
        case MINTCRATE_SHAPE_CIRCLE:    return "circle";
    }
    return "unknown";
}
