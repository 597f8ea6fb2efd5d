#ifndef MINTCRATE_H
#define MINTCRATE_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

// C++ compatibility for memory allocation
#define MINTCRATE_ALLOC(type) (type*)calloc(1, sizeof(type))
#define MINTCRATE_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define MINTCRATE_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))

// Version info
#define MINTCRATE_VERSION_MAJOR 0
#define MINTCRATE_VERSION_MINOR 3
#define MINTCRATE_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * MintCrate follows the same ownership patterns across all of its APIs:
 *
 * 1. CREATE/DESTROY PAIRS:
 *    Functions named `mintcrate_*_create()` (and the `*_compile()` /
 *    `*_from_*()` builders) return pointers the caller OWNS. The caller
 *    MUST call the matching `mintcrate_*_destroy()`. Every destroy function
 *    accepts NULL.
 *
 *    Examples:
 *      MintCrate_BehaviorGrid *grid = mintcrate_behavior_grid_create(40, 30);
 *      mintcrate_behavior_grid_destroy(grid);
 *
 *      MintCrate_CollisionMaskSet *masks =
 *          mintcrate_collision_masks_compile(grid, 16, 16);
 *      mintcrate_collision_masks_destroy(masks);
 *
 * 2. GET FUNCTIONS:
 *    Functions named `mintcrate_*_get_*()` return pointers to internally-owned
 *    data. The caller does NOT own these pointers and must NOT free them.
 *    The pointer is valid until the parent object is destroyed or, for a
 *    collision scene, until its layout is replaced.
 *
 * 3. BORROWED REGISTRATIONS:
 *    Objects handed to a collision scene (Actives) are borrowed. The scene
 *    never frees them; remove them before destroying them.
 *
 * 4. CONST CHAR* RETURNS:
 *    Functions returning `const char*` return either static strings or
 *    pointers to internal buffers. The caller must NOT free these.
 *
 * 5. NULL ON FAILURE:
 *    All allocating functions return NULL on failure. Always check return
 *    values. Use mintcrate_get_last_error() for error details.
 *
 *============================================================================*/

// Core infrastructure
#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include "mintcrate/validate.h"

// Collision subsystem
#include "mintcrate/shape.h"
#include "mintcrate/collision.h"
#include "mintcrate/collision_mask.h"
#include "mintcrate/active.h"
#include "mintcrate/collision_query.h"

#endif // MINTCRATE_H
