/**
 * @file collision_mask.h
 * @brief Tilemap behavior grids and compiled collision masks
 *
 * A behavior grid assigns every tilemap cell a behavior code: 0 means
 * "no collider", any other value is a collision category chosen by the game
 * (solid ground, spikes, water...). The mask compiler turns a grid into a set
 * of rectangles per code, in pixels, that cover exactly the non-zero cells
 * with no two rectangles overlapping.
 *
 * Rectangles are found by a greedy row-major scan: at each unconsumed cell the
 * rectangle is extended right as far as the code repeats, then down as long as
 * every cell of that span repeats the code. The result is deterministic and
 * stable across runs, which existing levels rely on; it is not the minimal
 * rectangle cover.
 *
 * Usage:
 *   // Grid straight from a tile layout: every non-empty tile is solid (1)
 *   MintCrate_BehaviorGrid *grid = mintcrate_behavior_grid_from_tiles(tiles, 40, 30);
 *
 *   // Or an explicit behavior layer
 *   MintCrate_BehaviorGrid *grid = mintcrate_behavior_grid_create(40, 30);
 *   mintcrate_behavior_grid_set(grid, 3, 29, BEHAVIOR_SPIKES);
 *
 *   MintCrate_CollisionMaskSet *masks =
 *       mintcrate_collision_masks_compile(grid, 16.0f, 16.0f);
 *   mintcrate_behavior_grid_destroy(grid);
 *
 *   int count = 0;
 *   MintCrate_Shape *spikes = mintcrate_collision_masks_get(masks, BEHAVIOR_SPIKES, &count);
 *
 *   mintcrate_collision_masks_destroy(masks);
 */

#ifndef MINTCRATE_COLLISION_MASK_H
#define MINTCRATE_COLLISION_MASK_H

#include "mintcrate/shape.h"

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

/* Tile ID: 0 = empty, 1+ = tileset index */
typedef uint16_t MintCrate_TileID;

#define MINTCRATE_TILE_EMPTY 0

/** Behavior code for cells without a collider */
#define MINTCRATE_BEHAVIOR_EMPTY 0

/** Behavior code assigned to every non-empty tile by the default binarization */
#define MINTCRATE_BEHAVIOR_SOLID 1

/* Opaque types */
typedef struct MintCrate_BehaviorGrid MintCrate_BehaviorGrid;
typedef struct MintCrate_CollisionMaskSet MintCrate_CollisionMaskSet;

/* ============================================================================
 * Behavior Grid
 * ============================================================================ */

/**
 * Create a behavior grid filled with MINTCRATE_BEHAVIOR_EMPTY.
 * Caller OWNS the returned pointer and MUST call mintcrate_behavior_grid_destroy().
 *
 * @param cols Number of columns (0 allowed)
 * @param rows Number of rows (0 allowed)
 * @return Grid, or NULL on failure (negative size, allocation failure)
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_BehaviorGrid *mintcrate_behavior_grid_create(int cols, int rows);

/**
 * Create a behavior grid from row arrays.
 * Every row must have the same length. A ragged grid is rejected rather than
 * truncated or padded.
 * Caller OWNS the returned pointer and MUST call mintcrate_behavior_grid_destroy().
 *
 * @param rows Array of row_count row pointers
 * @param row_lengths Length of each row
 * @param row_count Number of rows (0 creates an empty grid)
 * @return Grid, or NULL on failure (ragged rows, negative codes, NULL arrays)
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_BehaviorGrid *mintcrate_behavior_grid_from_rows(
    const int32_t *const *rows, const int *row_lengths, int row_count);

/**
 * Create the default behavior grid for a tile layout with no behavior data:
 * every tile other than MINTCRATE_TILE_EMPTY becomes MINTCRATE_BEHAVIOR_SOLID.
 * Caller OWNS the returned pointer and MUST call mintcrate_behavior_grid_destroy().
 *
 * @param tiles Row-major tile indices (cols * rows entries, may be NULL if empty)
 * @param cols Number of columns
 * @param rows Number of rows
 * @return Grid, or NULL on failure
 *
 * Thread Safety: Thread-safe (no shared state)
 */
MintCrate_BehaviorGrid *mintcrate_behavior_grid_from_tiles(
    const MintCrate_TileID *tiles, int cols, int rows);

/**
 * Create a deep copy of a behavior grid.
 * Caller OWNS the returned pointer and MUST call mintcrate_behavior_grid_destroy().
 *
 * @return Copy, or NULL on failure
 */
MintCrate_BehaviorGrid *mintcrate_behavior_grid_clone(const MintCrate_BehaviorGrid *grid);

/**
 * Destroy a behavior grid.
 * Safe to call with NULL.
 */
void mintcrate_behavior_grid_destroy(MintCrate_BehaviorGrid *grid);

/**
 * Get grid dimensions.
 *
 * @param grid Grid to query
 * @param out_cols Output column count (can be NULL)
 * @param out_rows Output row count (can be NULL)
 */
void mintcrate_behavior_grid_get_size(const MintCrate_BehaviorGrid *grid,
                                      int *out_cols, int *out_rows);

/**
 * Get the behavior code of a cell.
 *
 * @return Code, or MINTCRATE_BEHAVIOR_EMPTY if out of bounds or grid is NULL
 */
int32_t mintcrate_behavior_grid_get(const MintCrate_BehaviorGrid *grid, int col, int row);

/**
 * Set the behavior code of a cell.
 *
 * @return true on success, false if out of bounds or code is negative
 */
bool mintcrate_behavior_grid_set(MintCrate_BehaviorGrid *grid, int col, int row, int32_t code);

/* ============================================================================
 * Mask Compilation
 * ============================================================================ */

/**
 * Compile a behavior grid into collision masks.
 * Caller OWNS the returned pointer and MUST call mintcrate_collision_masks_destroy().
 *
 * The grid is not modified. An empty or all-zero grid produces an empty set.
 *
 * @param grid Source grid
 * @param cell_width Width of one cell in pixels (must be > 0)
 * @param cell_height Height of one cell in pixels (must be > 0)
 * @return Mask set, or NULL on failure
 *
 * Thread Safety: Thread-safe (reads grid only)
 */
MintCrate_CollisionMaskSet *mintcrate_collision_masks_compile(
    const MintCrate_BehaviorGrid *grid, float cell_width, float cell_height);

/**
 * Destroy a mask set.
 * Safe to call with NULL.
 */
void mintcrate_collision_masks_destroy(MintCrate_CollisionMaskSet *masks);

/**
 * Get the number of distinct behavior codes with at least one mask.
 */
int mintcrate_collision_masks_get_code_count(const MintCrate_CollisionMaskSet *masks);

/**
 * Get a behavior code by index. Codes are in ascending order.
 *
 * @return Code, or MINTCRATE_BEHAVIOR_EMPTY if index is out of range
 */
int32_t mintcrate_collision_masks_get_code(const MintCrate_CollisionMaskSet *masks, int index);

/**
 * Check whether a behavior code has masks in this set.
 */
bool mintcrate_collision_masks_has_code(const MintCrate_CollisionMaskSet *masks, int32_t code);

/**
 * Get the masks for a behavior code, in scan order.
 * The returned array is owned by the set and stays valid until it is
 * destroyed. Entries may be written to only through the collision tests.
 *
 * @param masks Mask set
 * @param code Behavior code
 * @param out_count Output number of rectangles (set to 0 if the code is absent)
 * @return Rectangle array, or NULL if the code has no masks
 */
MintCrate_Shape *mintcrate_collision_masks_get(MintCrate_CollisionMaskSet *masks,
                                               int32_t code, int *out_count);

/**
 * Get the total number of rectangles across all codes.
 */
int mintcrate_collision_masks_get_total(const MintCrate_CollisionMaskSet *masks);

/**
 * Get the cell size the set was compiled with.
 *
 * @param out_width Output cell width (can be NULL)
 * @param out_height Output cell height (can be NULL)
 */
void mintcrate_collision_masks_get_cell_size(const MintCrate_CollisionMaskSet *masks,
                                             float *out_width, float *out_height);

/**
 * Clear the per-frame flags of every mask.
 * Safe to call with NULL.
 *
 * Thread Safety: NOT thread-safe
 */
void mintcrate_collision_masks_reset_flags(MintCrate_CollisionMaskSet *masks);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_COLLISION_MASK_H */
