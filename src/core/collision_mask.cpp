/**
 * @file collision_mask.cpp
 * @brief Behavior grids and the greedy collision mask compiler
 */

#include "mintcrate/mintcrate.h"
#include "mintcrate/collision_mask.h"
#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include "mintcrate/validate.h"

#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Internal Types
 * ============================================================================ */

struct MintCrate_BehaviorGrid {
    int cols;
    int rows;
    int32_t *cells;     /* Row-major, cols * rows entries (NULL when empty) */
};

/* All masks sharing one behavior code */
typedef struct MaskBucket {
    int32_t code;
    MintCrate_Shape *rects;
    int count;
    int capacity;
} MaskBucket;

struct MintCrate_CollisionMaskSet {
    MaskBucket *buckets;    /* Sorted by code, ascending */
    int bucket_count;
    int bucket_capacity;
    int total;
    float cell_width;
    float cell_height;
};

/* ============================================================================
 * Grid Helpers
 * ============================================================================ */

static inline size_t cell_index(int cols, int col, int row) {
    return (size_t)row * (size_t)cols + (size_t)col;
}

static inline size_t grid_cell_count(const MintCrate_BehaviorGrid *grid) {
    return (size_t)grid->cols * (size_t)grid->rows;
}

static MintCrate_BehaviorGrid *grid_alloc(int cols, int rows) {
    if (cols < 0 || rows < 0) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionMask: Grid size must be non-negative (%d x %d)", cols, rows);
        return NULL;
    }

    MintCrate_BehaviorGrid *grid = MINTCRATE_ALLOC(MintCrate_BehaviorGrid);
    if (!grid) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "CollisionMask: Failed to allocate behavior grid");
        return NULL;
    }

    grid->cols = cols;
    grid->rows = rows;

    size_t count = (size_t)cols * (size_t)rows;
    if (count > 0) {
        grid->cells = MINTCRATE_ALLOC_ARRAY(int32_t, count);
        if (!grid->cells) {
            mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                     "CollisionMask: Failed to allocate %dx%d behavior grid", cols, rows);
            free(grid);
            return NULL;
        }
    }

    return grid;
}

/* ============================================================================
 * Behavior Grid
 * ============================================================================ */

MintCrate_BehaviorGrid *mintcrate_behavior_grid_create(int cols, int rows) {
    return grid_alloc(cols, rows);
}

MintCrate_BehaviorGrid *mintcrate_behavior_grid_from_rows(
    const int32_t *const *rows, const int *row_lengths, int row_count)
{
    MINTCRATE_VALIDATE_NON_NEGATIVE_RET(row_count, NULL);

    if (row_count == 0) {
        return grid_alloc(0, 0);
    }

    MINTCRATE_VALIDATE_PTRS2_RET(rows, row_lengths, NULL);

    /* Every row must match the first one */
    int cols = row_lengths[0];
    for (int r = 0; r < row_count; r++) {
        if (row_lengths[r] != cols) {
            mintcrate_set_error_code(MINTCRATE_ERR_MALFORMED_GRID,
                                     "CollisionMask: Row %d has %d cells, expected %d",
                                     r, row_lengths[r], cols);
            mintcrate_log_error(MINTCRATE_LOG_COLLISION,
                                "Malformed behavior grid: row %d has %d cells, expected %d",
                                r, row_lengths[r], cols);
            return NULL;
        }
        if (cols > 0 && !rows[r]) {
            mintcrate_set_error_code(MINTCRATE_ERR_MALFORMED_GRID,
                                     "CollisionMask: Row %d is NULL", r);
            return NULL;
        }
    }

    MintCrate_BehaviorGrid *grid = grid_alloc(cols, row_count);
    if (!grid) return NULL;

    for (int r = 0; r < row_count; r++) {
        for (int c = 0; c < cols; c++) {
            int32_t code = rows[r][c];
            if (code < 0) {
                mintcrate_set_error_code(MINTCRATE_ERR_MALFORMED_GRID,
                                         "CollisionMask: Negative behavior code %d at row %d, column %d",
                                         (int)code, r, c);
                mintcrate_behavior_grid_destroy(grid);
                return NULL;
            }
            grid->cells[cell_index(cols, c, r)] = code;
        }
    }

    return grid;
}

MintCrate_BehaviorGrid *mintcrate_behavior_grid_from_tiles(
    const MintCrate_TileID *tiles, int cols, int rows)
{
    MintCrate_BehaviorGrid *grid = grid_alloc(cols, rows);
    if (!grid) return NULL;

    size_t count = grid_cell_count(grid);
    if (count > 0 && !tiles) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionMask: Tile array is NULL for a %dx%d layout", cols, rows);
        mintcrate_behavior_grid_destroy(grid);
        return NULL;
    }

    for (size_t i = 0; i < count; i++) {
        grid->cells[i] = (tiles[i] == MINTCRATE_TILE_EMPTY)
            ? MINTCRATE_BEHAVIOR_EMPTY
            : MINTCRATE_BEHAVIOR_SOLID;
    }

    return grid;
}

MintCrate_BehaviorGrid *mintcrate_behavior_grid_clone(const MintCrate_BehaviorGrid *grid) {
    MINTCRATE_VALIDATE_PTR_RET(grid, NULL);

    MintCrate_BehaviorGrid *copy = grid_alloc(grid->cols, grid->rows);
    if (!copy) return NULL;

    size_t count = grid_cell_count(grid);
    if (count > 0) {
        memcpy(copy->cells, grid->cells, count * sizeof(int32_t));
    }
    return copy;
}

void mintcrate_behavior_grid_destroy(MintCrate_BehaviorGrid *grid) {
    if (!grid) return;
    free(grid->cells);
    free(grid);
}

void mintcrate_behavior_grid_get_size(const MintCrate_BehaviorGrid *grid,
                                      int *out_cols, int *out_rows) {
    if (out_cols) *out_cols = grid ? grid->cols : 0;
    if (out_rows) *out_rows = grid ? grid->rows : 0;
}

int32_t mintcrate_behavior_grid_get(const MintCrate_BehaviorGrid *grid, int col, int row) {
    if (!grid) return MINTCRATE_BEHAVIOR_EMPTY;
    if (col < 0 || row < 0 || col >= grid->cols || row >= grid->rows) {
        return MINTCRATE_BEHAVIOR_EMPTY;
    }
    return grid->cells[cell_index(grid->cols, col, row)];
}

bool mintcrate_behavior_grid_set(MintCrate_BehaviorGrid *grid, int col, int row, int32_t code) {
    MINTCRATE_VALIDATE_PTR_RET(grid, false);
    MINTCRATE_VALIDATE_NON_NEGATIVE_RET(code, false);

    if (col < 0 || row < 0 || col >= grid->cols || row >= grid->rows) {
        mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT,
                                 "CollisionMask: Cell (%d, %d) outside %dx%d grid",
                                 col, row, grid->cols, grid->rows);
        return false;
    }

    grid->cells[cell_index(grid->cols, col, row)] = code;
    return true;
}

/* ============================================================================
 * Mask Buckets
 * ============================================================================ */

/* Binary search; returns the bucket index, or the insertion point when absent */
static int bucket_search(const MintCrate_CollisionMaskSet *masks, int32_t code, bool *out_found) {
    int lo = 0;
    int hi = masks->bucket_count;
    while (lo < hi) {
        int mid = lo + (hi - lo) / 2;
        if (masks->buckets[mid].code < code) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    *out_found = (lo < masks->bucket_count && masks->buckets[lo].code == code);
    return lo;
}

static const MaskBucket *bucket_find(const MintCrate_CollisionMaskSet *masks, int32_t code) {
    bool found = false;
    int index = bucket_search(masks, code, &found);
    return found ? &masks->buckets[index] : NULL;
}

static MaskBucket *bucket_get_or_insert(MintCrate_CollisionMaskSet *masks, int32_t code) {
    bool found = false;
    int index = bucket_search(masks, code, &found);
    if (found) return &masks->buckets[index];

    if (masks->bucket_count >= masks->bucket_capacity) {
        int new_cap = masks->bucket_capacity > 0 ? masks->bucket_capacity * 2 : 4;
        MaskBucket *new_arr = MINTCRATE_REALLOC(masks->buckets, MaskBucket, new_cap);
        if (!new_arr) return NULL;
        masks->buckets = new_arr;
        masks->bucket_capacity = new_cap;
    }

    memmove(&masks->buckets[index + 1], &masks->buckets[index],
            (size_t)(masks->bucket_count - index) * sizeof(MaskBucket));

    MaskBucket *bucket = &masks->buckets[index];
    memset(bucket, 0, sizeof(*bucket));
    bucket->code = code;
    masks->bucket_count++;
    return bucket;
}

static bool bucket_push(MaskBucket *bucket, const MintCrate_Shape *rect) {
    if (bucket->count >= bucket->capacity) {
        int new_cap = bucket->capacity > 0 ? bucket->capacity * 2 : 8;
        MintCrate_Shape *new_arr = MINTCRATE_REALLOC(bucket->rects, MintCrate_Shape, new_cap);
        if (!new_arr) return false;
        bucket->rects = new_arr;
        bucket->capacity = new_cap;
    }

    bucket->rects[bucket->count++] = *rect;
    return true;
}

/* ============================================================================
 * Mask Compilation
 * ============================================================================ */

/* True if every cell of row in [first_col, last_col] holds code */
static bool row_span_matches(const int32_t *work, int cols, int row,
                             int first_col, int last_col, int32_t code) {
    for (int c = first_col; c <= last_col; c++) {
        if (work[cell_index(cols, c, row)] != code) {
            return false;
        }
    }
    return true;
}

MintCrate_CollisionMaskSet *mintcrate_collision_masks_compile(
    const MintCrate_BehaviorGrid *grid, float cell_width, float cell_height)
{
    MINTCRATE_VALIDATE_PTR_RET(grid, NULL);
    MINTCRATE_VALIDATE_POSITIVE_F_RET(cell_width, NULL);
    MINTCRATE_VALIDATE_POSITIVE_F_RET(cell_height, NULL);

    MintCrate_CollisionMaskSet *masks = MINTCRATE_ALLOC(MintCrate_CollisionMaskSet);
    if (!masks) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "CollisionMask: Failed to allocate mask set");
        return NULL;
    }
    masks->cell_width = cell_width;
    masks->cell_height = cell_height;

    const int cols = grid->cols;
    const int rows = grid->rows;
    const size_t count = grid_cell_count(grid);
    if (count == 0) {
        return masks;
    }

    /* Consumed cells are zeroed in a working copy so no cell is covered twice */
    int32_t *work = MINTCRATE_ALLOC_ARRAY(int32_t, count);
    if (!work) {
        mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                 "CollisionMask: Failed to allocate working grid");
        mintcrate_collision_masks_destroy(masks);
        return NULL;
    }
    memcpy(work, grid->cells, count * sizeof(int32_t));

    for (int row = 0; row < rows; row++) {
        for (int col = 0; col < cols; col++) {
            const int32_t code = work[cell_index(cols, col, row)];
            if (code == MINTCRATE_BEHAVIOR_EMPTY) {
                continue;
            }

            /* Extend right first... */
            int end_col = col;
            while (end_col + 1 < cols && work[cell_index(cols, end_col + 1, row)] == code) {
                end_col++;
            }

            /* ...then down, one full span at a time */
            int end_row = row;
            while (end_row + 1 < rows &&
                   row_span_matches(work, cols, end_row + 1, col, end_col, code)) {
                end_row++;
            }

            for (int r = row; r <= end_row; r++) {
                for (int c = col; c <= end_col; c++) {
                    work[cell_index(cols, c, r)] = MINTCRATE_BEHAVIOR_EMPTY;
                }
            }

            MintCrate_Shape rect = mintcrate_shape_rect(
                (float)col, (float)row,
                (float)(end_col - col + 1), (float)(end_row - row + 1));

            MaskBucket *bucket = bucket_get_or_insert(masks, code);
            if (!bucket || !bucket_push(bucket, &rect)) {
                mintcrate_set_error_code(MINTCRATE_ERR_OUT_OF_MEMORY,
                                         "CollisionMask: Failed to allocate mask for behavior %d", (int)code);
                free(work);
                mintcrate_collision_masks_destroy(masks);
                return NULL;
            }
            masks->total++;
        }
    }

    free(work);

    /* Cell units to pixels */
    for (int b = 0; b < masks->bucket_count; b++) {
        MaskBucket *bucket = &masks->buckets[b];
        for (int i = 0; i < bucket->count; i++) {
            MintCrate_Shape *rect = &bucket->rects[i];
            rect->x *= cell_width;
            rect->y *= cell_height;
            rect->w *= cell_width;
            rect->h *= cell_height;
        }
    }

    mintcrate_log_debug(MINTCRATE_LOG_COLLISION,
                        "Compiled %dx%d behavior grid into %d masks (%d behavior codes)",
                        cols, rows, masks->total, masks->bucket_count);

    return masks;
}

void mintcrate_collision_masks_destroy(MintCrate_CollisionMaskSet *masks) {
    if (!masks) return;
    for (int b = 0; b < masks->bucket_count; b++) {
        free(masks->buckets[b].rects);
    }
    free(masks->buckets);
    free(masks);
}

/* ============================================================================
 * Mask Queries
 * ============================================================================ */

int mintcrate_collision_masks_get_code_count(const MintCrate_CollisionMaskSet *masks) {
    return masks ? masks->bucket_count : 0;
}

int32_t mintcrate_collision_masks_get_code(const MintCrate_CollisionMaskSet *masks, int index) {
    if (!masks || index < 0 || index >= masks->bucket_count) {
        return MINTCRATE_BEHAVIOR_EMPTY;
    }
    return masks->buckets[index].code;
}

bool mintcrate_collision_masks_has_code(const MintCrate_CollisionMaskSet *masks, int32_t code) {
    return masks && bucket_find(masks, code) != NULL;
}

MintCrate_Shape *mintcrate_collision_masks_get(MintCrate_CollisionMaskSet *masks,
                                               int32_t code, int *out_count) {
    if (out_count) *out_count = 0;
    if (!masks) return NULL;

    bool found = false;
    int index = bucket_search(masks, code, &found);
    if (!found) return NULL;

    MaskBucket *bucket = &masks->buckets[index];
    if (out_count) *out_count = bucket->count;
    return bucket->rects;
}

int mintcrate_collision_masks_get_total(const MintCrate_CollisionMaskSet *masks) {
    return masks ? masks->total : 0;
}

void mintcrate_collision_masks_get_cell_size(const MintCrate_CollisionMaskSet *masks,
                                             float *out_width, float *out_height) {
    if (!masks) return;
    if (out_width) *out_width = masks->cell_width;
    if (out_height) *out_height = masks->cell_height;
}

void mintcrate_collision_masks_reset_flags(MintCrate_CollisionMaskSet *masks) {
    if (!masks) return;
    for (int b = 0; b < masks->bucket_count; b++) {
        MaskBucket *bucket = &masks->buckets[b];
        for (int i = 0; i < bucket->count; i++) {
            mintcrate_shape_reset_flags(&bucket->rects[i]);
        }
    }
}
