#ifndef MINTCRATE_VALIDATE_H
#define MINTCRATE_VALIDATE_H

#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * MintCrate Validation Framework
 *
 * Macro-based validation utilities for early-return error checking.
 * Integrates with MintCrate's error system for consistent error reporting.
 *
 * Usage:
 *   bool mintcrate_behavior_grid_set(MintCrate_BehaviorGrid *grid, int col, int row, int32_t code) {
 *       MINTCRATE_VALIDATE_PTR_RET(grid, false);
 *       MINTCRATE_VALIDATE_NON_NEGATIVE_RET(code, false);
 *       // ... actual implementation ...
 *       return true;
 *   }
 */

/*============================================================================
 * Pointer Validation
 *============================================================================*/

/**
 * Validate pointer is not NULL (with return value).
 */
#define MINTCRATE_VALIDATE_PTR_RET(ptr, ret) \
    do { \
        if (!(ptr)) { \
            mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT, "%s: null pointer: %s", __func__, #ptr); \
            return (ret); \
        } \
    } while(0)

#define MINTCRATE_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        if (!(p1)) { mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT, "%s: null pointer: %s", __func__, #p1); return (ret); } \
        if (!(p2)) { mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT, "%s: null pointer: %s", __func__, #p2); return (ret); } \
    } while(0)

/*============================================================================
 * Range Validation
 *============================================================================*/

/**
 * Validate value is non-negative (>= 0).
 */
#define MINTCRATE_VALIDATE_NON_NEGATIVE_RET(val, ret) \
    do { \
        if ((val) < 0) { \
            mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT, "%s: %s must be non-negative: %d", __func__, #val, (int)(val)); \
            return (ret); \
        } \
    } while(0)

/**
 * Validate float value is positive (> 0).
 */
#define MINTCRATE_VALIDATE_POSITIVE_F_RET(val, ret) \
    do { \
        if (!((val) > 0.0f)) { \
            mintcrate_set_error_code(MINTCRATE_ERR_INVALID_ARGUMENT, "%s: %s must be positive: %.2f", __func__, #val, (double)(val)); \
            return (ret); \
        } \
    } while(0)

/*============================================================================
 * Soft Validation (Warnings)
 *============================================================================*/

/**
 * Log warning but continue execution.
 * Use when invalid input should be handled gracefully.
 */
#define MINTCRATE_WARN_IF(cond, subsystem, msg) \
    do { \
        if (cond) { \
            mintcrate_log_warning((subsystem), "%s: %s", __func__, (msg)); \
        } \
    } while(0)

#endif /* MINTCRATE_VALIDATE_H */
