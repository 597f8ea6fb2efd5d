#ifndef MINTCRATE_ERROR_H
#define MINTCRATE_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * MintCrate Error Handling System
 *
 * Functions that fail return false or NULL and leave a message and an error
 * code in thread-local storage. The message is for people, the code lets
 * game code tell a malformed layout from a bad collider without parsing text.
 *
 * Usage:
 *   MintCrate_BehaviorGrid *grid = mintcrate_behavior_grid_from_rows(...);
 *   if (!grid) {
 *       if (mintcrate_get_last_error_code() == MINTCRATE_ERR_MALFORMED_GRID) {
 *           // e.g. "CollisionMask: Row 2 has 3 cells, expected 4"
 *       }
 *       mintcrate_log_and_clear_error(MINTCRATE_LOG_TILEMAP);
 *   }
 */

/** Error categories */
typedef enum MintCrate_ErrorCode {
    MINTCRATE_ERR_NONE = 0,
    MINTCRATE_ERR_UNKNOWN,            /**< Set through mintcrate_set_error() */
    MINTCRATE_ERR_INVALID_ARGUMENT,   /**< NULL pointer or value out of range */
    MINTCRATE_ERR_MALFORMED_GRID,     /**< Ragged rows or negative behavior codes */
    MINTCRATE_ERR_INVALID_COLLIDER,   /**< Collider definition breaks a rule */
    MINTCRATE_ERR_CAPACITY,           /**< Fixed-size container is full */
    MINTCRATE_ERR_OUT_OF_MEMORY,
    MINTCRATE_ERR_IO                  /**< File could not be opened or written */
} MintCrate_ErrorCode;

/**
 * Set an error message with printf-style formatting.
 * The code is recorded as MINTCRATE_ERR_UNKNOWN.
 * A NULL format clears the error.
 */
void mintcrate_set_error(const char *fmt, ...);

/**
 * Set an error message with va_list arguments.
 */
void mintcrate_set_error_v(const char *fmt, va_list args);

/**
 * Set an error code and message.
 * Messages longer than the buffer are cut and end in "...".
 *
 * @param code Error category (MINTCRATE_ERR_NONE clears the error)
 * @param fmt Format string (printf-style)
 */
void mintcrate_set_error_code(MintCrate_ErrorCode code, const char *fmt, ...);

void mintcrate_set_error_code_v(MintCrate_ErrorCode code, const char *fmt, va_list args);

/**
 * Get the last error message.
 * Returns an empty string if no error has been set.
 *
 * @return Pointer to the error message (thread-local, do not free)
 */
const char *mintcrate_get_last_error(void);

/**
 * Get the category of the last error.
 *
 * @return Code, or MINTCRATE_ERR_NONE if no error is set
 */
MintCrate_ErrorCode mintcrate_get_last_error_code(void);

/**
 * Get a short name for an error code ("malformed_grid", ...).
 */
const char *mintcrate_error_code_name(MintCrate_ErrorCode code);

/**
 * Clear the last error message and code.
 */
void mintcrate_clear_error(void);

/**
 * Check if an error is currently set.
 */
bool mintcrate_has_error(void);

/**
 * Log the last error at error level under a subsystem tag, then clear it.
 * Does nothing if no error is set.
 *
 * @param subsystem Log subsystem (NULL for MINTCRATE_LOG_CORE)
 */
void mintcrate_log_and_clear_error(const char *subsystem);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_ERROR_H */
