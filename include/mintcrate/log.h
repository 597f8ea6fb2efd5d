#ifndef MINTCRATE_LOG_H
#define MINTCRATE_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * MintCrate Logging System
 *
 * File-based logging with subsystem tags and log levels, echoed to the
 * console through SDL_Log.
 *
 * Usage:
 *   // Initialize at startup
 *   mintcrate_log_init();  // Default path: /tmp/mintcrate.log (Unix) or mintcrate.log (Windows)
 *   // Or: mintcrate_log_init_with_path("game.log");
 *
 *   mintcrate_log_info(MINTCRATE_LOG_TILEMAP, "Layout '%s' activated", name);
 *   mintcrate_log_warning(MINTCRATE_LOG_COLLISION, "Scene full (%d actives)", max);
 *   mintcrate_log_error(MINTCRATE_LOG_COLLISION, "Malformed behavior grid");
 *
 *   // Shutdown at exit
 *   mintcrate_log_shutdown();
 *
 * Logging before mintcrate_log_init() still reaches the console and any
 * registered callbacks; only the file sink is skipped.
 *
 * Output format:
 *   [2024-01-15 14:30:22] [ERROR  ] [Collision ] Malformed behavior grid
 */

/**
 * Log levels - higher values include lower levels
 */
typedef enum {
    MINTCRATE_LOG_LEVEL_ERROR = 0,    /**< Critical errors, always logged, auto-flush */
    MINTCRATE_LOG_LEVEL_WARNING = 1,  /**< Warnings that may indicate problems */
    MINTCRATE_LOG_LEVEL_INFO = 2,     /**< General information */
    MINTCRATE_LOG_LEVEL_DEBUG = 3     /**< Verbose debug output */
} MintCrate_LogLevel;

/**
 * Predefined subsystem identifiers
 */
#define MINTCRATE_LOG_CORE       "Core"
#define MINTCRATE_LOG_COLLISION  "Collision"
#define MINTCRATE_LOG_TILEMAP    "Tilemap"
#define MINTCRATE_LOG_ROOM       "Room"
#define MINTCRATE_LOG_GAME       "Game"

/**
 * Log callback. Receives the padded subsystem name and the formatted message
 * (without timestamp).
 */
typedef void (*MintCrate_LogCallback)(MintCrate_LogLevel level,
                                      const char *subsystem,
                                      const char *message,
                                      void *userdata);

/**
 * Initialize the logging system with the default log file path.
 *
 * @return true on success, false on failure
 */
bool mintcrate_log_init(void);

/**
 * Initialize the logging system with a custom log file path.
 *
 * @param path Path to the log file (NULL uses default)
 * @return true on success, false on failure
 */
bool mintcrate_log_init_with_path(const char *path);

/**
 * Shutdown the logging system.
 * Writes session end marker and closes the log file.
 */
void mintcrate_log_shutdown(void);

/**
 * Check if the logging system is initialized.
 */
bool mintcrate_log_is_initialized(void);

/**
 * Set the current log level filter.
 * Messages above this level will not be logged.
 */
void mintcrate_log_set_level(MintCrate_LogLevel level);

/**
 * Get the current log level filter.
 */
MintCrate_LogLevel mintcrate_log_get_level(void);

/**
 * Override the level filter for one subsystem.
 * Useful for tracing mask compilation without turning on DEBUG everywhere:
 *   mintcrate_log_set_subsystem_level(MINTCRATE_LOG_COLLISION, MINTCRATE_LOG_LEVEL_DEBUG);
 *
 * @param subsystem Subsystem identifier (compared by name)
 * @param level Level for this subsystem
 * @return false if all override slots are in use
 */
bool mintcrate_log_set_subsystem_level(const char *subsystem, MintCrate_LogLevel level);

/**
 * Get the effective level filter for a subsystem.
 */
MintCrate_LogLevel mintcrate_log_get_subsystem_level(const char *subsystem);

/**
 * Remove every subsystem override.
 */
void mintcrate_log_clear_subsystem_levels(void);

/**
 * Set whether to also output to console (SDL_Log).
 * Enabled by default.
 */
void mintcrate_log_set_console_output(bool enabled);

/**
 * Log an error message.
 * Errors are always logged regardless of level, and auto-flush.
 *
 * @param subsystem Subsystem identifier (e.g., MINTCRATE_LOG_COLLISION)
 * @param fmt Printf-style format string
 * @param ... Format arguments
 */
void mintcrate_log_error(const char *subsystem, const char *fmt, ...);

/** Log a warning message. */
void mintcrate_log_warning(const char *subsystem, const char *fmt, ...);

/** Log an info message. */
void mintcrate_log_info(const char *subsystem, const char *fmt, ...);

/** Log a debug message. */
void mintcrate_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Log with explicit level (variadic version).
 */
void mintcrate_log_v(MintCrate_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/**
 * Flush the log file to disk.
 */
void mintcrate_log_flush(void);

/**
 * Get the path to the current log file.
 *
 * @return Path to log file, or NULL if not initialized
 */
const char *mintcrate_log_get_path(void);

/**
 * Register a callback that receives every message passing the level filter.
 *
 * @param callback Function to call
 * @param userdata Passed through to the callback
 * @return Handle for removal, or 0 if no slot is free
 */
uint32_t mintcrate_log_add_callback(MintCrate_LogCallback callback, void *userdata);

/**
 * Remove a previously registered callback. Unknown handles are ignored.
 */
void mintcrate_log_remove_callback(uint32_t handle);

#ifdef __cplusplus
}
#endif

#endif /* MINTCRATE_LOG_H */
