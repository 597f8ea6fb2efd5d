#include "mintcrate/log.h"
#include "mintcrate/error.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#define MAX_LOG_CALLBACKS 8
#define MAX_SUBSYSTEM_LEVELS 16
#define SUBSYSTEM_WIDTH 10

#if defined(_WIN32)
    #define DEFAULT_LOG_PATH "mintcrate.log"
#else
    #define DEFAULT_LOG_PATH "/tmp/mintcrate.log"
#endif

struct LogCallbackEntry {
    MintCrate_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct SubsystemLevel {
    char name[SUBSYSTEM_WIDTH + 1];
    MintCrate_LogLevel level;
};

/* Global logger state; not thread-safe, like the rest of the frame loop */
static struct {
    FILE *file;
    char path[512];
    MintCrate_LogLevel level;
    bool console;

    LogCallbackEntry callbacks[MAX_LOG_CALLBACKS];
    uint32_t next_handle;

    SubsystemLevel overrides[MAX_SUBSYSTEM_LEVELS];
    int override_count;
} s_log = {
    NULL, {0}, MINTCRATE_LOG_LEVEL_INFO, true,
    {}, 1,
    {}, 0,
};

/* Padded to 7 chars for alignment */
static const char *const level_names[] = {
    "ERROR  ",
    "WARNING",
    "INFO   ",
    "DEBUG  "
};

static const SDL_LogPriority level_priorities[] = {
    SDL_LOG_PRIORITY_ERROR,
    SDL_LOG_PRIORITY_WARN,
    SDL_LOG_PRIORITY_INFO,
    SDL_LOG_PRIORITY_DEBUG
};

/* ============================================================================
 * Helpers
 * ============================================================================ */

static void format_timestamp(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", tm_info);
}

static void format_subsystem(char *buf, size_t size, const char *subsystem) {
    snprintf(buf, size, "%-*.*s", SUBSYSTEM_WIDTH, SUBSYSTEM_WIDTH,
             subsystem ? subsystem : "Unknown");
}

static SubsystemLevel *find_override(const char *subsystem) {
    char key[SUBSYSTEM_WIDTH + 1];
    format_subsystem(key, sizeof(key), subsystem);
    for (int i = 0; i < s_log.override_count; i++) {
        if (strcmp(s_log.overrides[i].name, key) == 0) {
            return &s_log.overrides[i];
        }
    }
    return NULL;
}

static void write_banner(const char *label) {
    if (!s_log.file) return;

    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));

    fprintf(s_log.file,
            "================================================================================\n"
            "=== MintCrate - %s: %s\n"
            "================================================================================\n",
            label, timestamp);
    fflush(s_log.file);
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

bool mintcrate_log_init(void) {
    return mintcrate_log_init_with_path(NULL);
}

bool mintcrate_log_init_with_path(const char *path) {
    if (s_log.file) {
        return true;
    }

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : DEFAULT_LOG_PATH);

    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        mintcrate_set_error_code(MINTCRATE_ERR_IO, "Log: Failed to open log file: %s", s_log.path);
        SDL_Log("%s", mintcrate_get_last_error());
        s_log.path[0] = '\0';
        return false;
    }

    fputc('\n', s_log.file);
    write_banner("Session Start");
    return true;
}

void mintcrate_log_shutdown(void) {
    if (!s_log.file) return;

    write_banner("Session End");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool mintcrate_log_is_initialized(void) {
    return s_log.file != NULL;
}

const char *mintcrate_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

void mintcrate_log_flush(void) {
    if (s_log.file) {
        fflush(s_log.file);
    }
}

/* ============================================================================
 * Filtering
 * ============================================================================ */

void mintcrate_log_set_level(MintCrate_LogLevel level) {
    s_log.level = level;
}

MintCrate_LogLevel mintcrate_log_get_level(void) {
    return s_log.level;
}

bool mintcrate_log_set_subsystem_level(const char *subsystem, MintCrate_LogLevel level) {
    SubsystemLevel *entry = find_override(subsystem);
    if (!entry) {
        if (s_log.override_count >= MAX_SUBSYSTEM_LEVELS) {
            mintcrate_set_error_code(MINTCRATE_ERR_CAPACITY,
                                     "Log: Maximum subsystem overrides reached (%d)",
                                     MAX_SUBSYSTEM_LEVELS);
            return false;
        }
        entry = &s_log.overrides[s_log.override_count++];
        format_subsystem(entry->name, sizeof(entry->name), subsystem);
    }
    entry->level = level;
    return true;
}

MintCrate_LogLevel mintcrate_log_get_subsystem_level(const char *subsystem) {
    const SubsystemLevel *entry = find_override(subsystem);
    return entry ? entry->level : s_log.level;
}

void mintcrate_log_clear_subsystem_levels(void) {
    s_log.override_count = 0;
}

void mintcrate_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

/* ============================================================================
 * Output
 * ============================================================================ */

void mintcrate_log_v(MintCrate_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    /* Errors always pass */
    if (level != MINTCRATE_LOG_LEVEL_ERROR && level > mintcrate_log_get_subsystem_level(subsystem)) {
        return;
    }

    char message[1024];
    vsnprintf(message, sizeof(message), fmt ? fmt : "", args);

    char tag[SUBSYSTEM_WIDTH + 1];
    format_subsystem(tag, sizeof(tag), subsystem);

    if (s_log.file) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));
        fprintf(s_log.file, "[%s] [%s] [%s] %s\n", timestamp, level_names[level], tag, message);

        if (level == MINTCRATE_LOG_LEVEL_ERROR) {
            fflush(s_log.file);
        }
    }

    if (s_log.console) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, level_priorities[level], "[%s] %s", tag, message);
    }

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        const LogCallbackEntry *entry = &s_log.callbacks[i];
        if (entry->callback) {
            entry->callback(level, tag, message, entry->userdata);
        }
    }
}

void mintcrate_log_error(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_log_v(MINTCRATE_LOG_LEVEL_ERROR, subsystem, fmt, args);
    va_end(args);
}

void mintcrate_log_warning(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_log_v(MINTCRATE_LOG_LEVEL_WARNING, subsystem, fmt, args);
    va_end(args);
}

void mintcrate_log_info(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_log_v(MINTCRATE_LOG_LEVEL_INFO, subsystem, fmt, args);
    va_end(args);
}

void mintcrate_log_debug(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_log_v(MINTCRATE_LOG_LEVEL_DEBUG, subsystem, fmt, args);
    va_end(args);
}

/* ============================================================================
 * Callbacks
 * ============================================================================ */

uint32_t mintcrate_log_add_callback(MintCrate_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry *entry = &s_log.callbacks[i];
        if (!entry->callback) {
            entry->callback = callback;
            entry->userdata = userdata;
            entry->handle = s_log.next_handle++;
            return entry->handle;
        }
    }
    return 0;
}

void mintcrate_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry *entry = &s_log.callbacks[i];
        if (entry->callback && entry->handle == handle) {
            *entry = LogCallbackEntry{};
            return;
        }
    }
}
