#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include <stdio.h>
#include <string.h>

#define MINTCRATE_ERROR_BUFFER_SIZE 1024

#if defined(_MSC_VER)
    #define MINTCRATE_THREAD_LOCAL __declspec(thread)
#else
    #define MINTCRATE_THREAD_LOCAL thread_local
#endif

/* One slot per thread: the most recent failure wins */
struct ErrorSlot {
    MintCrate_ErrorCode code;
    char message[MINTCRATE_ERROR_BUFFER_SIZE];
};

static MINTCRATE_THREAD_LOCAL ErrorSlot s_error = {MINTCRATE_ERR_NONE, {0}};

static const char *const code_names[] = {
    "none",
    "unknown",
    "invalid_argument",
    "malformed_grid",
    "invalid_collider",
    "capacity",
    "out_of_memory",
    "io",
};

void mintcrate_set_error_code_v(MintCrate_ErrorCode code, const char *fmt, va_list args) {
    if (!fmt || code == MINTCRATE_ERR_NONE) {
        mintcrate_clear_error();
        return;
    }

    int written = vsnprintf(s_error.message, sizeof(s_error.message), fmt, args);
    if (written >= (int)sizeof(s_error.message)) {
        memcpy(&s_error.message[sizeof(s_error.message) - 4], "...", 4);
    }
    s_error.code = s_error.message[0] != '\0' ? code : MINTCRATE_ERR_NONE;
}

void mintcrate_set_error_code(MintCrate_ErrorCode code, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_set_error_code_v(code, fmt, args);
    va_end(args);
}

void mintcrate_set_error_v(const char *fmt, va_list args) {
    mintcrate_set_error_code_v(MINTCRATE_ERR_UNKNOWN, fmt, args);
}

void mintcrate_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    mintcrate_set_error_code_v(MINTCRATE_ERR_UNKNOWN, fmt, args);
    va_end(args);
}

const char *mintcrate_get_last_error(void) {
    return s_error.message;
}

MintCrate_ErrorCode mintcrate_get_last_error_code(void) {
    return s_error.code;
}

const char *mintcrate_error_code_name(MintCrate_ErrorCode code) {
    int index = (int)code;
    if (index < 0 || index >= (int)(sizeof(code_names) / sizeof(code_names[0]))) {
        return "unknown";
    }
    return code_names[index];
}

void mintcrate_clear_error(void) {
    s_error.code = MINTCRATE_ERR_NONE;
    s_error.message[0] = '\0';
}

bool mintcrate_has_error(void) {
    return s_error.code != MINTCRATE_ERR_NONE;
}

void mintcrate_log_and_clear_error(const char *subsystem) {
    if (!mintcrate_has_error()) return;

    mintcrate_log_error(subsystem ? subsystem : MINTCRATE_LOG_CORE, "[%s] %s",
                        mintcrate_error_code_name(s_error.code), s_error.message);
    mintcrate_clear_error();
}
