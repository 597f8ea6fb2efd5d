/*
 * MintCrate Error Handling Tests
 *
 * Tests for the thread-local error buffer and the validation macros.
 */

#include <catch2/catch_test_macros.hpp>
#include "mintcrate/error.h"
#include "mintcrate/log.h"
#include "mintcrate/validate.h"
#include <cstring>
#include <string>
#include <thread>

/* ============================================================================
 * Basic Error Operations
 * ============================================================================ */

TEST_CASE("Error set and get", "[error][basic]") {
    mintcrate_clear_error();

    SECTION("Initial state has no error") {
        REQUIRE_FALSE(mintcrate_has_error());
        REQUIRE(strlen(mintcrate_get_last_error()) == 0);
    }

    SECTION("Set formatted error") {
        mintcrate_set_error("Row %d has %d cells, expected %d", 2, 3, 4);
        REQUIRE(mintcrate_has_error());
        REQUIRE(strcmp(mintcrate_get_last_error(), "Row 2 has 3 cells, expected 4") == 0);
    }

    SECTION("Latest error wins") {
        mintcrate_set_error("First");
        mintcrate_set_error("Second");
        REQUIRE(strcmp(mintcrate_get_last_error(), "Second") == 0);
    }

    SECTION("Clear error") {
        mintcrate_set_error("Something failed");
        mintcrate_clear_error();
        REQUIRE_FALSE(mintcrate_has_error());
    }

    SECTION("NULL format clears") {
        mintcrate_set_error("Something failed");
        mintcrate_set_error(nullptr);
        REQUIRE_FALSE(mintcrate_has_error());
    }

    SECTION("Long messages are truncated") {
        std::string long_msg(4096, 'x');
        mintcrate_set_error("%s", long_msg.c_str());
        const char *err = mintcrate_get_last_error();
        size_t len = strlen(err);
        REQUIRE(len < long_msg.size());
        REQUIRE(strcmp(err + len - 3, "...") == 0);
    }

    SECTION("Empty message is not an error") {
        mintcrate_set_error("");
        REQUIRE_FALSE(mintcrate_has_error());
    }

    mintcrate_clear_error();
}

TEST_CASE("Error buffer is per thread", "[error][thread]") {
    mintcrate_clear_error();
    mintcrate_set_error("Main thread error");

    bool other_had_error = true;
    std::thread worker([&other_had_error]() {
        other_had_error = mintcrate_has_error();
        mintcrate_set_error("Worker error");
    });
    worker.join();

    REQUIRE_FALSE(other_had_error);
    REQUIRE(strcmp(mintcrate_get_last_error(), "Main thread error") == 0);

    mintcrate_clear_error();
}

TEST_CASE("Log and clear error", "[error][log]") {
    mintcrate_clear_error();

    SECTION("Clears after logging") {
        mintcrate_set_error_code(MINTCRATE_ERR_CAPACITY, "Reported once");
        mintcrate_log_and_clear_error(MINTCRATE_LOG_COLLISION);
        REQUIRE_FALSE(mintcrate_has_error());
        REQUIRE(mintcrate_get_last_error_code() == MINTCRATE_ERR_NONE);
    }

    SECTION("No error is a no-op") {
        mintcrate_log_and_clear_error(nullptr);
        REQUIRE_FALSE(mintcrate_has_error());
    }
}

/* ============================================================================
 * Error Codes
 * ============================================================================ */

TEST_CASE("Error codes", "[error][code]") {
    mintcrate_clear_error();

    SECTION("Plain errors are unknown") {
        mintcrate_set_error("Something");
        REQUIRE(mintcrate_get_last_error_code() == MINTCRATE_ERR_UNKNOWN);
    }

    SECTION("Code and message are stored together") {
        mintcrate_set_error_code(MINTCRATE_ERR_MALFORMED_GRID, "Row %d is short", 3);
        REQUIRE(mintcrate_has_error());
        REQUIRE(mintcrate_get_last_error_code() == MINTCRATE_ERR_MALFORMED_GRID);
        REQUIRE(strcmp(mintcrate_get_last_error(), "Row 3 is short") == 0);
    }

    SECTION("NONE clears") {
        mintcrate_set_error_code(MINTCRATE_ERR_IO, "Disk");
        mintcrate_set_error_code(MINTCRATE_ERR_NONE, "ignored");
        REQUIRE_FALSE(mintcrate_has_error());
        REQUIRE(strlen(mintcrate_get_last_error()) == 0);
    }

    SECTION("Names") {
        REQUIRE(strcmp(mintcrate_error_code_name(MINTCRATE_ERR_NONE), "none") == 0);
        REQUIRE(strcmp(mintcrate_error_code_name(MINTCRATE_ERR_MALFORMED_GRID), "malformed_grid") == 0);
        REQUIRE(strcmp(mintcrate_error_code_name(MINTCRATE_ERR_INVALID_COLLIDER), "invalid_collider") == 0);
        REQUIRE(strcmp(mintcrate_error_code_name((MintCrate_ErrorCode)999), "unknown") == 0);
    }

    mintcrate_clear_error();
}

/* ============================================================================
 * Validation Macros
 * ============================================================================ */

static bool check_ptr(const void *ptr) {
    MINTCRATE_VALIDATE_PTR_RET(ptr, false);
    return true;
}

static int check_count(int count) {
    MINTCRATE_VALIDATE_NON_NEGATIVE_RET(count, -1);
    return count;
}

static bool check_size(float size) {
    MINTCRATE_VALIDATE_POSITIVE_F_RET(size, false);
    return true;
}

TEST_CASE("Validation macros", "[error][validate]") {
    mintcrate_clear_error();

    SECTION("Pointer check names the function and argument") {
        int value = 0;
        REQUIRE(check_ptr(&value));
        REQUIRE_FALSE(mintcrate_has_error());

        REQUIRE_FALSE(check_ptr(nullptr));
        REQUIRE(strstr(mintcrate_get_last_error(), "check_ptr") != nullptr);
        REQUIRE(strstr(mintcrate_get_last_error(), "null pointer: ptr") != nullptr);
        REQUIRE(mintcrate_get_last_error_code() == MINTCRATE_ERR_INVALID_ARGUMENT);
    }

    SECTION("Non-negative check") {
        REQUIRE(check_count(0) == 0);
        REQUIRE(check_count(-3) == -1);
        REQUIRE(strstr(mintcrate_get_last_error(), "count must be non-negative") != nullptr);
    }

    SECTION("Positive float check") {
        REQUIRE(check_size(0.5f));
        REQUIRE_FALSE(check_size(0.0f));
        REQUIRE_FALSE(check_size(-1.0f));
        REQUIRE(strstr(mintcrate_get_last_error(), "size must be positive") != nullptr);
    }

    mintcrate_clear_error();
}
