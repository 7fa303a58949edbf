#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helper
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                            \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

// Checks that a future holds a SyncError carrying `expected_code`.
#define TEST_CHECK_SYNC_ERROR(future, expected_code)                                  \
    do {                                                                     \
        bool caught_ = false;                                                \
        try {                                                                \
            (void)(future).get();                                            \
        } catch (const ::statesync::core::sync::SyncError& e_) {             \
            caught_ = (e_.code() == (expected_code));                                 \
        }                                                                    \
        TEST_CHECK(caught_);                                                 \
    } while (0)
