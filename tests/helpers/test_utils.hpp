#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities and helpers.
 */

#include "rres/core/error.hpp"

#include <optional>
#include <utility>

namespace test_helpers {

// =============================================================================
// Error checking helpers
// =============================================================================

/** @brief Run `fn`; return the rres::ErrorCode it threw, or nullopt if it returned. */
template <typename F>
std::optional<rres::ErrorCode> error_code_of(F&& fn) {
    try {
        std::forward<F>(fn)();
    } catch (const rres::Error& e) {
        return e.code();
    }
    return std::nullopt;
}

} // namespace test_helpers
