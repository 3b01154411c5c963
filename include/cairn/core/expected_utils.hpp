#pragma once

#include <expected>
#include <format>
#include <utility>

namespace cairn::core {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   CAIRN_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define CAIRN_TRY_ASSIGN(lhs, expr)                                                           \
    do {                                                                                      \
        auto cairn_try_tmp = (expr);                                                          \
        if (!cairn_try_tmp)                                                                   \
            return std::unexpected(cairn_try_tmp.error());                                    \
        lhs = std::move(cairn_try_tmp.value());                                               \
    } while (0)

/**
 * @brief Void-or-return helper
 *
 * Usage: CAIRN_TRY_VOID(some_void_expected_result);
 */
#define CAIRN_TRY_VOID(expr)                                                                  \
    do {                                                                                      \
        auto cairn_try_tmp_void = (expr);                                                     \
        if (!cairn_try_tmp_void)                                                              \
            return std::unexpected(cairn_try_tmp_void.error());                               \
    } while (0)

/**
 * @brief Assign-or-return helper that rewraps the error as ErrorType with context
 *
 * Usage:
 *   CAIRN_TRY_ASSIGN_CTX(value, expr, SolveError, "Failed to compute X");
 */
#define CAIRN_TRY_ASSIGN_CTX(lhs, expr, ErrorType, context)                                   \
    do {                                                                                      \
        auto cairn_try_tmp_ctx = (expr);                                                      \
        if (!cairn_try_tmp_ctx) {                                                             \
            return std::unexpected(ErrorType(                                                 \
                std::format("{}: {}", (context), cairn_try_tmp_ctx.error().message())));     \
        }                                                                                     \
        lhs = std::move(cairn_try_tmp_ctx.value());                                           \
    } while (0)

} // namespace cairn::core
