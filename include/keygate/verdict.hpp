#pragma once

/**
 * @file verdict.hpp
 * @brief Activation state machine
 *
 * Pure decision logic: derives the gating verdict from a key record and the
 * device's anti-rollback watermark. No I/O; cheap enough to run on every
 * application foreground event.
 */

#include "keygate.hpp"

#include <optional>

namespace keygate {

/**
 * @brief Derive the verdict for a record at a point in time
 *
 * Checks run in this order:
 * 1. no record, or an unused record: Inactive
 * 2. local_now earlier than last_observed: Tampered (before expiry, so a
 *    rolled-back clock cannot revive an expired key)
 * 3. local_now past the binding's expiry: Expired
 * 4. otherwise: Active
 *
 * A record carrying the local Tampered status overlay evaluates to Tampered.
 * A used record without a binding evaluates to Inactive.
 *
 * @param record The key record, or std::nullopt if none is known
 * @param local_now The device's current wall-clock time
 * @param last_observed The watermark (std::nullopt before the first observation)
 */
[[nodiscard]] Verdict evaluate(const std::optional<ActivationKey>& record, Timestamp local_now,
                               const std::optional<Timestamp>& last_observed) noexcept;

/**
 * @brief Advance the watermark, never moving it backwards
 */
[[nodiscard]] Timestamp advance_watermark(const std::optional<Timestamp>& last_observed,
                                          Timestamp local_now) noexcept;

/**
 * @brief Combine the previous verdict with a freshly computed one
 *
 * Tampered and Expired are sticky: only a computed Inactive (the record was
 * reset or removed) leaves them. Tampered never returns to Active or Expired
 * directly.
 */
[[nodiscard]] Verdict next_verdict(Verdict previous, Verdict computed) noexcept;

/// Check if the application may run under this verdict
[[nodiscard]] constexpr bool is_runnable(Verdict verdict) noexcept {
    return verdict == Verdict::Active;
}

/// Check if the verdict locks the application until an admin reset
[[nodiscard]] constexpr bool is_locked(Verdict verdict) noexcept {
    return verdict == Verdict::Expired || verdict == Verdict::Tampered;
}

}  // namespace keygate
