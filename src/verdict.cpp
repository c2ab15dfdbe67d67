#include "keygate/verdict.hpp"

namespace keygate {

Verdict evaluate(const std::optional<ActivationKey>& record, Timestamp local_now,
                 const std::optional<Timestamp>& last_observed) noexcept {
    if (!record || record->is_unused()) {
        return Verdict::Inactive;
    }

    if (record->status() == KeyStatus::Tampered) {
        return Verdict::Tampered;
    }

    if (!record->binding()) {
        return Verdict::Inactive;
    }

    // The clock moved backwards since this device last looked at it
    if (last_observed && local_now < *last_observed) {
        return Verdict::Tampered;
    }

    if (local_now > record->binding()->expires_at) {
        return Verdict::Expired;
    }

    return Verdict::Active;
}

Timestamp advance_watermark(const std::optional<Timestamp>& last_observed,
                            Timestamp local_now) noexcept {
    if (last_observed && *last_observed > local_now) {
        return *last_observed;
    }
    return local_now;
}

Verdict next_verdict(Verdict previous, Verdict computed) noexcept {
    if (computed == Verdict::Inactive) {
        return Verdict::Inactive;
    }

    switch (previous) {
        case Verdict::Tampered:
            return Verdict::Tampered;
        case Verdict::Expired:
            return computed == Verdict::Tampered ? Verdict::Tampered : Verdict::Expired;
        case Verdict::Inactive:
        case Verdict::Active:
            return computed;
    }
    return computed;
}

}  // namespace keygate
