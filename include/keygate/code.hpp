#pragma once

/**
 * @file code.hpp
 * @brief Activation code generation
 *
 * Codes have the form `<prefix>-<issuance ms timestamp>-<suffix>`, e.g.
 * `YSK-1700000000000-7K2Q`. The suffix is drawn uniformly from [0-9A-Z]
 * with the OpenSSL CSPRNG. Uniqueness is probabilistic: the millisecond
 * timestamp plus 36^4 suffixes make collisions negligible for one issuer.
 */

#include "keygate/keygate.hpp"

#include <cstddef>
#include <string>

namespace keygate {
namespace code {

/// Characters a code suffix is drawn from
constexpr const char* ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/// Default code prefix
constexpr const char* DEFAULT_PREFIX = "YSK";

/// Default suffix length, also the shortest accepted (36^4 suffixes)
constexpr std::size_t DEFAULT_SUFFIX_LENGTH = 4;

/**
 * @brief Draw a random suffix of the given length from ALPHABET
 *
 * @return The suffix, or ErrorCode::Unknown if the CSPRNG failed
 */
[[nodiscard]] Result<std::string> random_suffix(std::size_t length);

/**
 * @brief Generate an activation code
 *
 * @param prefix Code prefix (non-empty, ASCII letters and digits)
 * @param issued_at Issuance time, rendered as milliseconds since the epoch
 * @param suffix_length Number of random suffix characters (at least DEFAULT_SUFFIX_LENGTH)
 */
[[nodiscard]] Result<std::string> generate(const std::string& prefix, Timestamp issued_at,
                                           std::size_t suffix_length = DEFAULT_SUFFIX_LENGTH);

/// Check that a prefix is non-empty and made of ASCII letters and digits
[[nodiscard]] bool is_valid_prefix(const std::string& prefix) noexcept;

/// Check that a code has the shape generate() produces for this prefix and suffix length
[[nodiscard]] bool is_well_formed(const std::string& code, const std::string& prefix = DEFAULT_PREFIX,
                                  std::size_t suffix_length = DEFAULT_SUFFIX_LENGTH) noexcept;

}  // namespace code
}  // namespace keygate
