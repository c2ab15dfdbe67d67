#include "keygate/code.hpp"
#include "keygate/json.hpp"

#include <openssl/rand.h>

#include <vector>

namespace keygate {
namespace code {

namespace {

constexpr std::size_t kAlphabetSize = 36;

// Largest multiple of the alphabet size that fits in a byte; bytes at or
// above it are rejected so every character is equally likely
constexpr unsigned int kRejectionBound = 256 - (256 % kAlphabetSize);

bool is_ascii_alnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_suffix_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z');
}

}  // namespace

Result<std::string> random_suffix(std::size_t length) {
    std::string suffix;
    suffix.reserve(length);

    std::vector<unsigned char> buffer(length * 2 + 8);
    while (suffix.size() < length) {
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            return Result<std::string>::error(ErrorCode::Unknown, "Random generator failure");
        }
        for (unsigned char byte : buffer) {
            if (byte >= kRejectionBound) {
                continue;
            }
            suffix += ALPHABET[byte % kAlphabetSize];
            if (suffix.size() == length) {
                break;
            }
        }
    }
    return Result<std::string>::ok(std::move(suffix));
}

Result<std::string> generate(const std::string& prefix, Timestamp issued_at,
                             std::size_t suffix_length) {
    if (!is_valid_prefix(prefix)) {
        return Result<std::string>::error(ErrorCode::ValidationError,
                                          "Code prefix must be non-empty letters and digits");
    }
    if (suffix_length < DEFAULT_SUFFIX_LENGTH) {
        return Result<std::string>::error(ErrorCode::ValidationError,
                                          "Code suffix needs at least " +
                                              std::to_string(DEFAULT_SUFFIX_LENGTH) + " characters");
    }

    auto suffix = random_suffix(suffix_length);
    if (suffix.is_error()) {
        return suffix;
    }

    return Result<std::string>::ok(prefix + "-" + std::to_string(json::to_millis(issued_at)) + "-" +
                                   suffix.value());
}

bool is_valid_prefix(const std::string& prefix) noexcept {
    if (prefix.empty()) {
        return false;
    }
    for (char c : prefix) {
        if (!is_ascii_alnum(c)) {
            return false;
        }
    }
    return true;
}

bool is_well_formed(const std::string& code, const std::string& prefix,
                    std::size_t suffix_length) noexcept {
    // <prefix>-<digits>-<suffix>
    if (code.size() < prefix.size() + suffix_length + 3 || code.compare(0, prefix.size(), prefix) != 0 ||
        code[prefix.size()] != '-') {
        return false;
    }

    std::size_t suffix_start = code.size() - suffix_length;
    if (code[suffix_start - 1] != '-') {
        return false;
    }

    for (std::size_t i = prefix.size() + 1; i < suffix_start - 1; ++i) {
        if (code[i] < '0' || code[i] > '9') {
            return false;
        }
    }
    for (std::size_t i = suffix_start; i < code.size(); ++i) {
        if (!is_suffix_char(code[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace code
}  // namespace keygate
