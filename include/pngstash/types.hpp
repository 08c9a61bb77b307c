#ifndef PNGSTASH_TYPES_HPP_
#define PNGSTASH_TYPES_HPP_

#include <pngstash/pngstash_export.h>

#include <cstdint>
#include <string>
#include <utility>

namespace pngstash {

// ============================================================================
// Errors
// ============================================================================

enum class stash_error {
    none,
    invalid_signature,
    invalid_format,
    invalid_chunk_type,
    not_found,
    invalid_encoding,
    io_error
};

[[nodiscard]] PNGSTASH_EXPORT const char* to_string(stash_error err) noexcept;

// ============================================================================
// Result
// ============================================================================

struct stash_result {
    bool ok = false;
    stash_error error = stash_error::none;
    std::string message;

    [[nodiscard]] static stash_result success() {
        return {true, stash_error::none, {}};
    }

    [[nodiscard]] static stash_result failure(stash_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct stash_options {
    // Reject chunk tags read from a file unless they are four ASCII letters
    bool strict_chunk_types = false;

    // Largest accepted chunk data length, on parse and for encoded messages
    // (PNG limits it to 2^31 - 1)
    std::uint32_t max_chunk_length = 0x7FFFFFFFu;

    // Place encoded chunks before IEND instead of at the end of the file
    bool insert_before_iend = false;
};

} // namespace pngstash

#endif // PNGSTASH_TYPES_HPP_
