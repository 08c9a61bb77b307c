#ifndef PNGSTASH_CHUNK_TYPE_HPP_
#define PNGSTASH_CHUNK_TYPE_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pngstash {

// ============================================================================
// Chunk Type
// ============================================================================

/**
 * Four-byte PNG chunk tag.
 *
 * The case of each letter encodes one property bit (bit 5 of the byte):
 *   byte 0: ancillary (lowercase) / critical (uppercase)
 *   byte 1: private (lowercase) / public (uppercase)
 *   byte 2: reserved, uppercase in conforming files
 *   byte 3: safe to copy (lowercase) / unsafe to copy (uppercase)
 *
 * Tags read from a file are kept verbatim even when they are not letters,
 * so that foreign files survive a parse/serialize cycle unchanged. Tags
 * built from user input go through from_string(), which is strict.
 */
class PNGSTASH_EXPORT chunk_type {
public:
    static constexpr std::size_t size = 4;
    using bytes_type = std::array<std::uint8_t, size>;

    chunk_type() = default;

    /**
     * Wrap four bytes read from a file. Never fails.
     * @param bytes Raw tag bytes
     */
    explicit chunk_type(const bytes_type& bytes) noexcept : bytes_(bytes) {}

    /**
     * Build a tag from user input.
     * @param text Exactly four ASCII letters
     * @param out Receives the tag on success
     * @return Result, invalid_chunk_type if text is not four letters
     */
    [[nodiscard]] static stash_result from_string(std::string_view text, chunk_type& out);

    [[nodiscard]] const bytes_type& bytes() const noexcept { return bytes_; }

    // All four bytes are ASCII letters
    [[nodiscard]] bool is_valid() const noexcept;

    [[nodiscard]] bool is_critical() const noexcept {
        return (bytes_[0] & PROPERTY_BIT) == 0;
    }

    [[nodiscard]] bool is_public() const noexcept {
        return (bytes_[1] & PROPERTY_BIT) == 0;
    }

    // Informational only; parsing never rejects a lowercase third letter
    [[nodiscard]] bool is_reserved_bit_valid() const noexcept {
        return (bytes_[2] & PROPERTY_BIT) == 0;
    }

    [[nodiscard]] bool is_safe_to_copy() const noexcept {
        return (bytes_[3] & PROPERTY_BIT) != 0;
    }

    // Compare against a textual tag; tags of the wrong length never match
    [[nodiscard]] bool matches(std::string_view text) const noexcept;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const chunk_type&, const chunk_type&) noexcept = default;

private:
    static constexpr std::uint8_t PROPERTY_BIT = 0x20;

    bytes_type bytes_{};
};

} // namespace pngstash

#endif // PNGSTASH_CHUNK_TYPE_HPP_
