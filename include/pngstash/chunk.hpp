#ifndef PNGSTASH_CHUNK_HPP_
#define PNGSTASH_CHUNK_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>
#include <pngstash/chunk_type.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pngstash {

// ============================================================================
// Chunk
// ============================================================================

/**
 * A single PNG chunk: [length u32 BE][type][data][crc u32 BE].
 *
 * The CRC is not stored. It is computed over type + data whenever it is
 * needed, so a constructed chunk always serializes with a matching CRC.
 */
class PNGSTASH_EXPORT chunk {
public:
    static constexpr std::size_t LENGTH_SIZE = 4;
    static constexpr std::size_t CRC_SIZE = 4;
    static constexpr std::size_t HEADER_SIZE = LENGTH_SIZE + chunk_type::size;
    static constexpr std::size_t MIN_SIZE = HEADER_SIZE + CRC_SIZE;

    // Largest data length PNG allows in a chunk (2^31 - 1)
    static constexpr std::uint32_t MAX_LENGTH = 0x7FFFFFFFu;

    chunk() = default;

    /**
     * Build a chunk from a type and payload.
     * The payload must not exceed MAX_LENGTH bytes; longer payloads cannot be
     * represented in the 32-bit length field and will not parse back.
     */
    chunk(chunk_type type, std::vector<std::uint8_t> data);

    /**
     * Parse one chunk from the front of a buffer.
     * @param data Bytes starting at a chunk's length field
     * @param out Receives the chunk on success
     * @param consumed Receives the number of bytes the chunk occupies (may be null)
     * @param options Parse options
     * @return Result, invalid_format on truncation, overlong length or CRC mismatch
     */
    [[nodiscard]] static stash_result parse(std::span<const std::uint8_t> data,
                                            chunk& out,
                                            std::size_t* consumed = nullptr,
                                            const stash_options& options = {});

    [[nodiscard]] const chunk_type& type() const noexcept { return type_; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }

    [[nodiscard]] std::uint32_t length() const noexcept {
        return static_cast<std::uint32_t>(data_.size());
    }

    // CRC-32 over type + data
    [[nodiscard]] std::uint32_t crc() const;

    /**
     * Interpret the payload as UTF-8 text.
     * @param out Receives the text on success
     * @return Result, invalid_encoding if the payload is not valid UTF-8
     */
    [[nodiscard]] stash_result data_as_string(std::string& out) const;

    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    // Append the serialized chunk to an existing buffer
    void write_to(std::vector<std::uint8_t>& out) const;

    // e.g. "ruSt (15 bytes, crc 0x1a2b3c4d)"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const chunk&, const chunk&) = default;

private:
    chunk_type type_;
    std::vector<std::uint8_t> data_;
};

} // namespace pngstash

#endif // PNGSTASH_CHUNK_HPP_
