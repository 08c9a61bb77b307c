#ifndef PNGSTASH_PNG_FILE_HPP_
#define PNGSTASH_PNG_FILE_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>
#include <pngstash/chunk_type.hpp>
#include <pngstash/chunk.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pngstash {

// ============================================================================
// PNG File
// ============================================================================

/**
 * A PNG container: the 8-byte signature followed by chunks in file order.
 *
 * No ordering or uniqueness rule is enforced. Several chunks may share a
 * type; lookups return the first one.
 */
class PNGSTASH_EXPORT png_file {
public:
    static constexpr std::array<std::uint8_t, 8> SIGNATURE = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

    png_file() = default;
    explicit png_file(std::vector<chunk> chunks);

    /**
     * Check if data starts with the PNG signature.
     * @param data Raw file data
     * @return true if the signature matches
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse a complete PNG byte stream.
     * Stops at the first malformed chunk; out is left untouched on failure.
     * @param data Raw file data
     * @param out Receives the parsed file on success
     * @param options Parse options
     * @return Result, invalid_signature or the first chunk error
     */
    [[nodiscard]] static stash_result parse(std::span<const std::uint8_t> data,
                                            png_file& out,
                                            const stash_options& options = {});

    [[nodiscard]] const std::array<std::uint8_t, 8>& header() const noexcept { return SIGNATURE; }
    [[nodiscard]] const std::vector<chunk>& chunks() const noexcept { return chunks_; }

    void append_chunk(chunk c);

    // Insert before the first IEND, or append if there is none
    void insert_before_iend(chunk c);

    /**
     * Remove the first chunk of the given type.
     * @param type Chunk type to match byte for byte
     * @param removed Receives the removed chunk (may be null)
     * @return Result, not_found if no chunk matches
     */
    [[nodiscard]] stash_result remove_first_chunk(const chunk_type& type, chunk* removed = nullptr);
    [[nodiscard]] stash_result remove_first_chunk(std::string_view type, chunk* removed = nullptr);

    /**
     * Find the first chunk of the given type.
     * @return Pointer to the chunk, or nullptr if none matches
     */
    [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const noexcept;
    [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const noexcept;

    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    friend bool operator==(const png_file&, const png_file&) = default;

private:
    std::vector<chunk> chunks_;
};

} // namespace pngstash

#endif // PNGSTASH_PNG_FILE_HPP_
