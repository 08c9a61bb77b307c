#include <pngstash/chunk_type.hpp>

#include <algorithm>

namespace pngstash {

namespace {

constexpr bool is_ascii_letter(std::uint8_t c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

} // namespace

stash_result chunk_type::from_string(std::string_view text, chunk_type& out) {
    if (text.size() != size) {
        return stash_result::failure(stash_error::invalid_chunk_type,
            "Chunk type '" + std::string(text) + "' must be exactly 4 letters, got " +
            std::to_string(text.size()) + " bytes");
    }

    bytes_type bytes{};
    for (std::size_t i = 0; i < size; ++i) {
        const auto c = static_cast<std::uint8_t>(text[i]);
        if (!is_ascii_letter(c)) {
            return stash_result::failure(stash_error::invalid_chunk_type,
                "Chunk type '" + std::string(text) + "' contains a non-letter at position " +
                std::to_string(i));
        }
        bytes[i] = c;
    }

    out = chunk_type(bytes);
    return stash_result::success();
}

bool chunk_type::is_valid() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), is_ascii_letter);
}

bool chunk_type::matches(std::string_view text) const noexcept {
    if (text.size() != size) {
        return false;
    }

    for (std::size_t i = 0; i < size; ++i) {
        if (bytes_[i] != static_cast<std::uint8_t>(text[i])) {
            return false;
        }
    }

    return true;
}

std::string chunk_type::to_string() const {
    return std::string(bytes_.begin(), bytes_.end());
}

} // namespace pngstash
