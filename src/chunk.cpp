#include <pngstash/chunk.hpp>
#include "byte_io.hpp"
#include <lodepng.h>

#include <cstdio>
#include <utility>

namespace pngstash {

namespace {

std::string hex32(std::uint32_t value) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08x", static_cast<unsigned>(value));
    return buf;
}

// Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, max U+10FFFF
bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        const std::uint8_t lead = bytes[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i <= extra) {
            return false;
        }

        // Only the first continuation byte has a narrowed range
        if (bytes[i + 1] < lo || bytes[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= extra; ++k) {
            if (bytes[i + k] < 0x80 || bytes[i + k] > 0xBF) {
                return false;
            }
        }

        i += extra + 1;
    }

    return true;
}

} // namespace

chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
    : type_(type), data_(std::move(data)) {}

stash_result chunk::parse(std::span<const std::uint8_t> data,
                          chunk& out,
                          std::size_t* consumed,
                          const stash_options& options) {
    if (data.size() < MIN_SIZE) {
        return stash_result::failure(stash_error::invalid_format,
            "Truncated chunk: need at least " + std::to_string(MIN_SIZE) +
            " bytes, have " + std::to_string(data.size()));
    }

    const std::uint32_t length = read_be32(data.data());

    chunk_type::bytes_type tag{};
    for (std::size_t i = 0; i < chunk_type::size; ++i) {
        tag[i] = data[LENGTH_SIZE + i];
    }
    const chunk_type type(tag);

    if (options.strict_chunk_types && !type.is_valid()) {
        return stash_result::failure(stash_error::invalid_chunk_type,
            "Chunk type '" + type.to_string() + "' is not four ASCII letters");
    }

    if (length > options.max_chunk_length) {
        return stash_result::failure(stash_error::invalid_format,
            "Chunk '" + type.to_string() + "' declares length " + std::to_string(length) +
            ", limit is " + std::to_string(options.max_chunk_length));
    }

    // Compare without adding to length so a huge declared value cannot overflow
    const std::size_t available = data.size() - MIN_SIZE;
    if (static_cast<std::size_t>(length) > available) {
        return stash_result::failure(stash_error::invalid_format,
            "Chunk '" + type.to_string() + "' declares " + std::to_string(length) +
            " data bytes, only " + std::to_string(available) + " available");
    }

    // Type and data are contiguous in the input, so the CRC runs over it in place
    const std::uint32_t stored_crc = read_be32(data.data() + HEADER_SIZE + length);
    const std::uint32_t actual_crc = lodepng_crc32(data.data() + LENGTH_SIZE,
                                                   chunk_type::size + length);
    if (stored_crc != actual_crc) {
        return stash_result::failure(stash_error::invalid_format,
            "CRC mismatch in chunk '" + type.to_string() + "': stored " + hex32(stored_crc) +
            ", computed " + hex32(actual_crc));
    }

    const auto payload = data.subspan(HEADER_SIZE, length);
    out = chunk(type, std::vector<std::uint8_t>(payload.begin(), payload.end()));
    if (consumed) {
        *consumed = MIN_SIZE + length;
    }

    return stash_result::success();
}

std::uint32_t chunk::crc() const {
    std::vector<std::uint8_t> covered;
    covered.reserve(chunk_type::size + data_.size());
    covered.insert(covered.end(), type_.bytes().begin(), type_.bytes().end());
    covered.insert(covered.end(), data_.begin(), data_.end());

    return lodepng_crc32(covered.data(), covered.size());
}

stash_result chunk::data_as_string(std::string& out) const {
    if (!is_valid_utf8(data_)) {
        return stash_result::failure(stash_error::invalid_encoding,
            "Chunk '" + type_.to_string() + "' data is not valid UTF-8 text");
    }

    out.assign(data_.begin(), data_.end());
    return stash_result::success();
}

std::vector<std::uint8_t> chunk::to_bytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(MIN_SIZE + data_.size());
    write_to(out);
    return out;
}

void chunk::write_to(std::vector<std::uint8_t>& out) const {
    append_be32(out, length());

    const std::size_t covered_start = out.size();
    out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
    out.insert(out.end(), data_.begin(), data_.end());

    append_be32(out, lodepng_crc32(out.data() + covered_start, out.size() - covered_start));
}

std::string chunk::to_string() const {
    return type_.to_string() + " (" + std::to_string(length()) + " bytes, crc " +
           hex32(crc()) + ")";
}

} // namespace pngstash
