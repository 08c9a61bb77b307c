#include <pngstash/png_file.hpp>

#include <algorithm>
#include <utility>

namespace pngstash {

namespace {

constexpr std::size_t SIGNATURE_SIZE = png_file::SIGNATURE.size();
constexpr std::string_view IEND_TYPE = "IEND";

} // namespace

png_file::png_file(std::vector<chunk> chunks)
    : chunks_(std::move(chunks)) {}

bool png_file::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < SIGNATURE_SIZE) {
        return false;
    }

    return std::equal(SIGNATURE.begin(), SIGNATURE.end(), data.begin());
}

stash_result png_file::parse(std::span<const std::uint8_t> data,
                             png_file& out,
                             const stash_options& options) {
    if (data.size() < SIGNATURE_SIZE) {
        return stash_result::failure(stash_error::invalid_signature,
            "Not a PNG file: " + std::to_string(data.size()) +
            " bytes is shorter than the 8-byte signature");
    }

    if (!sniff(data)) {
        return stash_result::failure(stash_error::invalid_signature,
            "Not a PNG file: signature mismatch");
    }

    std::vector<chunk> chunks;
    std::size_t offset = SIGNATURE_SIZE;

    while (offset < data.size()) {
        chunk next;
        std::size_t consumed = 0;

        auto result = chunk::parse(data.subspan(offset), next, &consumed, options);
        if (!result) {
            result.message = "Chunk " + std::to_string(chunks.size()) + " at offset " +
                             std::to_string(offset) + ": " + result.message;
            return result;
        }

        chunks.push_back(std::move(next));
        offset += consumed;
    }

    out.chunks_ = std::move(chunks);
    return stash_result::success();
}

void png_file::append_chunk(chunk c) {
    chunks_.push_back(std::move(c));
}

void png_file::insert_before_iend(chunk c) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [](const chunk& existing) {
        return existing.type().matches(IEND_TYPE);
    });
    chunks_.insert(it, std::move(c));
}

stash_result png_file::remove_first_chunk(const chunk_type& type, chunk* removed) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [&type](const chunk& existing) {
        return existing.type() == type;
    });

    if (it == chunks_.end()) {
        return stash_result::failure(stash_error::not_found,
            "No chunk of type '" + type.to_string() + "' found");
    }

    if (removed) {
        *removed = std::move(*it);
    }
    chunks_.erase(it);

    return stash_result::success();
}

stash_result png_file::remove_first_chunk(std::string_view type, chunk* removed) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [type](const chunk& existing) {
        return existing.type().matches(type);
    });

    if (it == chunks_.end()) {
        return stash_result::failure(stash_error::not_found,
            "No chunk of type '" + std::string(type) + "' found");
    }

    if (removed) {
        *removed = std::move(*it);
    }
    chunks_.erase(it);

    return stash_result::success();
}

const chunk* png_file::chunk_by_type(const chunk_type& type) const noexcept {
    for (const auto& c : chunks_) {
        if (c.type() == type) {
            return &c;
        }
    }
    return nullptr;
}

const chunk* png_file::chunk_by_type(std::string_view type) const noexcept {
    for (const auto& c : chunks_) {
        if (c.type().matches(type)) {
            return &c;
        }
    }
    return nullptr;
}

std::vector<std::uint8_t> png_file::to_bytes() const {
    std::size_t total = SIGNATURE_SIZE;
    for (const auto& c : chunks_) {
        total += chunk::MIN_SIZE + c.length();
    }

    std::vector<std::uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());
    for (const auto& c : chunks_) {
        c.write_to(out);
    }

    return out;
}

} // namespace pngstash
