#include <pngstash/message_codec.hpp>
#include <pngstash/chunk_type.hpp>
#include <pngstash/png_file.hpp>
#include <pngstash/file_io.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace pngstash {

namespace {

std::string describe_properties(const chunk_type& type) {
    std::string flags;
    flags += type.is_critical() ? "critical" : "ancillary";
    flags += type.is_public() ? ", public" : ", private";
    flags += type.is_safe_to_copy() ? ", safe-to-copy" : ", unsafe-to-copy";
    if (!type.is_reserved_bit_valid()) {
        flags += ", reserved bit set";
    }
    return flags;
}

const std::filesystem::path& output_or_input(const std::filesystem::path& input,
                                             const std::filesystem::path& output) {
    return output.empty() ? input : output;
}

} // namespace

// ============================================================================
// In-Memory Message Operations
// ============================================================================

stash_result encode_message(std::span<const std::uint8_t> png,
                            std::string_view type,
                            std::string_view message,
                            std::vector<std::uint8_t>& out,
                            const stash_options& options) {
    chunk_type tag;
    auto result = chunk_type::from_string(type, tag);
    if (!result) return result;

    const std::uint32_t limit = std::min(options.max_chunk_length, chunk::MAX_LENGTH);
    if (message.size() > limit) {
        return stash_result::failure(stash_error::invalid_format,
            "Message of " + std::to_string(message.size()) + " bytes exceeds the chunk limit of " +
            std::to_string(limit) + " bytes");
    }

    png_file file;
    result = png_file::parse(png, file, options);
    if (!result) return result;

    chunk secret(tag, std::vector<std::uint8_t>(message.begin(), message.end()));
    if (options.insert_before_iend) {
        file.insert_before_iend(std::move(secret));
    } else {
        file.append_chunk(std::move(secret));
    }

    out = file.to_bytes();
    return stash_result::success();
}

stash_result decode_message(std::span<const std::uint8_t> png,
                            std::string_view type,
                            std::string& out,
                            const stash_options& options) {
    png_file file;
    auto result = png_file::parse(png, file, options);
    if (!result) return result;

    const chunk* secret = file.chunk_by_type(type);
    if (!secret) {
        return stash_result::failure(stash_error::not_found,
            "No chunk of type '" + std::string(type) + "' found");
    }

    return secret->data_as_string(out);
}

stash_result remove_message(std::span<const std::uint8_t> png,
                            std::string_view type,
                            std::vector<std::uint8_t>& out,
                            chunk* removed,
                            const stash_options& options) {
    png_file file;
    auto result = png_file::parse(png, file, options);
    if (!result) return result;

    result = file.remove_first_chunk(type, removed);
    if (!result) return result;

    out = file.to_bytes();
    return stash_result::success();
}

stash_result describe_chunks(std::span<const std::uint8_t> png,
                             std::string& out,
                             const stash_options& options) {
    png_file file;
    auto result = png_file::parse(png, file, options);
    if (!result) return result;

    const auto& chunks = file.chunks();

    std::ostringstream listing;
    listing << "PNG file with " << chunks.size() << (chunks.size() == 1 ? " chunk\n" : " chunks\n");
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        listing << "  [" << i << "] " << chunks[i].to_string() << "  "
                << describe_properties(chunks[i].type()) << "\n";
    }

    out = listing.str();
    return stash_result::success();
}

// ============================================================================
// File Operations
// ============================================================================

stash_result encode_file(const std::filesystem::path& input,
                         std::string_view type,
                         std::string_view message,
                         const std::filesystem::path& output,
                         const stash_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(input, data);
    if (!result) return result;

    std::vector<std::uint8_t> encoded;
    result = encode_message(data, type, message, encoded, options);
    if (!result) return result;

    return write_file(output_or_input(input, output), encoded);
}

stash_result decode_file(const std::filesystem::path& input,
                         std::string_view type,
                         std::string& out,
                         const stash_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(input, data);
    if (!result) return result;

    return decode_message(data, type, out, options);
}

stash_result remove_file(const std::filesystem::path& input,
                         std::string_view type,
                         const std::filesystem::path& output,
                         const stash_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(input, data);
    if (!result) return result;

    std::vector<std::uint8_t> stripped;
    result = remove_message(data, type, stripped, nullptr, options);
    if (!result) return result;

    return write_file(output_or_input(input, output), stripped);
}

stash_result print_file(const std::filesystem::path& input,
                        std::string& out,
                        const stash_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(input, data);
    if (!result) return result;

    return describe_chunks(data, out, options);
}

} // namespace pngstash
