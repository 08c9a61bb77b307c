#ifndef PNGSTASH_MESSAGE_CODEC_HPP_
#define PNGSTASH_MESSAGE_CODEC_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>
#include <pngstash/chunk.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pngstash {

// ============================================================================
// In-Memory Message Operations
// ============================================================================

/**
 * Hide a text message in a PNG as a chunk of the given type.
 * @param png Raw PNG file data
 * @param type Four-letter chunk type for the message
 * @param message Message text
 * @param out Receives the new PNG file data on success
 * @param options Parse and placement options
 * @return Result
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result encode_message(std::span<const std::uint8_t> png,
                                                          std::string_view type,
                                                          std::string_view message,
                                                          std::vector<std::uint8_t>& out,
                                                          const stash_options& options = {});

/**
 * Read back the message stored in the first chunk of the given type.
 * @return Result, not_found if absent, invalid_encoding if not text
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result decode_message(std::span<const std::uint8_t> png,
                                                          std::string_view type,
                                                          std::string& out,
                                                          const stash_options& options = {});

/**
 * Drop the first chunk of the given type.
 * @param removed Receives the removed chunk (may be null)
 * @return Result, not_found if absent
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result remove_message(std::span<const std::uint8_t> png,
                                                          std::string_view type,
                                                          std::vector<std::uint8_t>& out,
                                                          chunk* removed = nullptr,
                                                          const stash_options& options = {});

/**
 * Render a listing of all chunks, one per line.
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result describe_chunks(std::span<const std::uint8_t> png,
                                                           std::string& out,
                                                           const stash_options& options = {});

// ============================================================================
// File Operations
// ============================================================================
//
// An empty output path means the input file is overwritten. Output is only
// written once the whole operation has succeeded.

[[nodiscard]] PNGSTASH_EXPORT stash_result encode_file(const std::filesystem::path& input,
                                                       std::string_view type,
                                                       std::string_view message,
                                                       const std::filesystem::path& output = {},
                                                       const stash_options& options = {});

[[nodiscard]] PNGSTASH_EXPORT stash_result decode_file(const std::filesystem::path& input,
                                                       std::string_view type,
                                                       std::string& out,
                                                       const stash_options& options = {});

[[nodiscard]] PNGSTASH_EXPORT stash_result remove_file(const std::filesystem::path& input,
                                                       std::string_view type,
                                                       const std::filesystem::path& output = {},
                                                       const stash_options& options = {});

[[nodiscard]] PNGSTASH_EXPORT stash_result print_file(const std::filesystem::path& input,
                                                      std::string& out,
                                                      const stash_options& options = {});

} // namespace pngstash

#endif // PNGSTASH_MESSAGE_CODEC_HPP_
