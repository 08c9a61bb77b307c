#ifndef PNGSTASH_FILE_IO_HPP_
#define PNGSTASH_FILE_IO_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace pngstash {

// ============================================================================
// File I/O
// ============================================================================

/**
 * Read a whole file into memory.
 * @param path File to read
 * @param out Receives the file contents on success
 * @return Result, io_error if the file cannot be opened or read
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result read_file(const std::filesystem::path& path,
                                                     std::vector<std::uint8_t>& out);

/**
 * Write a buffer to a file, replacing any previous contents.
 * The data goes to a temporary file next to the target which is then renamed
 * over it; on failure the target keeps its previous contents.
 * @param path File to write
 * @param data Bytes to write
 * @return Result, io_error if the file cannot be opened or written
 */
[[nodiscard]] PNGSTASH_EXPORT stash_result write_file(const std::filesystem::path& path,
                                                      std::span<const std::uint8_t> data);

} // namespace pngstash

#endif // PNGSTASH_FILE_IO_HPP_
