#ifndef PNGSTASH_PNGSTASH_HPP_
#define PNGSTASH_PNGSTASH_HPP_

#include <pngstash/pngstash_export.h>
#include <pngstash/types.hpp>
#include <pngstash/chunk_type.hpp>
#include <pngstash/chunk.hpp>
#include <pngstash/png_file.hpp>
#include <pngstash/file_io.hpp>
#include <pngstash/message_codec.hpp>

namespace pngstash {

// All public API is included via the headers above.
// See:
//   - types.hpp:         stash_error, stash_result, stash_options
//   - chunk_type.hpp:    chunk_type (tag and property bits)
//   - chunk.hpp:         chunk (parse, CRC, serialize)
//   - png_file.hpp:      png_file (signature + chunk sequence)
//   - file_io.hpp:       read_file(), write_file()
//   - message_codec.hpp: encode/decode/remove/print, in memory and on files

} // namespace pngstash

#endif // PNGSTASH_PNGSTASH_HPP_
