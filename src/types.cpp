#include <pngstash/types.hpp>

namespace pngstash {

const char* to_string(stash_error err) noexcept {
    switch (err) {
        case stash_error::none:               return "none";
        case stash_error::invalid_signature:  return "invalid_signature";
        case stash_error::invalid_format:     return "invalid_format";
        case stash_error::invalid_chunk_type: return "invalid_chunk_type";
        case stash_error::not_found:          return "not_found";
        case stash_error::invalid_encoding:   return "invalid_encoding";
        case stash_error::io_error:           return "io_error";
    }
    return "unknown";
}

} // namespace pngstash
