#pragma once

#include <pngstash/pngstash.hpp>
#include <lodepng.h>

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace pngstash_test {

// Small RGBA image encoded by lodepng, used as a real-world carrier file
inline std::vector<std::uint8_t> make_carrier_png(unsigned width = 4, unsigned height = 3) {
    std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
    for (std::size_t i = 0; i < rgba.size(); ++i) {
        rgba[i] = static_cast<std::uint8_t>((i * 37) & 0xFF);
    }

    std::vector<std::uint8_t> png;
    const unsigned error = lodepng::encode(png, rgba, width, height);
    if (error) {
        return {};
    }
    return png;
}

// Decode with lodepng; true if a standard decoder still accepts the file
inline bool decodes_as_image(const std::vector<std::uint8_t>& png) {
    std::vector<std::uint8_t> pixels;
    unsigned width = 0;
    unsigned height = 0;
    return lodepng::decode(pixels, width, height, png) == 0;
}

inline pngstash::chunk make_chunk(std::string_view type, std::string_view text) {
    pngstash::chunk_type tag;
    if (!pngstash::chunk_type::from_string(type, tag)) {
        return {};
    }
    return pngstash::chunk(tag, std::vector<std::uint8_t>(text.begin(), text.end()));
}

// Raw chunk bytes with an explicit (possibly wrong) length and CRC
inline std::vector<std::uint8_t> raw_chunk(std::uint32_t length,
                                           std::string_view type,
                                           std::string_view data,
                                           std::uint32_t crc) {
    std::vector<std::uint8_t> out;
    auto put_be32 = [&out](std::uint32_t v) {
        out.push_back(static_cast<std::uint8_t>(v >> 24));
        out.push_back(static_cast<std::uint8_t>(v >> 16));
        out.push_back(static_cast<std::uint8_t>(v >> 8));
        out.push_back(static_cast<std::uint8_t>(v));
    };

    put_be32(length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), data.begin(), data.end());
    put_be32(crc);
    return out;
}

// [IHDR, ruSt, IDAT, IEND] built from synthetic payloads
inline pngstash::png_file make_sample_png() {
    std::vector<pngstash::chunk> chunks;
    chunks.push_back(make_chunk("IHDR", "header-bytes!"));
    chunks.push_back(make_chunk("ruSt", "This is a secret message!"));
    chunks.push_back(make_chunk("IDAT", "pixels"));
    chunks.push_back(make_chunk("IEND", ""));
    return pngstash::png_file(std::move(chunks));
}

} // namespace pngstash_test
