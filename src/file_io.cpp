#include <pngstash/file_io.hpp>

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace pngstash {

stash_result read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& out) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return stash_result::failure(stash_error::io_error,
            "Cannot open file: " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return stash_result::failure(stash_error::io_error,
            "Cannot determine size of file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) {
        return stash_result::failure(stash_error::io_error,
            "Failed to read file: " + path.string());
    }

    out = std::move(data);
    return stash_result::success();
}

stash_result write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    // Write beside the target and rename over it, so a failed write never
    // leaves a truncated file behind
    std::filesystem::path temp = path;
    temp += ".pngstash-tmp";

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return stash_result::failure(stash_error::io_error,
                "Cannot open file for writing: " + temp.string());
        }

        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return stash_result::failure(stash_error::io_error,
                "Failed to write file: " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return stash_result::failure(stash_error::io_error,
            "Failed to replace file " + path.string() + ": " + ec.message());
    }

    return stash_result::success();
}

} // namespace pngstash
