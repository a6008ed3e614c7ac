#include "chunk_reader.hpp"

#include <filesystem>
#include <fstream>

#include "sync_errors.hpp"

namespace edgesync {

std::string read_chunk(const std::string& path,
                       uint64_t offset,
                       uint64_t length,
                       uint64_t expected_total_size) {
    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw InvalidJobError("Source disappeared: " + path + " (" + ec.message() + ")");
    }
    if (size != expected_total_size) {
        throw InvalidJobError("Source changed size since enqueue: " + path + " (" +
                              std::to_string(expected_total_size) + " -> " +
                              std::to_string(size) + " bytes)");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InvalidJobError("Cannot open source: " + path);
    }
    file.seekg(static_cast<std::streamoff>(offset));

    std::string data(static_cast<size_t>(length), '\0');
    file.read(data.data(), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(file.gcount()) != length) {
        throw InvalidJobError("Short read from " + path + " at offset " +
                              std::to_string(offset));
    }
    return data;
}

}  // namespace edgesync
