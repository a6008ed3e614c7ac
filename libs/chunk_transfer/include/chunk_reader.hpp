#pragma once

#include <cstdint>
#include <string>

namespace edgesync {

/// Read [offset, offset + length) of a source file. Only this range is
/// held in memory.
///
/// Throws InvalidJobError if the file is gone, has changed size from
/// expected_total_size, or is shorter than the range.
std::string read_chunk(const std::string& path,
                       uint64_t offset,
                       uint64_t length,
                       uint64_t expected_total_size);

}  // namespace edgesync
