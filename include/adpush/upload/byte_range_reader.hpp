#pragma once

#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace adpush::upload {

/**
 * @brief Random-access reads of exact byte ranges from a local file
 *
 * The remote may ask for a range again after a rewind, so reads are not
 * required to move forward.
 */
class ByteRangeReader {
public:
    static Result<ByteRangeReader, UploadError> open(const std::filesystem::path& path);

    ByteRangeReader(ByteRangeReader&&) = default;
    ByteRangeReader& operator=(ByteRangeReader&&) = default;

    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Returns exactly end_offset - start_offset bytes, or IOError
    Result<std::vector<std::uint8_t>, UploadError> read(std::uint64_t start_offset,
                                                        std::uint64_t end_offset);

private:
    ByteRangeReader(std::filesystem::path path, std::ifstream input, std::uint64_t size);

    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t size_ = 0;
};

} // namespace adpush::upload
