#include "adpush/upload/byte_range_reader.hpp"

namespace adpush::upload {
namespace fs = std::filesystem;

ByteRangeReader::ByteRangeReader(fs::path path, std::ifstream input, std::uint64_t size)
    : path_(std::move(path)), input_(std::move(input)), size_(size) {}

Result<ByteRangeReader, UploadError> ByteRangeReader::open(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<ByteRangeReader>(make_error(ErrorKind::IOError,
            "Failed to stat source file: " + path.string(), ec.message()));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ByteRangeReader>(make_error(ErrorKind::IOError,
            "Failed to open source file: " + path.string()));
    }

    return Ok(ByteRangeReader(path, std::move(input), static_cast<std::uint64_t>(size)));
}

Result<std::vector<std::uint8_t>, UploadError> ByteRangeReader::read(std::uint64_t start_offset,
                                                                    std::uint64_t end_offset) {
    using Bytes = std::vector<std::uint8_t>;

    if (end_offset < start_offset) {
        return Err<Bytes>(make_error(ErrorKind::IOError,
            "Invalid byte range [" + std::to_string(start_offset) + ", " + std::to_string(end_offset) + ")"));
    }
    if (end_offset > size_) {
        return Err<Bytes>(make_error(ErrorKind::IOError,
            "File " + path_.string() + " is " + std::to_string(size_) +
            " bytes, range ends at " + std::to_string(end_offset)));
    }

    Bytes buffer(static_cast<std::size_t>(end_offset - start_offset));
    if (buffer.empty()) {
        return Ok(std::move(buffer));
    }

    input_.clear();
    input_.seekg(static_cast<std::streamoff>(start_offset));
    input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto bytes_read = static_cast<std::size_t>(input_.gcount());
    if (bytes_read != buffer.size()) {
        return Err<Bytes>(make_error(ErrorKind::IOError,
            "Short read from " + path_.string() + " at offset " + std::to_string(start_offset) +
            ": wanted " + std::to_string(buffer.size()) + ", got " + std::to_string(bytes_read)));
    }

    return Ok(std::move(buffer));
}

} // namespace adpush::upload
