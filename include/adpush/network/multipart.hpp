#pragma once

#include "adpush/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace adpush::network {

/**
 * @brief One field of a multipart/form-data body
 *
 * Text fields leave filename and content_type empty; file fields carry raw bytes.
 */
struct FormPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::vector<std::uint8_t> data;

    std::string text() const { return std::string(data.begin(), data.end()); }
};

/**
 * @brief Builds a multipart/form-data request body (RFC 7578)
 *
 * The upload endpoint takes its phase parameters and the binary chunk
 * in one form, the same way a browser file upload does.
 */
class MultipartForm {
public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_field(const std::string& name, const std::string& value);

    void add_file(const std::string& name, const std::string& filename,
                  const std::string& content_type, std::vector<std::uint8_t> data);

    /// Value for the Content-Type header, including the boundary parameter
    std::string content_type() const;

    const std::string& boundary() const { return boundary_; }

    std::vector<std::uint8_t> encode() const;

private:
    std::string boundary_;
    std::vector<FormPart> parts_;
};

/// Extracts the boundary parameter of a multipart Content-Type header
Result<std::string> boundary_from_content_type(const std::string& content_type);

Result<std::vector<FormPart>> parse_multipart(const std::string& content_type,
                                              const std::vector<std::uint8_t>& body);

} // namespace adpush::network
