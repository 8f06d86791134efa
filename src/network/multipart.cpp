#include "adpush/network/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace adpush::network {

namespace {

std::string generate_boundary() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << "adpush-" << std::hex << std::setfill('0')
        << std::setw(16) << engine() << std::setw(16) << engine();
    return oss.str();
}

void append(std::vector<std::uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Reads a parameter such as name="video_file_chunk" from a Content-Disposition value
std::string disposition_param(const std::string& disposition, const std::string& key) {
    const std::string needle = key + "=\"";
    std::size_t pos = 0;
    while ((pos = disposition.find(needle, pos)) != std::string::npos) {
        // Skip matches inside a longer key ("filename" contains "name")
        if (pos == 0 || disposition[pos - 1] == ' ' || disposition[pos - 1] == ';') {
            const auto begin = pos + needle.size();
            const auto end = disposition.find('"', begin);
            if (end == std::string::npos) {
                return "";
            }
            return disposition.substr(begin, end - begin);
        }
        pos += needle.size();
    }
    return "";
}

} // namespace

MultipartForm::MultipartForm() : boundary_(generate_boundary()) {}

MultipartForm::MultipartForm(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    FormPart part;
    part.name = name;
    part.data.assign(value.begin(), value.end());
    parts_.push_back(std::move(part));
}

void MultipartForm::add_file(const std::string& name, const std::string& filename,
                             const std::string& content_type, std::vector<std::uint8_t> data) {
    FormPart part;
    part.name = name;
    part.filename = filename;
    part.content_type = content_type;
    part.data = std::move(data);
    parts_.push_back(std::move(part));
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::vector<std::uint8_t> MultipartForm::encode() const {
    std::size_t expected = 0;
    for (const auto& part : parts_) {
        expected += part.data.size() + 256;
    }

    std::vector<std::uint8_t> out;
    out.reserve(expected + boundary_.size() + 8);
    for (const auto& part : parts_) {
        std::string head = "--" + boundary_ + "\r\n";
        head += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (!part.filename.empty()) {
            head += "; filename=\"" + part.filename + "\"";
        }
        head += "\r\n";
        if (!part.content_type.empty()) {
            head += "Content-Type: " + part.content_type + "\r\n";
        }
        head += "\r\n";
        append(out, head);
        out.insert(out.end(), part.data.begin(), part.data.end());
        append(out, "\r\n");
    }
    append(out, "--" + boundary_ + "--\r\n");
    return out;
}

Result<std::string> boundary_from_content_type(const std::string& content_type) {
    if (lowercase(content_type).rfind("multipart/form-data", 0) != 0) {
        return Err<std::string>(std::string("Not a multipart/form-data body: ") + content_type);
    }
    const auto pos = lowercase(content_type).find("boundary=");
    if (pos == std::string::npos) {
        return Err<std::string>(std::string("Missing multipart boundary"));
    }
    std::string boundary = content_type.substr(pos + 9);
    const auto end = boundary.find(';');
    if (end != std::string::npos) {
        boundary.resize(end);
    }
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    if (boundary.empty()) {
        return Err<std::string>(std::string("Empty multipart boundary"));
    }
    return Ok(std::move(boundary));
}

Result<std::vector<FormPart>> parse_multipart(const std::string& content_type,
                                              const std::vector<std::uint8_t>& body) {
    auto boundary = boundary_from_content_type(content_type);
    if (boundary.is_error()) {
        return boundary.forward_error<std::vector<FormPart>>();
    }

    const std::string opening = "--" + boundary.value();
    const std::string delimiter = "\r\n" + opening;

    auto cursor = std::search(body.begin(), body.end(), opening.begin(), opening.end());
    if (cursor == body.end()) {
        return Err<std::vector<FormPart>>(std::string("Multipart opening boundary not found"));
    }
    cursor += static_cast<std::ptrdiff_t>(opening.size());

    std::vector<FormPart> parts;
    while (true) {
        // "--" after a boundary marks the end of the body
        if (body.end() - cursor >= 2 && cursor[0] == '-' && cursor[1] == '-') {
            return Ok(std::move(parts));
        }
        if (body.end() - cursor < 2 || cursor[0] != '\r' || cursor[1] != '\n') {
            return Err<std::vector<FormPart>>(std::string("Malformed multipart boundary line"));
        }
        cursor += 2;

        const std::string blank = "\r\n\r\n";
        auto head_end = std::search(cursor, body.end(), blank.begin(), blank.end());
        if (head_end == body.end()) {
            return Err<std::vector<FormPart>>(std::string("Multipart part headers not terminated"));
        }

        FormPart part;
        std::istringstream head(std::string(cursor, head_end));
        std::string line;
        while (std::getline(head, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            const std::string name = lowercase(line.substr(0, colon));
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            if (name == "content-disposition") {
                part.name = disposition_param(value, "name");
                part.filename = disposition_param(value, "filename");
            } else if (name == "content-type") {
                part.content_type = value;
            }
        }

        const auto data_begin = head_end + static_cast<std::ptrdiff_t>(blank.size());
        const auto data_end = std::search(data_begin, body.end(), delimiter.begin(), delimiter.end());
        if (data_end == body.end()) {
            return Err<std::vector<FormPart>>(std::string("Multipart closing boundary not found"));
        }
        if (part.name.empty()) {
            return Err<std::vector<FormPart>>(std::string("Multipart part without a name"));
        }
        part.data.assign(data_begin, data_end);
        parts.push_back(std::move(part));

        cursor = data_end + static_cast<std::ptrdiff_t>(delimiter.size());
    }
}

} // namespace adpush::network
