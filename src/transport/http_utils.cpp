/**
 * @file http_utils.cpp
 * @brief Request encoding and response parsing helpers
 */

#include <kcenon/chunked_upload/transport/http_utils.h>

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::chunked_upload::http_utils {

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto encode_form(const std::vector<std::pair<std::string, std::string>>& fields)
    -> std::string {
    auto encode_component = [](const std::string& value) {
        std::string out;
        std::size_t start = 0;
        // url_encode renders ' ' as %20; forms use '+'
        auto encoded = url_encode(value);
        out.reserve(encoded.size());
        for (std::size_t pos = encoded.find("%20"); pos != std::string::npos;
             pos = encoded.find("%20", start)) {
            out.append(encoded, start, pos - start);
            out += '+';
            start = pos + 3;
        }
        out.append(encoded, start, std::string::npos);
        return out;
    };

    std::string body;
    for (const auto& [name, value] : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += encode_component(name);
        body += '=';
        body += encode_component(value);
    }
    return body;
}

auto join_url(const std::string& base, const std::string& path) -> std::string {
    if (base.empty()) {
        return path;
    }
    if (path.empty()) {
        return base;
    }
    const bool base_slash = base.back() == '/';
    const bool path_slash = path.front() == '/';
    if (base_slash && path_slash) {
        return base + path.substr(1);
    }
    if (!base_slash && !path_slash) {
        return base + "/" + path;
    }
    return base + path;
}

auto generate_boundary() -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);

    std::string boundary = "----ChunkedUploadBoundary";
    for (int i = 0; i < 24; ++i) {
        boundary += hex[dist(rng)];
    }
    return boundary;
}

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        std::string value;
        for (auto i = pos + 1; i < json.size(); ++i) {
            char c = json[i];
            if (c == '"') {
                return value;
            }
            if (c == '\\' && i + 1 < json.size()) {
                char next = json[++i];
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    default: value += next; break;
                }
                continue;
            }
            value += c;
        }
        // Unterminated string
        return std::nullopt;
    }

    auto end_pos = json.find_first_of(",}\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(pos, end_pos - pos);
    auto last = value.find_last_not_of(" \t\r");
    if (last == std::string::npos) {
        return std::nullopt;
    }
    return value.substr(0, last + 1);
}

// multipart_form_builder

multipart_form_builder::multipart_form_builder()
    : multipart_form_builder(generate_boundary()) {}

multipart_form_builder::multipart_form_builder(std::string boundary)
    : boundary_(std::move(boundary)) {}

void multipart_form_builder::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

auto multipart_form_builder::add_field(const std::string& name, const std::string& value)
    -> multipart_form_builder& {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n");
    append(value);
    append("\r\n");
    return *this;
}

auto multipart_form_builder::add_file(const std::string& name,
                                      const std::string& filename,
                                      const std::string& content_type,
                                      std::span<const std::byte> data)
    -> multipart_form_builder& {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" +
           filename + "\"\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    const auto* first = reinterpret_cast<const uint8_t*>(data.data());
    body_.insert(body_.end(), first, first + data.size());
    append("\r\n");
    return *this;
}

auto multipart_form_builder::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_form_builder::build() const -> std::vector<uint8_t> {
    auto body = body_;
    const std::string closing = "--" + boundary_ + "--\r\n";
    body.insert(body.end(), closing.begin(), closing.end());
    return body;
}

}  // namespace kcenon::chunked_upload::http_utils
