#include "ferry/network/http_types.hpp"

#include <cctype>
#include <iomanip>

namespace ferry::network {

std::string HttpRequest::serialize_head() const {
    std::ostringstream oss;

    oss << HttpMethodUtils::to_string(method) << " "
        << (target.empty() ? "/" : target) << " HTTP/1.1\r\n";

    if (!host.empty() && find_header(headers, "Host").empty()) {
        oss << "Host: " << host << "\r\n";
    }
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    if (find_header(headers, "Content-Length").empty()) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    if (find_header(headers, "Connection").empty()) {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

Result<Url> Url::parse(const std::string& text) {
    Url url;
    std::string rest = text;

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        url.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    }
    if (url.scheme != "http") {
        return Err<Url>(std::string("Unsupported URL scheme '") + url.scheme + "' (only http is supported)");
    }

    const auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.base_path = rest.substr(path_start);
        while (!url.base_path.empty() && url.base_path.back() == '/') {
            url.base_path.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5) {
            return Err<Url>(std::string("Invalid port in URL: ") + text);
        }
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Err<Url>(std::string("Invalid port in URL: ") + text);
            }
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(std::string("Invalid port in URL: ") + text);
        }
        url.port = static_cast<uint16_t>(port);
        authority.resize(colon);
    }

    if (authority.empty()) {
        return Err<Url>(std::string("Missing host in URL: ") + text);
    }
    url.host = authority;
    return Ok(url);
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace ferry::network
