#include <relay/http/request.h>
#include <cctype>
#include <utility>
#include <vector>

namespace relay::http {

namespace {

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos > start) {
            tokens.push_back(line.substr(start, pos - start));
        }
    }
    return tokens;
}

} // anonymous namespace

void Request::parse_start_line(const std::string& line) {
    MessageParser::parse_start_line(line);

    auto tokens = split_whitespace(line);
    if (tokens.size() != 3 || std::isspace(static_cast<unsigned char>(line.back()))) {
        throw ParseError("Invalid request: " + line);
    }

    const std::string& target = tokens[2];
    auto slash = target.find('/');
    if (slash == std::string::npos) {
        throw ParseError("Invalid request: " + line);
    }
    std::string protocol = target.substr(0, slash);
    std::string version = target.substr(slash + 1);

    if (!is_word(tokens[0]) || !is_word(protocol) || !is_http1_version(version)) {
        throw ParseError("Invalid request: " + line);
    }

    method_ = tokens[0];
    uri_ = tokens[1];
    protocol_ = std::move(protocol);
    version_ = std::move(version);
}

void Request::set_method(std::string method) {
    method_ = std::move(method);
    update_request_line();
}

void Request::set_uri(std::string uri) {
    uri_ = std::move(uri);
    update_request_line();
}

void Request::set_protocol(std::string protocol) {
    protocol_ = std::move(protocol);
    update_request_line();
}

void Request::set_version(std::string version) {
    version_ = std::move(version);
    update_request_line();
}

void Request::update_request_line() {
    set_start_line(method_ + " " + uri_ + " " + protocol_ + "/" + version_);
}

} // namespace relay::http
