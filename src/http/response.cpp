#include <relay/http/response.h>
#include <cctype>
#include <utility>

namespace relay::http {

void Response::parse_start_line(const std::string& line) {
    MessageParser::parse_start_line(line);

    // PROTOCOL/VERSION
    auto sp1 = line.find(' ');
    if (sp1 == std::string::npos) {
        throw ParseError("Invalid status line: " + line);
    }
    std::string head = line.substr(0, sp1);
    auto slash = head.find('/');
    if (slash == std::string::npos) {
        throw ParseError("Invalid status line: " + line);
    }
    std::string protocol = head.substr(0, slash);
    std::string version = head.substr(slash + 1);
    if (!is_word(protocol) || !is_http1_version(version)) {
        throw ParseError("Invalid status line: " + line);
    }

    // CODE, then an optional reason phrase that may itself contain spaces
    std::string code = line.substr(sp1 + 1, 3);
    if (code.size() != 3 ||
        !std::isdigit(static_cast<unsigned char>(code[0])) ||
        !std::isdigit(static_cast<unsigned char>(code[1])) ||
        !std::isdigit(static_cast<unsigned char>(code[2]))) {
        throw ParseError("Invalid status line: " + line);
    }
    size_t after_code = sp1 + 1 + 3;
    std::string reason;
    if (after_code < line.size()) {
        if (line[after_code] != ' ') {
            throw ParseError("Invalid status line: " + line);
        }
        reason = line.substr(after_code + 1);
    }

    protocol_ = std::move(protocol);
    version_ = std::move(version);
    status_ = static_cast<uint16_t>((code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0'));
    reason_ = std::move(reason);
}

void Response::set_protocol(std::string protocol) {
    protocol_ = std::move(protocol);
    update_status_line();
}

void Response::set_version(std::string version) {
    version_ = std::move(version);
    update_status_line();
}

void Response::set_status(uint16_t status) {
    status_ = status;
    update_status_line();
}

void Response::set_reason(std::string reason) {
    reason_ = std::move(reason);
    update_status_line();
}

void Response::update_status_line() {
    std::string line = protocol_ + "/" + version_ + " " + std::to_string(status_);
    if (!reason_.empty()) {
        line += " " + reason_;
    }
    set_start_line(std::move(line));
}

} // namespace relay::http
