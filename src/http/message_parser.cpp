#include <relay/http/message_parser.h>
#include <cctype>
#include <utility>
#include <vector>

namespace relay::http {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_blank(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_blank(s[end - 1])) --end;
    return std::string(s.substr(start, end - start));
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

std::vector<std::string> split_lines(const std::string& block) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= block.size()) {
        size_t eol = block.find(kCrlf, pos);
        if (eol == std::string::npos) {
            lines.push_back(block.substr(pos));
            break;
        }
        lines.push_back(block.substr(pos, eol - pos));
        pos = eol + kCrlf.size();
    }
    return lines;
}

} // anonymous namespace

bool is_word(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

bool is_http1_version(std::string_view s) {
    return s.size() == 3 && s[0] == '1' && s[1] == '.' &&
           std::isdigit(static_cast<unsigned char>(s[2]));
}

MessageParser::MessageParser(size_t max_header_bytes)
    : max_header_bytes_(max_header_bytes) {}

void MessageParser::feed(const char* data, size_t len) {
    feed(std::string_view(data, len));
}

void MessageParser::feed(std::string_view data) {
    buffer_.append(data.data(), data.size());

    if (headers_read_) {
        return;
    }

    size_t eoh = buffer_.find(kHeaderTerminator, scan_from_);
    if (eoh == std::string::npos) {
        if (buffer_.size() >= max_header_bytes_) {
            throw ParseError("Header block exceeds " + std::to_string(max_header_bytes_) + " bytes");
        }
        // A terminator may straddle this chunk and the next one.
        scan_from_ = buffer_.size() >= kHeaderTerminator.size() - 1
                         ? buffer_.size() - (kHeaderTerminator.size() - 1)
                         : 0;
        return;
    }

    if (eoh + kHeaderTerminator.size() > max_header_bytes_) {
        throw ParseError("Header block exceeds " + std::to_string(max_header_bytes_) + " bytes");
    }

    std::string block = buffer_.substr(0, eoh);
    std::string body = buffer_.substr(eoh + kHeaderTerminator.size());
    try {
        parse_header_block(block);
    } catch (const ParseError&) {
        start_line_.clear();
        headers_.clear();
        throw;
    }

    buffer_ = std::move(body);
    scan_from_ = 0;
    headers_read_ = true;
}

std::string MessageParser::take_body() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

std::string MessageParser::serialize() const {
    std::string out;
    out.reserve(start_line_.size() + buffer_.size() + 256);
    out += start_line_;
    out += kCrlf;
    out += headers_.serialize();
    out += kCrlf;
    out += buffer_;
    return out;
}

void MessageParser::parse_start_line(const std::string& line) {
    if (line.empty()) {
        throw ParseError("Empty start-line");
    }
    if (is_blank(line.front())) {
        throw ParseError("Invalid header, unexpected continuation: '" + line + "'");
    }
}

void MessageParser::parse_header_block(const std::string& block) {
    auto lines = split_lines(block);
    start_line_ = lines.front();
    for (size_t i = 1; i < lines.size(); ++i) {
        parse_header_line(lines[i]);
    }
    parse_start_line(start_line_);
}

void MessageParser::parse_header_line(const std::string& line) {
    if (!line.empty() && is_blank(line.front())) {
        if (headers_.empty()) {
            throw ParseError("Invalid header, unexpected continuation: '" + line + "'");
        }
        auto& field = headers_.back();
        field.set_value(field.value() + trim(line));
        return;
    }

    size_t name_end = 0;
    while (name_end < line.size() && is_name_char(line[name_end])) {
        ++name_end;
    }
    if (name_end == 0 || name_end >= line.size() || line[name_end] != ':') {
        throw ParseError("Invalid header line: '" + line + "'");
    }

    headers_.add(line.substr(0, name_end),
                 trim(std::string_view(line).substr(name_end + 1)));
}

} // namespace relay::http
