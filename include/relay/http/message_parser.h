#pragma once
#include <relay/core/config.h>
#include <relay/http/header_collection.h>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace relay::http {

// Malformed start-line or header block. Fatal for the message it was
// raised on; the connection that fed the bytes should be dropped.
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Start-line pieces shared by Request and Response.
// Non-empty run of letters, digits and '_'.
bool is_word(std::string_view s);
// "1.<digit>"
bool is_http1_version(std::string_view s);

// Incremental HTTP/1.x message parser.
//
// Bytes are accumulated until the first CRLF CRLF. At that point the
// start-line and header block are parsed (exactly once) and the buffer is
// replaced by the bytes that followed the terminator. Everything fed after
// that is appended to the body buffer untouched.
class MessageParser {
public:
    explicit MessageParser(size_t max_header_bytes = core::config::kMaxHeaderBytes);
    virtual ~MessageParser() = default;

    MessageParser(const MessageParser&) = default;
    MessageParser& operator=(const MessageParser&) = default;
    MessageParser(MessageParser&&) = default;
    MessageParser& operator=(MessageParser&&) = default;

    // Throws ParseError on a malformed header block or when the header
    // block grows past max_header_bytes().
    void feed(std::string_view data);
    void feed(const char* data, size_t len);

    bool headers_read() const { return headers_read_; }

    const std::string& start_line() const { return start_line_; }
    HeaderCollection& headers() { return headers_; }
    const HeaderCollection& headers() const { return headers_; }

    // Before headers_read(): the partial header bytes.
    // After: body bytes received beyond the header terminator.
    const std::string& body() const { return buffer_; }
    std::string take_body();

    size_t max_header_bytes() const { return max_header_bytes_; }

    // start-line CRLF headers CRLF body. Meaningful once headers_read().
    std::string serialize() const;

protected:
    // Validates the first line of the header block and extracts its fields.
    // The base implementation rejects an empty line and one that starts
    // with whitespace.
    virtual void parse_start_line(const std::string& line);

    void set_start_line(std::string line) { start_line_ = std::move(line); }

private:
    void parse_header_block(const std::string& block);
    void parse_header_line(const std::string& line);

    std::string buffer_;
    std::string start_line_;
    HeaderCollection headers_;
    bool headers_read_ = false;
    size_t scan_from_ = 0;
    size_t max_header_bytes_;
};

} // namespace relay::http
