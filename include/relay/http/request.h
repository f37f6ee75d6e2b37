#pragma once
#include <relay/http/message_parser.h>
#include <string>

namespace relay::http {

// Request parsed from "METHOD SP URI SP PROTOCOL/VERSION". The URI is kept
// exactly as received; only the setters below change it. Every setter
// rebuilds the start-line from the four parts.
class Request : public MessageParser {
public:
    using MessageParser::MessageParser;

    const std::string& method() const { return method_; }
    const std::string& uri() const { return uri_; }
    const std::string& protocol() const { return protocol_; }
    const std::string& version() const { return version_; }

    void set_method(std::string method);
    void set_uri(std::string uri);
    void set_protocol(std::string protocol);
    void set_version(std::string version);

protected:
    void parse_start_line(const std::string& line) override;

private:
    void update_request_line();

    std::string method_;
    std::string uri_;
    std::string protocol_;
    std::string version_;
};

} // namespace relay::http
