#pragma once
#include <relay/http/message_parser.h>
#include <cstdint>
#include <string>

namespace relay::http {

// Response parsed from "PROTOCOL/VERSION SP CODE [SP REASON]".
class Response : public MessageParser {
public:
    using MessageParser::MessageParser;

    const std::string& protocol() const { return protocol_; }
    const std::string& version() const { return version_; }
    uint16_t status() const { return status_; }
    const std::string& reason() const { return reason_; }

    void set_protocol(std::string protocol);
    void set_version(std::string version);
    void set_status(uint16_t status);
    void set_reason(std::string reason);

protected:
    void parse_start_line(const std::string& line) override;

private:
    void update_status_line();

    std::string protocol_;
    std::string version_;
    uint16_t status_ = 0;
    std::string reason_;
};

} // namespace relay::http
