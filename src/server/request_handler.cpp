#include <relay/server/request_handler.h>

#include <stdexcept>

namespace relay::server {

http::Request read_request(net::ByteStream& client, size_t max_header_bytes) {
    http::Request request(max_header_bytes);
    while (!request.headers_read()) {
        auto data = client.read_some();
        if (!data) {
            throw std::runtime_error("Failed to read request from client");
        }
        if (data->empty()) {
            throw std::runtime_error("Client closed before request headers were complete");
        }
        request.feed(*data);
    }
    return request;
}

bool write_status(net::ByteStream& client, int status, const std::string& reason,
                  const std::string& body) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    out += "Connection: close\r\n";
    out += "\r\n";
    out += body;
    return client.write_all(out);
}

} // namespace relay::server
