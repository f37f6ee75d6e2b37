#include <relay/server/static_file_handler.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace relay::server {

namespace {

constexpr const char kModule[] = "static";

bool has_parent_segment(const std::string& path) {
    std::istringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment == "..") {
            return true;
        }
    }
    return false;
}

void reply_not_found(net::ByteStream& client, core::DiagnosticEmitter& diagnostics) {
    if (!write_status(client, 404, "Not found")) {
        diagnostics.warning(kModule, "reply", "Failed to write 404 reply");
    }
}

} // anonymous namespace

StaticFileHandler::StaticFileHandler(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

std::optional<std::filesystem::path> StaticFileHandler::resolve(const std::string& uri) const {
    std::string path = uri;
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    if (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    if (path.empty() || path.front() == '/' || has_parent_segment(path)) {
        return std::nullopt;
    }

    auto file = base_dir_ / path;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    return file;
}

void StaticFileHandler::handle(net::ByteStream& client, http::Request& request,
                               core::DiagnosticEmitter& diagnostics) {
    auto file = resolve(request.uri());
    if (!file) {
        diagnostics.warning(kModule, "resolve", "Invalid request URI: " + request.uri());
        reply_not_found(client, diagnostics);
        return;
    }

    std::ifstream in(*file, std::ios::binary);
    if (!in) {
        diagnostics.warning(kModule, "read", "Cannot open " + file->string());
        reply_not_found(client, diagnostics);
        return;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    diagnostics.info(kModule, "send", "Sending file " + file->string());

    std::string out = "HTTP/1.1 200 OK\r\n";
    out += "Content-Length: " + std::to_string(data.size()) + "\r\n";
    out += "Connection: close\r\n";
    out += "\r\n";
    out += data;
    if (!client.write_all(out)) {
        diagnostics.warning(kModule, "send", "Client went away while sending " + file->string());
        return;
    }

    diagnostics.info(kModule, "send",
                     "Sent " + request.uri() + " => " + std::to_string(data.size()) + " bytes");
}

} // namespace relay::server
