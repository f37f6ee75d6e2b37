#pragma once
#include <relay/server/request_handler.h>
#include <filesystem>
#include <optional>
#include <string>

namespace relay::server {

// Serves regular files below base_dir. The request URI (minus one leading
// '/' and any query string) is the path relative to base_dir.
class StaticFileHandler : public RequestHandler {
public:
    explicit StaticFileHandler(std::filesystem::path base_dir);

    void handle(net::ByteStream& client, http::Request& request,
                core::DiagnosticEmitter& diagnostics) override;

    // File a URI maps to, or nullopt if it escapes base_dir or does not
    // name a regular file.
    std::optional<std::filesystem::path> resolve(const std::string& uri) const;

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    std::filesystem::path base_dir_;
};

} // namespace relay::server
