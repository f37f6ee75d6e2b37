#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace relay::net {

// Opaque bidirectional byte channel. The relay does not know or care
// whether the bytes are encrypted on the wire.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Descriptor to poll for readability, or -1 if the stream is not
    // backed by one.
    virtual int fd() const = 0;

    // Write every byte. Returns false on error or if the peer went away.
    virtual bool write_all(std::string_view data) = 0;

    // Read a chunk of available data.
    // Returns std::nullopt on error, empty string on EOF/connection close.
    virtual std::optional<std::string> read_some() = 0;

    // Bytes already buffered inside the stream that a poll on fd() would
    // not report (e.g. decrypted TLS records).
    virtual bool has_pending() const { return false; }

    // Called by ReadinessSet once poll reports fd() readable. A stream that
    // frames its payload (TLS) consumes what arrived and returns false when
    // those bytes carried no payload, EOF or error; the set then waits
    // again. After true, read_some() does not block.
    virtual bool process_readable() { return true; }

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

} // namespace relay::net
