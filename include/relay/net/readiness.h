#pragma once
#include <relay/net/byte_stream.h>
#include <cstddef>
#include <vector>

namespace relay::net {

// Waits on several streams at once.
//
// wait() blocks until at least one registered stream is readable and
// returns the indices of every ready stream in registration order. There
// is no priority between streams: the caller services all of them before
// waiting again. A stream with has_pending() is ready without polling;
// hang-up and error conditions also count as ready so that the next read
// observes EOF or the error. A polled stream whose process_readable()
// returns false (e.g. a TLS session ticket with no application data) is
// not reported; if nothing else is ready, wait() polls again. Returns an
// empty list when no registered stream can ever become ready (all closed
// or not backed by a descriptor).
class ReadinessSet {
public:
    // Returns the index of the registered stream.
    size_t add(ByteStream& stream);

    std::vector<size_t> wait();

    size_t size() const { return streams_.size(); }

private:
    std::vector<ByteStream*> streams_;
};

} // namespace relay::net
