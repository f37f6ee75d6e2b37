#include <relay/net/readiness.h>

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace relay::net {

size_t ReadinessSet::add(ByteStream& stream) {
    streams_.push_back(&stream);
    return streams_.size() - 1;
}

std::vector<size_t> ReadinessSet::wait() {
    while (true) {
        std::vector<size_t> ready;
        for (size_t i = 0; i < streams_.size(); ++i) {
            if (streams_[i]->is_open() && streams_[i]->has_pending()) {
                ready.push_back(i);
            }
        }
        if (!ready.empty()) {
            return ready;
        }

        std::vector<struct pollfd> pfds;
        std::vector<size_t> owners;
        for (size_t i = 0; i < streams_.size(); ++i) {
            if (!streams_[i]->is_open() || streams_[i]->fd() < 0) {
                continue;
            }
            struct pollfd pfd {};
            pfd.fd = streams_[i]->fd();
            pfd.events = POLLIN;
            pfds.push_back(pfd);
            owners.push_back(i);
        }
        if (pfds.empty()) {
            return ready;
        }

        int rv = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), -1);
        if (rv < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t k = 0; k < pfds.size(); ++k) {
            if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) {
                continue;
            }
            // False when only protocol bytes arrived (e.g. a TLS session ticket).
            if (streams_[owners[k]]->process_readable()) {
                ready.push_back(owners[k]);
            }
        }
        if (!ready.empty()) {
            return ready;
        }
    }
}

} // namespace relay::net
