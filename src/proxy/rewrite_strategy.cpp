#include <relay/proxy/rewrite_strategy.h>
#include <utility>

namespace relay::proxy {

DefaultRewriteStrategy::DefaultRewriteStrategy(std::string target_host)
    : target_host_(std::move(target_host)) {}

void DefaultRewriteStrategy::rewrite_request(http::Request& request) {
    auto& headers = request.headers();
    // The client addressed us; the target expects its own name.
    headers.replace("Host", target_host_);
    headers.replace("Connection", "close");
}

void DefaultRewriteStrategy::rewrite_response(http::Response& response) {
    response.headers().replace("Connection", "close");
}

CompositeRewriteStrategy& CompositeRewriteStrategy::add(std::shared_ptr<RewriteStrategy> strategy) {
    if (strategy) {
        strategies_.push_back(std::move(strategy));
    }
    return *this;
}

void CompositeRewriteStrategy::rewrite_request(http::Request& request) {
    for (auto& strategy : strategies_) {
        strategy->rewrite_request(request);
    }
}

void CompositeRewriteStrategy::rewrite_response(http::Response& response) {
    for (auto& strategy : strategies_) {
        strategy->rewrite_response(response);
    }
}

} // namespace relay::proxy
