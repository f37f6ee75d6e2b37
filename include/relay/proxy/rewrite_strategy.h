#pragma once
#include <relay/http/request.h>
#include <relay/http/response.h>
#include <memory>
#include <string>
#include <vector>

namespace relay::proxy {

// Hooks the relay calls exactly once per exchange: on the outbound request
// before it is written to the target, and on the response as soon as its
// headers are complete. Both may change the start-line and any header.
class RewriteStrategy {
public:
    virtual ~RewriteStrategy() = default;

    virtual void rewrite_request(http::Request& request) = 0;
    virtual void rewrite_response(http::Response& response) = 0;
};

// Points Host at the target and forces Connection: close in both
// directions; the relay handles a single exchange per connection.
class DefaultRewriteStrategy : public RewriteStrategy {
public:
    explicit DefaultRewriteStrategy(std::string target_host);

    void rewrite_request(http::Request& request) override;
    void rewrite_response(http::Response& response) override;

    const std::string& target_host() const { return target_host_; }

private:
    std::string target_host_;
};

// Runs each strategy in the order added.
class CompositeRewriteStrategy : public RewriteStrategy {
public:
    CompositeRewriteStrategy& add(std::shared_ptr<RewriteStrategy> strategy);

    void rewrite_request(http::Request& request) override;
    void rewrite_response(http::Response& response) override;

    size_t size() const { return strategies_.size(); }

private:
    std::vector<std::shared_ptr<RewriteStrategy>> strategies_;
};

} // namespace relay::proxy
