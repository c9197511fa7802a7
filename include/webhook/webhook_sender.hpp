#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hookrelay {

struct OutboundRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Result of one POST. status is unset when no HTTP response arrived
 * (timeout, connection refused, TLS failure); error then says why.
 */
struct SendResult {
    std::optional<int> status;
    std::string body;
    std::string error;

    [[nodiscard]] bool is_success() const {
        return status && *status >= 200 && *status < 300;
    }
};

/**
 * @brief Outbound HTTP transport for webhook deliveries
 *
 * One instance per worker thread; implementations need not be thread-safe.
 */
class IWebhookSender {
public:
    virtual ~IWebhookSender() = default;

    [[nodiscard]] virtual SendResult send(const OutboundRequest& request) = 0;
};

using WebhookSenderFactory = std::function<std::unique_ptr<IWebhookSender>()>;

/**
 * @brief cpp-httplib client, one connection per request
 */
class HttpWebhookSender : public IWebhookSender {
public:
    HttpWebhookSender() = default;

    [[nodiscard]] SendResult send(const OutboundRequest& request) override;

    struct ParsedUrl {
        std::string scheme_host_port;   // "https://host:port"
        std::string path;               // "/path?query"
    };

    /// @return nullopt for anything other than http(s)://host[:port][/path]
    [[nodiscard]] static std::optional<ParsedUrl> parse_url(const std::string& url);
};

} // namespace hookrelay
