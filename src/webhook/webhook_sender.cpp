#include "webhook/webhook_sender.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#include <httplib.h>

#include <format>

namespace hookrelay {

std::optional<HttpWebhookSender::ParsedUrl> HttpWebhookSender::parse_url(const std::string& url) {
    std::string rest = url;
    bool use_ssl = false;
    int port = 80;

    if (rest.starts_with("https://")) {
        use_ssl = true;
        port = 443;
        rest = rest.substr(8);
    } else if (rest.starts_with("http://")) {
        rest = rest.substr(7);
    } else {
        return std::nullopt;
    }

    std::string host;
    std::string path;
    const auto path_pos = rest.find_first_of("/?");
    if (path_pos != std::string::npos) {
        host = rest.substr(0, path_pos);
        path = rest.substr(path_pos);
        if (path.front() == '?') path.insert(path.begin(), '/');
    } else {
        host = rest;
        path = "/";
    }

    const auto port_pos = host.find(':');
    if (port_pos != std::string::npos) {
        const auto parsed = utils::try_parse_int<int>(std::string_view(host).substr(port_pos + 1));
        if (!parsed || !utils::in_range<1, 65535>(*parsed)) return std::nullopt;
        port = *parsed;
        host = host.substr(0, port_pos);
    }
    if (host.empty()) return std::nullopt;

    return ParsedUrl{
        std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port),
        std::move(path)
    };
}

SendResult HttpWebhookSender::send(const OutboundRequest& request) {
    SendResult result;

    const auto target = parse_url(request.url);
    if (!target) {
        result.error = std::format("Unsupported webhook URL: {}", request.url);
        return result;
    }

    httplib::Client client(target->scheme_host_port);
    client.set_connection_timeout(request.timeout);
    client.set_read_timeout(request.timeout);
    client.set_write_timeout(request.timeout);
    client.set_follow_location(false);

    httplib::Headers headers;
    std::string content_type = http::kJsonContentType;
    for (const auto& [name, value] : request.headers) {
        if (name == http::kContentTypeHeader) {
            content_type = value;
            continue;
        }
        headers.emplace(name, value);
    }

    auto res = client.Post(target->path, headers, request.body, content_type);
    if (!res) {
        result.error = httplib::to_string(res.error());
        return result;
    }

    result.status = res->status;
    result.body = std::move(res->body);
    return result;
}

} // namespace hookrelay
