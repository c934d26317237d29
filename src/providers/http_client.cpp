#include "providers/http_client.hpp"

#include <cstdlib>

#include "utils/logging.hpp"

namespace autolab::providers {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

}  // namespace

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& url, int timeout_seconds, bool use_proxy) {
    std::string scheme_host_port = url.https ? "https://" : "http://";
    scheme_host_port += url.host + ":" + std::to_string(url.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(timeout_seconds);
    client->set_read_timeout(timeout_seconds);

    if (use_proxy) {
        const char* kProxyVars[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
        std::string proxy_host;
        int proxy_port = 0;
        bool applied = false;
        for (const auto* key : kProxyVars) {
            if (ParseProxyHostPort(GetEnv(key), proxy_host, proxy_port)) {
                client->set_proxy(proxy_host, proxy_port);
                applied = true;
                break;
            }
        }
        if (!applied && (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty())) {
            utils::LogWarn("llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
        }
    }
    return client;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}  // namespace autolab::providers
