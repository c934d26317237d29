#pragma once

#include <memory>
#include <string>

#include "httplib.h"

namespace autolab::providers {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url);

// Client for the scheme/host/port of `base_url`, with both timeouts set and, when
// requested, the HTTP(S)_PROXY environment applied.
std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& url, int timeout_seconds, bool use_proxy);

std::string MaskKey(const std::string& key);

}  // namespace autolab::providers
