#pragma once

/**
 * @file http_client.h
 * @brief Blocking JSON POST over libcurl
 */

#include "core/types.h"
#include <string>
#include <vector>

namespace holo_oracle {
namespace http {

/// Call once at startup before any request thread exists
void global_init();

/// Call once at shutdown after all request threads have finished
void global_cleanup();

struct Response {
    long status = 0;
    std::string body;
};

/**
 * @brief POST a JSON body and return the response
 *
 * Fails on transport errors and on HTTP status >= 400 (the error text then
 * carries the status and the start of the body). A fresh easy handle is used
 * per call, so concurrent calls from session threads are safe.
 */
Result<Response> post_json(const std::string& url,
                           const std::string& body,
                           const std::string& bearer_token,
                           int timeout_ms,
                           int connect_timeout_ms = 3000);

} // namespace http
} // namespace holo_oracle
