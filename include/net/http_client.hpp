#pragma once

#include <string>
#include <vector>

namespace lore {

/**
 * @brief Credentials for HTTP basic authentication
 */
struct BasicAuth {
    std::string user;
    std::string password;

    bool empty() const { return user.empty(); }
};

/**
 * @brief Make an HTTP POST request with a JSON body
 *
 * @param url Full request URL
 * @param json_payload Request body
 * @param headers Raw header lines ("Name: value")
 * @param timeout_seconds Transfer timeout
 * @param auth Optional basic auth credentials
 * @return Response body
 *
 * Throws std::runtime_error on transport failure or a non-2xx status.
 */
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds = 60,
    const BasicAuth& auth = {}
);

} // namespace lore
