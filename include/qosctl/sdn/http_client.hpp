#pragma once
/**
 * @file http_client.hpp
 * @brief Transport seam used by the SDN service.
 * @details The core shapes requests and interprets responses; moving bytes is
 *          left to an injected HttpClient. A transport failure (no response at
 *          all) is a ConfigurationExecution error, an HTTP error status is not.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qosctl/domain/errors.hpp"

namespace qosctl::sdn {

enum class HttpMethod : uint8_t { Get, Post, Put, Delete };

std::string_view to_string(HttpMethod m) noexcept;

/// Reads may be retried; writes are sent once.
constexpr bool is_idempotent_read(HttpMethod m) noexcept { return m == HttpMethod::Get; }

struct HttpRequest {
    HttpMethod                                       method{HttpMethod::Get};
    std::string                                      url;
    std::string                                      body;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds                        timeout{0};
};

struct HttpResponse {
    int         status{0};
    std::string body;
    std::string location;  ///< Location header, when the server sent one
};

/// 200, 201 and 204 count as accepted.
constexpr bool is_success(int status) noexcept {
    return status == 200 || status == 201 || status == 204;
}

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Send one request and wait for the response (bounded by request.timeout).
    /// Called concurrently from deployment workers.
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/// "Basic <base64(user:password)>".
std::string basic_auth(std::string_view username, std::string_view password);

} // namespace qosctl::sdn
