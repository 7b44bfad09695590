#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace hubbridge::afero {

/**
 * @brief HTTP methods used against the platform.
 */
enum class HttpMethod { Get, Put, Post };

std::string http_method_to_string(HttpMethod method);

/**
 * @brief A single HTTP request.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;  ///< Absolute URL without query string.
    std::vector<std::pair<std::string, std::string>>
        query;                                  ///< Query parameters.
    std::map<std::string, std::string> headers;  ///< Extra request headers.
    std::string body;                            ///< Request body, if any.
    std::chrono::milliseconds timeout{10000};    ///< Whole-request timeout.
};

/**
 * @brief Response of a completed HTTP exchange.
 *
 * Any status code is a completed exchange; only transport failures throw.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool is_success() const { return status >= 200 && status < 300; }
};

/**
 * @brief Raw request/response transport.
 *
 * Implementations throw device::BackendException when no response could be
 * obtained (DNS, connect, TLS, timeout).
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief Configuration for the libcurl transport.
 */
struct CurlTransportConfig {
    std::string user_agent = "hubbridge/1.0";  ///< User agent header.
    bool verify_ssl = true;  ///< Whether to verify TLS certificates.
    std::chrono::milliseconds connect_timeout{5000};  ///< Connect timeout.
};

/**
 * @brief HttpTransport on top of a reused libcurl easy handle.
 *
 * The handle is guarded by a mutex; in practice only the background worker
 * sends requests.
 */
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportConfig config = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;

    /**
     * @brief URL-encode a single query component.
     */
    std::string url_encode(const std::string& value);

private:
    CurlTransportConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<CURL, void (*)(CURL*)> curl_;
    std::mutex curl_mutex_;

    static size_t write_callback(char* ptr, size_t size, size_t nmemb,
                                 void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems,
                                  void* userdata);

    [[noreturn]] void handle_curl_error(CURLcode result,
                                        const std::string& operation);
};

}  // namespace hubbridge::afero
