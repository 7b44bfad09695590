#include "http_transport.hpp"

#include "device/common/device_exceptions.hpp"
#include "logging/logging.hpp"

namespace hubbridge::afero {

using device::BackendException;
using device::DeviceErrorCode;

std::string http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Post:
            return "POST";
        default:
            return "GET";
    }
}

// CURL write callback
size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb,
                                     void* userdata) {
    auto* response_data = static_cast<std::string*>(userdata);
    response_data->append(ptr, size * nmemb);
    return size * nmemb;
}

// CURL header callback
size_t CurlTransport::header_callback(char* buffer, size_t size,
                                      size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string header(buffer, size * nitems);

    auto colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        // Trim whitespace
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t\r\n") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        (*headers)[name] = value;
    }

    return nitems * size;
}

CurlTransport::CurlTransport(CurlTransportConfig config)
    : config_(std::move(config)),
      logger_(logging::get("afero")),
      curl_(nullptr, curl_easy_cleanup) {
    curl_global_init(CURL_GLOBAL_ALL);
    curl_.reset(curl_easy_init());
    if (!curl_) {
        logger_->critical("Failed to initialize libcurl");
        throw BackendException("Failed to initialize libcurl",
                               DeviceErrorCode::InternalError);
    }
}

CurlTransport::~CurlTransport() = default;

std::string CurlTransport::url_encode(const std::string& value) {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    char* output = curl_easy_escape(curl_.get(), value.c_str(),
                                    static_cast<int>(value.length()));
    if (!output) {
        throw BackendException("Failed to URL encode string",
                               DeviceErrorCode::InternalError);
    }
    std::string result(output);
    curl_free(output);
    return result;
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    std::string url = request.url;
    if (!request.query.empty()) {
        std::string query;
        for (const auto& [key, value] : request.query) {
            if (!query.empty()) {
                query += '&';
            }
            query += url_encode(key) + "=" + url_encode(value);
        }
        url += (url.find('?') == std::string::npos ? "?" : "&") + query;
    }

    std::unique_lock<std::mutex> lock(curl_mutex_);

    const auto method = http_method_to_string(request.method);
    logger_->debug("Making {} request to {}", method, url);

    // Reset CURL options
    curl_easy_reset(curl_.get());

    HttpResponse response;

    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT,
                     config_.user_agent.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);

    // SSL verification
    if (!config_.verify_ssl) {
        curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    std::unique_ptr<curl_slist, void (*)(curl_slist*)> header_list(
        nullptr, curl_slist_free_all);
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw BackendException("Failed to build request headers",
                                   DeviceErrorCode::InternalError);
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(curl_.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDS,
                             request.body.c_str());
            curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
            break;
        case HttpMethod::Put:
            curl_easy_setopt(curl_.get(), CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDS,
                             request.body.c_str());
            curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
            break;
    }

    CURLcode res = curl_easy_perform(curl_.get());
    if (res != CURLE_OK) {
        handle_curl_error(res, method + " " + request.url);
    }

    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (!response.is_success()) {
        logger_->warn("HTTP {} from {} {}", response.status, method,
                      request.url);
    }
    return response;
}

void CurlTransport::handle_curl_error(CURLcode result,
                                      const std::string& operation) {
    std::string error_message =
        "CURL error during " + operation + ": " + curl_easy_strerror(result);
    logger_->error(error_message);

    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:
            throw BackendException(error_message, DeviceErrorCode::Timeout);
        default:
            throw BackendException(error_message);
    }
}

}  // namespace hubbridge::afero
