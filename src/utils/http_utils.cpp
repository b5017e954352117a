// HttpUtils.cpp
#include "http_utils.hpp"
#include <chrono>
#include <thread>
#include <stdexcept>
#include <curl/curl.h>

namespace MeshBridge {
namespace HttpUtils {

void initialize_http_layer() {
    CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(init_result));
    }
}

void shutdown_http_layer() {
    curl_global_cleanup();
}

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse http_post(const HttpRequest& http_request) {
    if (http_request.url.empty()) {
        throw std::runtime_error("HTTP POST requires a URL");
    }

    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP POST request");
    }

    HttpResponse response;
    struct curl_slist* headers = nullptr;
    CURLcode curl_result = CURLE_OK;
    bool success = false;
    int attempts = http_request.retries > 0 ? http_request.retries : 1;
    
    try {
        for (const auto& header_line : http_request.headers) {
            headers = curl_slist_append(headers, header_line.c_str());
        }
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        
        for (int retry_attempt = 0; retry_attempt < attempts; ++retry_attempt) {
            response.body.clear();
            curl_result = curl_easy_perform(curl_handle);
            curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
            
            if (curl_result == CURLE_OK && response.status_code < 400) {
                success = true;
                break;
            }
            
            if (retry_attempt < attempts - 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(http_request.retry_delay_ms));
            }
        }
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);

    if (!success) {
        std::string error_message = "HTTP POST failed after " + std::to_string(attempts) + " attempt(s). " +
                                   "Last error: " + std::string(curl_easy_strerror(curl_result)) + 
                                   " (HTTP " + std::to_string(response.status_code) + ") " +
                                   "URL: " + http_request.url;
        throw std::runtime_error(error_message);
    }
    return response;
}

} // namespace HttpUtils
} // namespace MeshBridge
