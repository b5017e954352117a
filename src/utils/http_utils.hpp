#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

namespace MeshBridge {
namespace HttpUtils {

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::string body;
    std::vector<std::string> headers;
    int retries;
    int timeout_seconds;
    int retry_delay_ms;

    HttpRequest(const std::string& u,
                std::string b,
                int timeout = 10,
                int r = 1,
                int retry_delay = 500)
        : url(u), body(std::move(b)), headers{"Content-Type: application/json"},
          retries(r), timeout_seconds(timeout), retry_delay_ms(retry_delay) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Process-wide libcurl setup; call once from the main thread before any request
void initialize_http_layer();
void shutdown_http_layer();

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

// Throws std::runtime_error when every attempt fails or the server answers >= 400
HttpResponse http_post(const HttpRequest& http_request);

} // namespace HttpUtils
} // namespace MeshBridge

#endif // HTTP_UTILS_HPP
