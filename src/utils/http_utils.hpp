#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::string body;
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpRequest(const std::string& u,
                std::vector<std::string> header_lines,
                std::string b,
                int timeout = 10,
                bool ssl_verify = true)
        : url(u), headers(std::move(header_lines)), body(std::move(b)),
          timeout_seconds(timeout), enable_ssl_verification(ssl_verify) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// One-time libcurl global setup; safe to call from several threads.
void initialize_http_client();

// Performs a single POST. Any HTTP status is returned to the caller; only
// transport-level failures (DNS, connect, TLS, timeout) throw std::runtime_error.
HttpResponse http_post(const HttpRequest& req);

#endif // HTTP_UTILS_HPP
