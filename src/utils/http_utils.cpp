// HttpUtils.cpp
#include "http_utils.hpp"
#include <curl/curl.h>
#include <mutex>
#include <string>
#include <stdexcept>

// Implement write_callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void initialize_http_client() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (init_result != CURLE_OK) {
            throw std::runtime_error("Failed to initialize CURL: " + std::string(curl_easy_strerror(init_result)));
        }
    });
}

// Implement http_post
HttpResponse http_post(const HttpRequest& http_request) {
    initialize_http_client();

    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP POST request");
    }

    HttpResponse response;
    struct curl_slist* headers = nullptr;
    CURLcode curl_result = CURLE_OK;

    try {
        for (const std::string& header_line : http_request.headers) {
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
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

        curl_result = curl_easy_perform(curl_handle);
        if (curl_result == CURLE_OK) {
            curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
        }
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);

    if (curl_result != CURLE_OK) {
        throw std::runtime_error("HTTP POST failed: " + std::string(curl_easy_strerror(curl_result)) +
                                 " URL: " + http_request.url);
    }
    return response;
}
