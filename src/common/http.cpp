#include "common/http.hpp"
#include <memory>

namespace judgecore {
using namespace std;

bool http_response::timed_out() const {
    return code == CURLE_OPERATION_TIMEDOUT;
}

bool http_response::aborted() const {
    return code == CURLE_ABORTED_BY_CALLBACK;
}

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto body = static_cast<string *>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

static int check_cancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto token = static_cast<const cancellation_token *>(clientp);
    return token && token->cancelled() ? 1 : 0;
}

typedef unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle;

/**
 * @brief 设置通用选项并执行请求
 */
static http_response perform(CURL *curl, const string &url, chrono::milliseconds timeout, const cancellation_token *token) {
    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    if (token) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancelled);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, token);
    }

    response.code = curl_easy_perform(curl);
    if (response.code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.error = error_buffer[0] ? error_buffer : curl_easy_strerror(response.code);
    }
    return response;
}

static http_response init_failure() {
    http_response response;
    response.code = CURLE_FAILED_INIT;
    response.error = "unable to initialize curl";
    return response;
}

http_response http_perform(const string &method,
                           const string &url,
                           const string &body,
                           const string &content_type,
                           chrono::milliseconds timeout,
                           const cancellation_token *token) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return init_failure();

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty() || method == "POST" || method == "PUT") {
        headers.reset(curl_slist_append(nullptr, ("Content-Type: " + content_type).c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    return perform(curl.get(), url, timeout, token);
}

http_response http_upload(const string &url,
                          const string &field,
                          const string &filename,
                          const string &content,
                          chrono::milliseconds timeout,
                          const cancellation_token *token) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return init_failure();

    unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl.get()), curl_mime_free);
    curl_mimepart *part = curl_mime_addpart(mime.get());
    curl_mime_name(part, field.c_str());
    curl_mime_filename(part, filename.c_str());
    curl_mime_data(part, content.data(), content.size());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    return perform(curl.get(), url, timeout, token);
}

string url_escape(const string &segment) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return segment;
    unique_ptr<char, decltype(&curl_free)> escaped(curl_easy_escape(curl.get(), segment.c_str(), (int)segment.size()), curl_free);
    if (!escaped) return segment;
    return string(escaped.get());
}

}  // namespace judgecore
