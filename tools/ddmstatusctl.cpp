// ---------------------------------------------------------------------------
// ddmstatusctl - command-line client for a running ddmstatusd.
//
// Usage:
//   ./ddmstatusctl [status|summary|metrics|refresh] [base_url]
//
// Defaults:
//   command  = summary
//   base_url = http://127.0.0.1:8787
//
// Prints the response body. Exit code 0 on HTTP 2xx, 1 otherwise.
// ---------------------------------------------------------------------------
#include <curl/curl.h>
#include <cstdio>
#include <cstring>
#include <string>

static size_t append_cb(void* data, size_t size, size_t nmemb, void* user) {
    auto* out = static_cast<std::string*>(user);
    out->append(static_cast<const char*>(data), size * nmemb);
    return size * nmemb;
}

static long request(const std::string& url, bool post, std::string& body) {
    CURL* c = curl_easy_init();
    if (!c) return 0;

    curl_easy_setopt(c, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(c, CURLOPT_TIMEOUT,        5L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 2L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,  append_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA,      &body);
    if (post) {
        curl_easy_setopt(c, CURLOPT_POST,       1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, "");
    }

    CURLcode res = curl_easy_perform(c);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);
    } else {
        fprintf(stderr, "[CTL] %s: %s\n", url.c_str(), curl_easy_strerror(res));
    }
    curl_easy_cleanup(c);
    return http_code;
}

int main(int argc, char** argv) {
    std::string cmd  = argc > 1 ? argv[1] : "summary";
    std::string base = argc > 2 ? argv[2] : "http://127.0.0.1:8787";

    while (!base.empty() && base.back() == '/') base.pop_back();

    bool post = false;
    if (cmd == "refresh") {
        post = true;
    } else if (cmd != "status" && cmd != "summary" && cmd != "metrics") {
        fprintf(stderr, "Usage: %s [status|summary|metrics|refresh] [base_url]\n", argv[0]);
        return 2;
    }

    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        fprintf(stderr, "[CTL] curl init failed\n");
        return 1;
    }

    std::string body;
    long code = request(base + "/" + cmd, post, body);
    curl_global_cleanup();

    fwrite(body.data(), 1, body.size(), stdout);
    if (!body.empty() && body.back() != '\n') fputc('\n', stdout);

    if (code < 200 || code >= 300) {
        if (code != 0) fprintf(stderr, "[CTL] HTTP %ld\n", code);
        return 1;
    }
    return 0;
}
