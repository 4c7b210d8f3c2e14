#include "net/CurlTransport.hpp"
#include "net/CancellationToken.hpp"
#include "core/Errors.hpp"

#include <curl/curl.h>
#include <memory>

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->isCancelled()) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(long timeoutMs)
    : timeoutMs_(timeoutMs) {}

HttpResponse CurlTransport::send(const HttpRequest& req, const CancellationToken* cancel) {
    if (cancel && cancel->isCancelled()) throw OperationCancelled();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError(0, "", methodName(req.method) + " " + req.url + ": curl_easy_init failed");
    }

    curl_slist* rawHeaders = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        rawHeaders = curl_slist_append(rawHeaders, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(rawHeaders);

    HttpResponse res;
    CURL* h = curl.get();

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    if (req.method == HttpMethod::Post) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    } else {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs_);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs_);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, cancel);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode rc = curl_easy_perform(h);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        throw OperationCancelled();
    }
    if (rc != CURLE_OK) {
        std::string reason = curl_easy_strerror(rc);
        throw TransportError(0, reason, methodName(req.method) + " " + req.url + ": " + reason);
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &res.statusCode);
    return res;
}
