#pragma once

#include "concurrency/Interrupt.hpp"

#include <curl/curl.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hl::util {

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Case-insensitive lookup of the last occurrence of a header in a raw header block.
[[nodiscard]] std::optional<std::string> findHeader(const std::string& rawHeaders, const std::string& name);

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

    // Escapes a single path segment (slashes included).
    [[nodiscard]] std::string escape(const std::string& s) const {
        char* esc = curl_easy_escape(h_, s.c_str(), static_cast<int>(s.size()));
        if (!esc) throw std::runtime_error("curl_easy_escape failed");
        std::string out(esc);
        curl_free(esc);
        return out;
    }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    [[nodiscard]] curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

template <class SetupFn>
HttpResponse performCurl(const concurrency::InterruptFlag& interrupt, SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    if (interrupt) {
        // Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, interrupt.get());
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION,
                         +[](void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                             return static_cast<std::atomic<bool>*>(ud)->load(std::memory_order_acquire) ? 1 : 0;
                         });
    }

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);

    if (r.curl == CURLE_ABORTED_BY_CALLBACK) throw concurrency::Interrupted("HTTP transfer");
    return r;
}

}
