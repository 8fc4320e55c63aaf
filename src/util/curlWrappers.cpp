#include "util/curlWrappers.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace hl::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::optional<std::string> findHeader(const std::string& rawHeaders, const std::string& name) {
    const auto lower = [](std::string s) {
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    };

    const auto wanted = lower(name);
    std::optional<std::string> found;

    size_t start = 0;
    while (start < rawHeaders.size()) {
        auto end = rawHeaders.find('\n', start);
        if (end == std::string::npos) end = rawHeaders.size();
        const auto line = rawHeaders.substr(start, end - start);
        start = end + 1;

        const auto colon = line.find(':');
        if (colon == std::string::npos || lower(line.substr(0, colon)) != wanted) continue;

        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(value.begin());
        while (!value.empty() && (value.back() == '\r' || value.back() == ' ' || value.back() == '\t')) value.pop_back();
        found = value;
    }

    return found;
}

}
