#include "transport/CurlTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <mutex>
#include <stdexcept>

#include "monitor/Log.hpp"
#include "utils/UrlCodec.hpp"

// =======================
//  Helpers
// =======================
static std::once_flag curlInitOnce;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

static inline void trimCRLF(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ')) {
        s.pop_back();
    }
}

static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    HeaderList* headers = static_cast<HeaderList*>(userp);
    std::string line(buffer, size * nitems);
    trimCRLF(line);

    // a new status line starts another response of a redirect chain
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * nitems;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return size * nitems;

    std::string value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ')
        value.erase(value.begin());

    headers->push_back(HeaderEntry{line.substr(0, colon), value});
    return size * nitems;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

// Captured pseudo headers (":authority") and Content-Length are never
// forwarded; curl computes the length of the body actually sent.
static curl_slist* buildHeaderList(const HeaderList& headers) {
    curl_slist* list = nullptr;
    bool hasExpect = false;

    for (const auto& h : headers) {
        if (h.name.empty() || h.name.front() == ':') continue;

        const std::string name = lower(h.name);
        if (name == "content-length") continue;
        if (name == "expect") hasExpect = true;

        // "Name:" would tell curl to drop the header, "Name;" sends it empty
        std::string line = h.value.empty() ? h.name + ";" : h.name + ": " + h.value;
        list = curl_slist_append(list, line.c_str());
    }
    if (!hasExpect) {
        list = curl_slist_append(list, "Expect:");
    }
    return list;
}

// =======================
//  Shared handle
// =======================
struct CurlTransport::Shared {
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
        static_cast<Shared*>(userp)->locks[data].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userp) {
        static_cast<Shared*>(userp)->locks[data].unlock();
    }
};

CurlTransport::CurlTransport(ClientConfig config)
    : config_(std::move(config)),
      limiter_(config_.requestsPerSecond),
      shared_(std::make_unique<Shared>()) {
    std::call_once(curlInitOnce, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    shared_->share = curl_share_init();
    if (!shared_->share) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(shared_->share, CURLSHOPT_LOCKFUNC, &Shared::lock);
    curl_share_setopt(shared_->share, CURLSHOPT_UNLOCKFUNC, &Shared::unlock);
    curl_share_setopt(shared_->share, CURLSHOPT_USERDATA, shared_.get());
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);

    LOGX(LogLevel::Debug, "Transport", "curl " << curl_version_info(CURLVERSION_NOW)->version
         << ", timeout=" << config_.timeoutSeconds << "s"
         << ", verify_tls=" << (config_.verifyTls ? "on" : "off")
         << ", rps=" << config_.requestsPerSecond);
}

CurlTransport::~CurlTransport() {
    if (shared_ && shared_->share) {
        curl_share_cleanup(shared_->share);
        shared_->share = nullptr;
    }
}

std::string CurlTransport::proxyFor(const std::string& url) const {
    auto it = config_.proxies.find(splitUrl(url).scheme);
    if (it != config_.proxies.end()) return it->second;
    it = config_.proxies.find("all");
    if (it != config_.proxies.end()) return it->second;
    return {};
}

ResponseSnapshot CurlTransport::exchange(const RequestRecord& request,
                                         const HeaderList& headers,
                                         const std::optional<std::string>& body) {
    limiter_.wait();

    const auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        using namespace std::chrono;
        return duration<double, std::milli>(steady_clock::now() - start).count();
    };

    ResponseSnapshot snap;

    CURL* curl = curl_easy_init();
    if (!curl) {
        snap.error = "curl_easy_init failed";
        snap.elapsedMs = elapsedMs();
        return snap;
    }

    std::string responseBody;
    HeaderList responseHeaders;
    char errbuf[CURL_ERROR_SIZE] = {0};

    const std::optional<std::string>& payload = body ? body : request.body;
    const std::string method = upper(request.method.empty() ? std::string("GET") : request.method);
    const std::string proxy = proxyFor(request.url);
    curl_slist* headerList = buildHeaderList(headers);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_SHARE, shared_->share);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeoutSeconds * 1000.0));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 30L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verifyTls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verifyTls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);
    if (!proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
    }

    if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (payload) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload->data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload->size()));
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    } else if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    snap.elapsedMs = elapsedMs();

    if (res != CURLE_OK) {
        snap.error = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        LOGX(LogLevel::Debug, "Transport", method << " " << request.url << " failed: " << *snap.error);
        return snap;
    }

    snap.statusCode = static_cast<int>(httpCode);
    snap.body = std::move(responseBody);
    snap.headers = std::move(responseHeaders);

    LOGX(LogLevel::Debug, "Transport", method << " " << request.url << " -> " << httpCode
         << " (" << snap.size() << " bytes, " << snap.elapsedMs << "ms)");
    return snap;
}
