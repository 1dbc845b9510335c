// SPECTRE - libcurl Artifact Fetcher
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/circuits/asset_loader.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace spectre {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct MultiDeleter {
    void operator()(CURLM* handle) const { curl_multi_cleanup(handle); }
};

using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
using MultiPtr = std::unique_ptr<CURLM, MultiDeleter>;

struct Transfer {
    size_t index{0};
    std::string url;
    EasyPtr easy;
    FetchResult result;
    const IArtifactFetcher::TransferProgress* progress{nullptr};
    bool attached{false};
    bool done{false};
    CURLcode code{CURLE_OK};
};

void EnsureCurlInitialized() {
    static std::once_flag once;
    static CURLcode initResult = CURLE_OK;
    std::call_once(once, [] { initResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (initResult != CURLE_OK) {
        throw ArtifactError(std::string("libcurl initialization failed: ") +
                            curl_easy_strerror(initResult));
    }
}

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* transfer = static_cast<Transfer*>(userp);
    size_t n = size * nmemb;
    transfer->result.body.insert(transfer->result.body.end(),
                                 reinterpret_cast<Byte*>(data),
                                 reinterpret_cast<Byte*>(data) + n);
    return n;
}

int ProgressCallbackFn(void* userp, curl_off_t dltotal, curl_off_t dlnow,
                       curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* transfer = static_cast<Transfer*>(userp);
    if (transfer->progress && *transfer->progress) {
        bool keepGoing = (*transfer->progress)(transfer->index,
                                               static_cast<uint64_t>(dlnow),
                                               static_cast<uint64_t>(dltotal));
        if (!keepGoing) {
            return 1;  // aborts with CURLE_ABORTED_BY_CALLBACK
        }
    }
    return 0;
}

/// Detaches every easy handle before the multi handle goes away
class MultiGuard {
public:
    MultiGuard(CURLM* multi, std::vector<std::unique_ptr<Transfer>>& transfers)
        : multi_(multi), transfers_(transfers) {}
    ~MultiGuard() {
        for (auto& t : transfers_) {
            if (t->attached) {
                curl_multi_remove_handle(multi_, t->easy.get());
                t->attached = false;
            }
        }
    }

private:
    CURLM* multi_;
    std::vector<std::unique_ptr<Transfer>>& transfers_;
};

} // namespace

CurlArtifactFetcher::CurlArtifactFetcher(long timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds) {}

std::vector<FetchResult> CurlArtifactFetcher::FetchAll(const std::vector<std::string>& urls,
                                                       const TransferProgress& progress) {
    EnsureCurlInitialized();

    MultiPtr multi(curl_multi_init());
    if (!multi) {
        throw ArtifactError("curl_multi_init failed");
    }

    std::vector<std::unique_ptr<Transfer>> transfers;
    transfers.reserve(urls.size());
    MultiGuard guard(multi.get(), transfers);

    for (size_t i = 0; i < urls.size(); ++i) {
        auto t = std::make_unique<Transfer>();
        t->index = i;
        t->url = urls[i];
        t->progress = &progress;
        t->easy.reset(curl_easy_init());
        if (!t->easy) {
            throw ArtifactError("curl_easy_init failed");
        }

        CURL* easy = t->easy.get();
        curl_easy_setopt(easy, CURLOPT_URL, t->url.c_str());
        curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(easy, CURLOPT_TIMEOUT, timeoutSeconds_);
        curl_easy_setopt(easy, CURLOPT_USERAGENT, "spectre-prover/1.0");
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, t.get());
        curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(easy, CURLOPT_XFERINFOFUNCTION, ProgressCallbackFn);
        curl_easy_setopt(easy, CURLOPT_XFERINFODATA, t.get());
        curl_easy_setopt(easy, CURLOPT_PRIVATE, t.get());

        CURLMcode mc = curl_multi_add_handle(multi.get(), easy);
        if (mc != CURLM_OK) {
            throw ArtifactError(std::string("curl_multi_add_handle failed: ") +
                                curl_multi_strerror(mc));
        }
        t->attached = true;
        transfers.push_back(std::move(t));
    }

    int running = 0;
    do {
        CURLMcode mc = curl_multi_perform(multi.get(), &running);
        if (mc != CURLM_OK) {
            throw ArtifactError(std::string("curl_multi_perform failed: ") +
                                curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi.get(), &queued)) {
            if (msg->msg != CURLMSG_DONE) continue;
            Transfer* t = nullptr;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &t);
            if (!t) continue;
            t->done = true;
            t->code = msg->data.result;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_RESPONSE_CODE, &t->result.httpStatus);
            LOG_DEBUG(util::LogCategory::CIRCUITS) << "Transfer finished: " << t->url
                                                   << " status=" << t->result.httpStatus
                                                   << " bytes=" << t->result.body.size();
        }

        if (running > 0) {
            mc = curl_multi_wait(multi.get(), nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK) {
                throw ArtifactError(std::string("curl_multi_wait failed: ") +
                                    curl_multi_strerror(mc));
            }
        }
    } while (running > 0);

    std::vector<FetchResult> results;
    results.reserve(transfers.size());
    for (auto& t : transfers) {
        if (t->code == CURLE_ABORTED_BY_CALLBACK) {
            throw ArtifactError("Circuit download cancelled");
        }
        if (!t->done || t->code != CURLE_OK) {
            throw ArtifactError("Failed to fetch " + t->url + ": " +
                                curl_easy_strerror(t->code));
        }
        results.push_back(std::move(t->result));
    }
    return results;
}

} // namespace spectre
