#include "image_fetcher.hpp"

#include "errors.hpp"
#include "image_decode.hpp"

#include <algorithm>
#include <thread>
#include <utility>

ImageFetcher::ImageFetcher(HttpTransport& transport,
                           RetryPolicy policy,
                           std::chrono::milliseconds interImageDelay,
                           const CancellationToken* cancel)
    : transport_(transport),
      policy_(policy),
      interImageDelay_(interImageDelay),
      cancel_(cancel) {
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
}

void ImageFetcher::pace() const {
    using Clock = std::chrono::steady_clock;
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lk(paceMutex_);
        slot = std::max(Clock::now(), nextSlot_);
        nextSlot_ = slot + interImageDelay_;
    }
    auto wait = std::chrono::ceil<std::chrono::milliseconds>(slot - Clock::now());
    if (wait.count() <= 0) return;
    if (cancel_) {
        // An early wake only shortens the pause; the chapter still finishes.
        cancel_->wait_for(wait);
    } else {
        std::this_thread::sleep_for(wait);
    }
}

ImageAsset ImageFetcher::fetch(const std::string& url,
                               const std::string& referer,
                               const ImageFailureHandler& onFailure) const {
    HeaderMap headers;
    if (!referer.empty()) headers["Referer"] = referer;

    std::string lastError;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (attempt > 1) {
            if (cancel_ && cancel_->cancelled()) {
                throw AssetError("cancelled before retry of " + url + " (" + lastError + ")", url, true);
            }
            auto backoff = policy_.backoff_before(attempt);
            if (cancel_) {
                if (!cancel_->wait_for(backoff)) {
                    throw AssetError("cancelled before retry of " + url + " (" + lastError + ")", url, true);
                }
            } else if (backoff.count() > 0) {
                std::this_thread::sleep_for(backoff);
            }
        }

        pace();
        HttpResponse r = transport_.get(url, headers);

        bool transient = false;
        if (r.transport_error) {
            transient = true;
            lastError = "network error: " + r.error_message;
        } else if (r.status >= 500 || r.status == 429) {
            transient = true;
            lastError = "HTTP " + std::to_string(r.status);
        } else if (r.status != 200) {
            lastError = "HTTP " + std::to_string(r.status);
        } else if (r.body.empty()) {
            lastError = "empty payload";
        } else {
            auto info = inspect_image(r.body);
            if (info) {
                ImageAsset asset;
                asset.source_url = url;
                asset.bytes = std::move(r.body);
                asset.width = info->width;
                asset.height = info->height;
                return asset;
            }
            lastError = "payload is not a decodable image";
        }

        bool willRetry = transient && attempt < policy_.max_attempts;
        if (onFailure) onFailure(url, attempt, willRetry, lastError);
        if (!transient) {
            throw AssetError(url + ": " + lastError, url, false);
        }
    }
    throw AssetError(url + ": gave up after " + std::to_string(policy_.max_attempts) +
                     " attempts (" + lastError + ")", url, true);
}
