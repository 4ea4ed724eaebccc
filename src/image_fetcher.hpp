#pragma once

#include "cancellation.hpp"
#include "http_transport.hpp"
#include "models.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

// Called for every failed attempt: url, attempt number, whether another
// attempt will follow, reason.
using ImageFailureHandler = std::function<void(const std::string&, int, bool, const std::string&)>;

// Downloads one image with bounded retries. Transport errors, HTTP 5xx and
// 429 are retried; HTTP 4xx and undecodable payloads fail immediately.
// Requests from every thread sharing a fetcher are spaced at least
// interImageDelay apart.
class ImageFetcher {
public:
    ImageFetcher(HttpTransport& transport,
                 RetryPolicy policy,
                 std::chrono::milliseconds interImageDelay,
                 const CancellationToken* cancel = nullptr);

    // Throws AssetError once the image is given up on.
    ImageAsset fetch(const std::string& url,
                     const std::string& referer,
                     const ImageFailureHandler& onFailure = {}) const;

    void set_inter_image_delay(std::chrono::milliseconds delay) { interImageDelay_ = delay; }

private:
    void pace() const;

    HttpTransport& transport_;
    RetryPolicy policy_;
    std::chrono::milliseconds interImageDelay_;
    const CancellationToken* cancel_;

    mutable std::mutex paceMutex_;
    mutable std::chrono::steady_clock::time_point nextSlot_{};
};
