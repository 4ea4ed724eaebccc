#pragma once

#include "cancellation.hpp"
#include "models.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace cpr { class Session; }

// Turns a chapter reference into its content. Implementations hold one
// stateful session and are not reentrant: one chapter at a time.
class ContentProvider {
public:
    virtual ~ContentProvider() = default;

    // Throws ProviderError.
    virtual ChapterContent fetch(const ChapterRef& ref) = 0;

    // Called once the run is over.
    virtual void close() {}
};

struct ProviderConfig {
    std::string profile_path;                    // file holding a Cookie header line
    std::chrono::milliseconds post_load_wait{4000};
    bool keep_session_open = false;
    RetryPolicy retry;
    int timeout_ms = 30000;
    std::string user_agent;
};

// Plain HTTP provider: loads the chapter page with a persistent cpr session
// and reads images and the next link out of the markup.
class HttpContentProvider : public ContentProvider {
public:
    explicit HttpContentProvider(ProviderConfig config, const CancellationToken* cancel = nullptr);
    ~HttpContentProvider() override;

    ChapterContent fetch(const ChapterRef& ref) override;
    void close() override;

    static ChapterContent parse_chapter_page(const std::string& html, const std::string& pageUrl);

private:
    std::string fetch_html(const std::string& url);
    void open_session();
    void wait(std::chrono::milliseconds delay) const;

    ProviderConfig config_;
    const CancellationToken* cancel_;
    std::string cookie_;
    std::unique_ptr<cpr::Session> session_;
};
