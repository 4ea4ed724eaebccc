#include "content_provider.hpp"

#include "chapter_naming.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "url_utils.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {

const std::vector<std::string> kImageExtensions = {".jpg", ".jpeg", ".png", ".webp", ".gif"};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

struct TagSpan {
    size_t begin = 0;   // the '<'
    size_t end = 0;     // one past the '>'
    std::string name;   // lower case
};

// Start tags with one of `names`, in document order. A '>' inside a quoted
// attribute value does not end the tag. Runs in linear time, so inline
// data: URIs of any size are fine.
std::vector<TagSpan> find_tags(const std::string& lower, const std::vector<std::string>& names) {
    std::vector<TagSpan> tags;
    size_t pos = 0;
    while ((pos = lower.find('<', pos)) != std::string::npos) {
        size_t p = pos + 1;
        while (p < lower.size() && is_space(lower[p])) ++p;
        size_t nameBegin = p;
        while (p < lower.size() && std::isalnum(static_cast<unsigned char>(lower[p]))) ++p;
        std::string name = lower.substr(nameBegin, p - nameBegin);
        bool wanted = std::find(names.begin(), names.end(), name) != names.end() &&
                      (p == lower.size() || is_space(lower[p]) || lower[p] == '>' || lower[p] == '/');
        if (!wanted) {
            ++pos;
            continue;
        }

        char quote = 0;
        size_t end = std::string::npos;
        for (size_t i = p; i < lower.size(); ++i) {
            char c = lower[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                end = i;
                break;
            }
        }
        // an unbalanced quote: fall back to the first '>'
        if (end == std::string::npos) end = lower.find('>', p);
        if (end == std::string::npos) break;

        tags.push_back(TagSpan{pos, end + 1, name});
        pos = end + 1;
    }
    return tags;
}

// Attributes of one start tag; names are lower-cased, first one wins.
std::unordered_map<std::string, std::string> tag_attributes(const std::string& tag) {
    std::unordered_map<std::string, std::string> attrs;
    size_t p = tag.find_first_of(" \t\n\r\f/>");
    while (p != std::string::npos && p < tag.size()) {
        while (p < tag.size() && (is_space(tag[p]) || tag[p] == '/')) ++p;
        if (p >= tag.size() || tag[p] == '>') break;

        size_t nameBegin = p;
        while (p < tag.size() && !is_space(tag[p]) && tag[p] != '=' && tag[p] != '>' && tag[p] != '/') ++p;
        std::string name = to_lower(tag.substr(nameBegin, p - nameBegin));
        while (p < tag.size() && is_space(tag[p])) ++p;
        if (p >= tag.size() || tag[p] != '=') continue;   // valueless attribute

        ++p;
        while (p < tag.size() && is_space(tag[p])) ++p;
        std::string value;
        if (p < tag.size() && (tag[p] == '"' || tag[p] == '\'')) {
            size_t close = tag.find(tag[p], p + 1);
            if (close == std::string::npos) close = tag.size();
            value = tag.substr(p + 1, close - p - 1);
            p = close + 1;
        } else {
            size_t valueBegin = p;
            while (p < tag.size() && !is_space(tag[p]) && tag[p] != '>') ++p;
            value = tag.substr(valueBegin, p - valueBegin);
        }
        if (!name.empty()) attrs.emplace(std::move(name), std::move(value));
    }
    return attrs;
}

std::string strip_tags(const std::string& s) {
    std::string out;
    bool inTag = false;
    for (char c : s) {
        if (c == '<') inTag = true;
        else if (c == '>') inTag = false;
        else if (!inTag) out += c;
    }
    return trim(decode_entities(out));
}

bool has_token(const std::string& list, const std::string& token) {
    std::istringstream iss(to_lower(list));
    std::string t;
    while (iss >> t) {
        if (t == token) return true;
    }
    return false;
}

bool usable_href(const std::string& href) {
    std::string h = to_lower(trim(href));
    return !h.empty() && h[0] != '#' && !starts_with(h, "javascript:");
}

} // namespace

HttpContentProvider::HttpContentProvider(ProviderConfig config, const CancellationToken* cancel)
    : config_(std::move(config)),
      cancel_(cancel) {
    if (config_.retry.max_attempts < 1) config_.retry.max_attempts = 1;
    if (!config_.profile_path.empty()) {
        std::ifstream ifs(config_.profile_path);
        if (ifs) {
            std::getline(ifs, cookie_);
            cookie_ = trim(cookie_);
        } else {
            std::cerr << "Profile not readable, continuing without cookies: " << config_.profile_path << std::endl;
        }
    }
}

HttpContentProvider::~HttpContentProvider() = default;

void HttpContentProvider::open_session() {
    session_ = std::make_unique<cpr::Session>();
    cpr::Header hdr{{"User-Agent", config_.user_agent.empty() ? std::string(kDefaultUserAgent) : config_.user_agent}};
    if (!cookie_.empty()) hdr["Cookie"] = cookie_;
    session_->SetHeader(hdr);
    session_->SetTimeout(cpr::Timeout{config_.timeout_ms});
    session_->SetRedirect(cpr::Redirect{true});
}

void HttpContentProvider::close() {
    if (config_.keep_session_open || !session_) return;
    session_.reset();
    std::cout << "Session closed" << std::endl;
}

void HttpContentProvider::wait(std::chrono::milliseconds delay) const {
    if (cancel_) {
        cancel_->wait_for(delay);
    } else if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

std::string HttpContentProvider::fetch_html(const std::string& url) {
    std::string lastError;
    for (int attempt = 1; attempt <= config_.retry.max_attempts; ++attempt) {
        if (attempt > 1) {
            wait(config_.retry.backoff_before(attempt));
            if (cancel_ && cancel_->cancelled()) {
                throw ProviderError("cancelled while retrying " + url + " (" + lastError + ")", true);
            }
        }

        session_->SetUrl(cpr::Url{url});
        cpr::Response r = session_->Get();
        std::cout << "  Status: " << r.status_code << ", bytes: " << r.text.size() << std::endl;

        if (r.error) {
            lastError = "network error: " + r.error.message;
        } else if (r.status_code >= 500 || r.status_code == 429) {
            lastError = "HTTP " + std::to_string(r.status_code);
        } else if (r.status_code != 200) {
            throw ProviderError("HTTP " + std::to_string(r.status_code) + " for " + url, false);
        } else {
            return std::move(r.text);
        }
        std::cerr << "  Page attempt " << attempt << "/" << config_.retry.max_attempts
                  << " failed: " << lastError << std::endl;
    }
    throw ProviderError("gave up on " + url + " after " + std::to_string(config_.retry.max_attempts) +
                        " attempts (" + lastError + ")", true);
}

ChapterContent HttpContentProvider::fetch(const ChapterRef& ref) {
    if (!session_) open_session();

    std::cout << "Visiting: " << ref.url << std::endl;
    std::string html = fetch_html(ref.url);
    // give lazy loaders on the server side the configured grace period
    wait(config_.post_load_wait);

    ChapterContent content = parse_chapter_page(html, ref.url);
    if (content.title.empty() && ref.title) content.title = *ref.title;
    std::cout << "  Images found on page: " << content.image_urls.size()
              << (content.next_url ? ", next: " + *content.next_url : std::string(", no next link")) << std::endl;
    return content;
}

ChapterContent HttpContentProvider::parse_chapter_page(const std::string& html, const std::string& pageUrl) {
    ChapterContent content;
    const std::string lower = to_lower(html);

    auto t0 = lower.find("<title");
    if (t0 != std::string::npos) {
        auto gt = lower.find('>', t0);
        auto t1 = gt == std::string::npos ? std::string::npos : lower.find("</title", gt);
        if (t1 != std::string::npos) content.title = strip_tags(html.substr(gt + 1, t1 - gt - 1));
    }

    // Images in document order; lazy loaders keep the real URL in data-*.
    std::unordered_set<std::string> seen;
    for (const TagSpan& tag : find_tags(lower, {"img"})) {
        auto attrs = tag_attributes(html.substr(tag.begin, tag.end - tag.begin));
        std::string src;
        auto s = attrs.find("src");
        if (s != attrs.end() && !starts_with(to_lower(trim(s->second)), "data:")) src = s->second;
        for (const char* key : {"data-src", "data-lazy-src", "data-original"}) {
            if (!src.empty()) break;
            auto a = attrs.find(key);
            if (a != attrs.end()) src = a->second;
        }
        if (trim(src).empty()) continue;

        std::string url = strip_query(resolve_url(pageUrl, src));
        std::string lu = to_lower(url);
        if (!starts_with(lu, "http://") && !starts_with(lu, "https://")) continue;
        if (!ends_with_any(lu, kImageExtensions) && lu.find("/media/") == std::string::npos) continue;
        if (seen.insert(url).second) content.image_urls.push_back(url);
    }

    // rel="next" wins over a link merely labelled "next".
    std::string relNext;
    std::string textNext;
    for (const TagSpan& tag : find_tags(lower, {"a", "link"})) {
        auto attrs = tag_attributes(html.substr(tag.begin, tag.end - tag.begin));
        auto href = attrs.find("href");
        if (href == attrs.end() || !usable_href(href->second)) continue;

        auto rel = attrs.find("rel");
        if (relNext.empty() && rel != attrs.end() && has_token(rel->second, "next")) {
            relNext = href->second;
            break;
        }
        if (textNext.empty() && tag.name == "a") {
            size_t innerEnd = lower.find("</a", tag.end);
            if (innerEnd == std::string::npos) continue;
            std::string text = to_lower(strip_tags(html.substr(tag.end, innerEnd - tag.end)));
            if (text.find("next") != std::string::npos) textNext = href->second;
        }
    }
    std::string next = relNext.empty() ? textNext : relNext;
    if (!next.empty()) {
        std::string resolved = resolve_url(pageUrl, next);
        if (!resolved.empty()) content.next_url = resolved;
    }

    content.chapter_number = chapter_number_from_text(content.title);
    if (!content.chapter_number) content.chapter_number = chapter_number_from_url(pageUrl);
    return content;
}
