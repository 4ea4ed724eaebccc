#include "url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

bool ends_with_any(const std::string& s, const std::vector<std::string>& suffixes) {
    for (const auto& suf : suffixes) {
        if (ends_with(s, to_lower(suf))) return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):\/\/([^\/?#]+)([^#]*)?)");
    std::smatch m;
    if (std::regex_search(url, m, re)) {
        UrlParts p;
        p.scheme = m[1].str();
        p.host = m[2].str();
        p.path = m.size() >= 4 ? m[3].str() : "/";
        if (p.path.empty()) p.path = "/";
        return p;
    }
    return std::nullopt;
}

bool is_absolute_url(const std::string& url) {
    return url.find("://") != std::string::npos;
}

std::string dirname_path(const std::string& path) {
    auto q = path.find('?');
    std::string p = q == std::string::npos ? path : path.substr(0, q);
    auto pos = p.rfind('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return p.substr(0, pos);
}

std::string join_url(const UrlParts& base, const std::string& link) {
    if (link.empty()) return base.scheme + "://" + base.host + base.path;
    // protocol-relative
    if (link.size() > 1 && link[0] == '/' && link[1] == '/') return base.scheme + ":" + link;
    if (link[0] == '/') return base.scheme + "://" + base.host + link;
    if (link[0] == '?') {
        auto q = base.path.find('?');
        return base.scheme + "://" + base.host + base.path.substr(0, q) + link;
    }
    // simple relative join
    std::string dir = dirname_path(base.path);
    if (!ends_with(dir, "/")) dir += "/";
    return base.scheme + "://" + base.host + dir + link;
}

std::string normalize_url(const std::string& url) {
    auto hash = url.find('#');
    std::string u = hash == std::string::npos ? url : url.substr(0, hash);
    if (u.size() > 1 && ends_with(u, "/")) u.pop_back();
    return u;
}

std::string resolve_url(const std::string& page_url, const std::string& link) {
    std::string l = trim(decode_entities(link));
    if (l.empty()) return {};
    if (is_absolute_url(l)) return l;
    auto base = parse_url(page_url);
    if (!base) return {};
    return join_url(*base, l);
}

std::string strip_query(const std::string& url) {
    auto q = url.find('?');
    return trim(q == std::string::npos ? url : url.substr(0, q));
}

std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
        {"&lt;", "<"}, {"&gt;", ">"}, {"&nbsp;", " "},
    };
    std::string r;
    r.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool replaced = false;
        if (s[i] == '&') {
            for (const auto& e : entities) {
                std::string key = e.first;
                if (s.compare(i, key.size(), key) == 0) {
                    r += e.second;
                    i += key.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) r += s[i++];
    }
    return r;
}

std::string sanitize_filename(const std::string& name) {
    std::string s = trim(name);
    for (char& c : s) {
        if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') c = '_';
        else if (static_cast<unsigned char>(c) < 0x20) c = ' ';
    }
    while (!s.empty() && (s.back() == '.' || s.back() == ' ')) s.pop_back();
    return s;
}
