#pragma once

#include <optional>
#include <string>
#include <vector>

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
};

std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);
bool ends_with_any(const std::string& s, const std::vector<std::string>& suffixes);
std::string trim(const std::string& s);

std::optional<UrlParts> parse_url(const std::string& url);
bool is_absolute_url(const std::string& url);
std::string join_url(const UrlParts& base, const std::string& link);
std::string dirname_path(const std::string& path);

// Drops the fragment and a trailing slash so equal pages compare equal.
std::string normalize_url(const std::string& url);

// Resolves `link` against `page_url`; returns empty when it can't.
std::string resolve_url(const std::string& page_url, const std::string& link);

// Removes the query string.
std::string strip_query(const std::string& url);

std::string decode_entities(const std::string& s);
std::string sanitize_filename(const std::string& name);
