#include "chapter_naming.hpp"

#include "url_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace {

constexpr double kChapterNumberLimit = 1e9;
constexpr size_t kMaxChapterDigits = 9;

// "12", "12.5" or "12_5"; nullopt when the integer part is too long to be
// a chapter number.
std::optional<double> checked_number(const std::string& token) {
    size_t digits = token.find_first_of("._");
    if (digits == std::string::npos) digits = token.size();
    if (digits == 0 || digits > kMaxChapterDigits) return std::nullopt;
    return parse_chapter_token(token);
}

} // namespace

bool plausible_chapter_number(double number) {
    return std::isfinite(number) && number >= 0 && number < kChapterNumberLimit;
}

std::optional<double> chapter_number_from_text(const std::string& text) {
    static const std::regex re(R"(chapter\s+(\d+(?:\.\d+)?))", std::regex::icase);
    std::smatch m;
    if (std::regex_search(text, m, re)) return checked_number(m[1].str());
    return std::nullopt;
}

std::optional<double> chapter_number_from_url(const std::string& url) {
    std::string path = strip_query(url);
    static const std::regex ch_re(R"(-ch-(\d+(?:\.\d+)?))", std::regex::icase);
    static const std::regex chapter_re(R"(chapter[-_](\d+(?:\.\d+)?))", std::regex::icase);
    std::smatch m;
    if (std::regex_search(path, m, ch_re)) return checked_number(m[1].str());
    if (std::regex_search(path, m, chapter_re)) return checked_number(m[1].str());

    // last number in the URL
    auto end = path.find_last_of("0123456789");
    if (end == std::string::npos) return std::nullopt;
    auto begin = end;
    while (begin > 0 && ::isdigit(static_cast<unsigned char>(path[begin - 1]))) --begin;
    return checked_number(path.substr(begin, end - begin + 1));
}

std::string format_chapter_token(double number) {
    if (!plausible_chapter_number(number)) {
        throw std::invalid_argument("chapter number out of range: " + std::to_string(number));
    }
    char buf[64];
    double whole = std::floor(number);
    if (std::fabs(number - whole) < 1e-9) {
        std::snprintf(buf, sizeof(buf), "%03lld", static_cast<long long>(whole));
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.3f", number - whole);
    std::string frac = buf + 2;   // skip "0."
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    if (frac.empty() || buf[0] != '0') return format_chapter_token(std::round(number));
    std::snprintf(buf, sizeof(buf), "%03lld", static_cast<long long>(whole));
    return std::string(buf) + "_" + frac;
}

double parse_chapter_token(const std::string& token) {
    std::string t = token;
    for (char& c : t) {
        if (c == '_') c = '.';
    }
    return std::stod(t);
}

std::string chapter_file_name(double number, const std::string& title) {
    std::string clean = sanitize_filename(title);
    std::string name = "Chapter_" + format_chapter_token(number);
    if (!clean.empty()) name += " - " + clean;
    return name + ".pdf";
}

std::string bundle_file_name(double first, double last, const std::string& title) {
    std::string clean = sanitize_filename(title);
    std::string name = "Chapter_" + format_chapter_token(first) + "-" + format_chapter_token(last);
    if (!clean.empty()) name += " - " + clean;
    return name + ".pdf";
}

std::filesystem::path continuation_path(const std::filesystem::path& base, int part) {
    std::string name = base.stem().string() + " (part " + std::to_string(part) + ")" + base.extension().string();
    return base.parent_path() / name;
}

std::optional<ParsedChapterName> parse_chapter_file_name(const std::string& filename) {
    static const std::regex re(
        R"(Chapter_(\d+(?:[._]\d+)?)(?:-(\d+(?:[._]\d+)?))?(?:\s+-\s+(.*?))?(?:\s*\(part (\d+)\))?\.pdf$)",
        std::regex::icase);
    std::smatch m;
    if (!std::regex_search(filename, m, re)) return std::nullopt;

    auto first = checked_number(m[1].str());
    if (!first) return std::nullopt;

    ParsedChapterName parsed;
    parsed.first = *first;
    parsed.last = parsed.first;
    if (m[2].matched) {
        auto last = checked_number(m[2].str());
        if (!last) return std::nullopt;
        parsed.is_range = true;
        parsed.last = *last;
    }
    if (m[3].matched) parsed.title = trim(m[3].str());
    if (m[4].matched) {
        if (m[4].length() > 6) return std::nullopt;
        parsed.part = std::stoi(m[4].str());
    }
    return parsed;
}
