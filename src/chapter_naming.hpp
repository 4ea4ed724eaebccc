#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Chapter numbers and the file names that carry them. The merger recovers
// reading order from these names alone, so both sides share this code.

// Finite, non-negative and at most nine integer digits. Longer numbers are
// ids rather than chapter numbers.
bool plausible_chapter_number(double number);

// Both return nullopt rather than an implausible number.
std::optional<double> chapter_number_from_text(const std::string& text);
std::optional<double> chapter_number_from_url(const std::string& url);

// 12 -> "012", 12.5 -> "012_5". Throws std::invalid_argument for an
// implausible number.
std::string format_chapter_token(double number);
double parse_chapter_token(const std::string& token);

// "Chapter_012 - Title.pdf", or "Chapter_012.pdf" without a title
std::string chapter_file_name(double number, const std::string& title);
std::string bundle_file_name(double first, double last, const std::string& title);

// "Chapter_012 - Title.pdf" -> "Chapter_012 - Title (part 2).pdf"
std::filesystem::path continuation_path(const std::filesystem::path& base, int part);

struct ParsedChapterName {
    double first = 0;
    double last = 0;
    bool is_range = false;
    int part = 1;
    std::string title;
};

// nullopt unless the name matches and its numbers are plausible.
std::optional<ParsedChapterName> parse_chapter_file_name(const std::string& filename);
