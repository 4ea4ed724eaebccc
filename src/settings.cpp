#include "settings.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds ms(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<long long>(fallback.count())));
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

// Environment values are given in seconds.
std::chrono::milliseconds seconds_env(const char* value, std::chrono::milliseconds fallback) {
    try {
        return std::chrono::milliseconds(static_cast<long long>(std::stod(value) * 1000.0));
    } catch (const std::exception&) {
        return fallback;
    }
}

} // namespace

Settings settings_from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("malformed settings: ") + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("settings must be a JSON object");

    Settings s;
    try {
        s.download_dir = j.value("download_dir", s.download_dir.string());
        s.pacing.inter_image_delay = ms(j, "inter_image_delay_ms", s.pacing.inter_image_delay);
        s.pacing.inter_chapter_delay = ms(j, "inter_chapter_delay_ms", s.pacing.inter_chapter_delay);
        s.post_load_wait = ms(j, "post_load_wait_ms", s.post_load_wait);
        s.timeout_ms = j.value("timeout_ms", s.timeout_ms);
        s.retry.max_attempts = std::max(1, j.value("max_retries", s.retry.max_attempts));
        s.retry.base_delay = ms(j, "retry_base_delay_ms", s.retry.base_delay);
        s.retry.max_delay = ms(j, "retry_max_delay_ms", s.retry.max_delay);
        s.max_parallel_images = std::clamp(j.value("max_parallel_images", s.max_parallel_images), 1, 4);
        s.profile_path = j.value("profile_path", s.profile_path);
        s.keep_session_open = j.value("keep_session_open", s.keep_session_open);
        s.user_agent = j.value("user_agent", s.user_agent);

        s.max_page_height = j.value("max_page_height", s.max_page_height);
        s.max_pages_per_file = j.value("max_pages_per_file", s.max_pages_per_file);
        s.max_width = j.value("max_width", s.max_width);
        s.grayscale = j.value("grayscale", s.grayscale);

        s.delete_images_after = j.value("delete_images_after", s.delete_images_after);
        s.persist_images = j.value("persist_images", s.persist_images);
        s.max_chapters = j.value("max_chapters", s.max_chapters);

        s.merge_after_download = j.value("merge_after_download", s.merge_after_download);
        s.chapters_per_pdf = j.value("chapters_per_pdf", s.chapters_per_pdf);
        s.move_originals = j.value("move_originals", s.move_originals);
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("bad settings value: ") + e.what());
    }

    if (s.max_page_height <= 0) throw std::runtime_error("max_page_height must be positive");
    if (s.max_pages_per_file <= 0) throw std::runtime_error("max_pages_per_file must be positive");
    return s;
}

Settings load_settings(const fs::path& file) {
    std::ifstream ifs(file);
    if (!ifs) return Settings{};
    std::stringstream buf;
    buf << ifs.rdbuf();
    return settings_from_json(buf.str());
}

void apply_env_overrides(Settings& s) {
    if (const char* v = env("CHAPTERPDF_WAIT_AFTER_LOAD")) s.post_load_wait = seconds_env(v, s.post_load_wait);
    if (const char* v = env("CHAPTERPDF_DOWNLOAD_DELAY")) s.pacing.inter_image_delay = seconds_env(v, s.pacing.inter_image_delay);
    if (const char* v = env("CHAPTERPDF_CHAPTER_DELAY")) s.pacing.inter_chapter_delay = seconds_env(v, s.pacing.inter_chapter_delay);
    if (const char* v = env("CHAPTERPDF_MAX_CHAPTERS")) s.max_chapters = std::max(0, std::atoi(v));
    if (const char* v = env("CHAPTERPDF_PROFILE")) s.profile_path = v;
    if (const char* v = env("CHAPTERPDF_KEEP_SESSION_OPEN")) s.keep_session_open = std::string(v) == "1";
}
