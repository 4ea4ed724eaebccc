#pragma once

#include "models.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <filesystem>
#include <string>

// Read-only defaults for a run. Nothing in the engine writes these back.
struct Settings {
    std::filesystem::path download_dir = "downloads";
    Pacing pacing;
    std::chrono::milliseconds post_load_wait{4000};
    int timeout_ms = 30000;
    RetryPolicy retry;
    int max_parallel_images = 1;
    std::string profile_path;
    bool keep_session_open = false;
    std::string user_agent;

    int max_page_height = 14400;
    int max_pages_per_file = 500;
    int max_width = 1200;
    bool grayscale = false;

    bool delete_images_after = false;
    bool persist_images = true;
    int max_chapters = 0;

    bool merge_after_download = false;
    int chapters_per_pdf = 0;
    bool move_originals = true;
};

// Missing file -> defaults. Malformed JSON or wrongly typed values throw
// std::runtime_error.
Settings load_settings(const std::filesystem::path& file);

Settings settings_from_json(const std::string& text);

// CHAPTERPDF_* environment variables override what the file says.
void apply_env_overrides(Settings& settings);
