#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct MergeOptions {
    int chapters_per_bundle = 0;        // 0 = one bundle per group
    bool group_by_title = true;
    bool ignore_merged = true;          // skip earlier "Chapter_001-005" bundles
    bool move_originals = false;        // into <dir>/_originals after writing
    bool only_session_manifest = false; // only files listed in manifest.json
    std::optional<std::filesystem::path> output_dir;
};

struct MergedBundle {
    std::filesystem::path output_path;
    std::vector<std::filesystem::path> member_files;
};

struct MergeFailure {
    std::string group;
    std::string message;
};

struct MergeReport {
    std::vector<MergedBundle> bundles;
    std::vector<std::filesystem::path> skipped;
    std::vector<std::string> warnings;
    std::vector<MergeFailure> failures;
};

// Concatenates chapter PDFs of a folder into bundles ordered by the chapter
// number in their file names. A failing bundle never stops the others.
class PdfMerger {
public:
    explicit PdfMerger(MergeOptions options = {});

    MergeReport merge(const std::filesystem::path& dir) const;

private:
    struct Candidate {
        std::filesystem::path path;
        double number = 0;
        int part = 1;
        std::string title;
    };

    void write_bundle(const std::vector<Candidate>& members, const std::string& group, const std::filesystem::path& dir, MergeReport& report) const;

    MergeOptions options_;
};
