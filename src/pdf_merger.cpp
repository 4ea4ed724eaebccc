#include "pdf_merger.hpp"

#include "chapter_naming.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "url_utils.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <set>

namespace fs = std::filesystem;

PdfMerger::PdfMerger(MergeOptions options)
    : options_(std::move(options)) {}

MergeReport PdfMerger::merge(const fs::path& dir) const {
    if (!fs::is_directory(dir)) throw MergeError("folder not found: " + dir.string());

    MergeReport report;

    std::optional<std::set<std::string>> allowed;
    if (options_.only_session_manifest) {
        std::vector<fs::path> listed;
        try {
            listed = SessionManifest::read_pdf_files(SessionManifest::path_for(dir));
        } catch (const std::runtime_error& e) {
            report.warnings.push_back(std::string("no session manifest: ") + e.what());
            std::cout << "  " << report.warnings.back() << std::endl;
            return report;
        }
        allowed.emplace();
        for (const auto& p : listed) allowed->insert(p.filename().string());
        if (allowed->empty()) {
            report.warnings.push_back("session manifest lists no PDFs");
            std::cout << "  " << report.warnings.back() << std::endl;
            return report;
        }
    }

    // Directory order is unspecified; work from a sorted listing.
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (to_lower(entry.path().extension().string()) != ".pdf") continue;
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    std::map<std::string, std::vector<Candidate>> groups;
    for (const auto& path : entries) {
        const std::string name = path.filename().string();
        if (allowed && !allowed->count(name)) continue;

        auto parsed = parse_chapter_file_name(name);
        if (!parsed || (parsed->is_range && options_.ignore_merged)) {
            std::cout << "  Skipped: " << name << std::endl;
            report.skipped.push_back(path);
            continue;
        }
        Candidate c{path, parsed->first, parsed->part, parsed->title};
        groups[options_.group_by_title ? parsed->title : std::string()].push_back(std::move(c));
    }

    size_t candidates = 0;
    for (const auto& g : groups) candidates += g.second.size();
    std::cout << "Merging " << candidates << " chapter PDFs in " << groups.size()
              << " group(s): " << dir.string() << std::endl;

    for (auto& entry : groups) {
        const std::string& group = entry.first;
        std::vector<Candidate>& members = entry.second;
        std::sort(members.begin(), members.end(), [](const Candidate& a, const Candidate& b) {
            if (a.number != b.number) return a.number < b.number;
            if (a.part != b.part) return a.part < b.part;
            return a.path.filename().string() < b.path.filename().string();
        });

        for (size_t i = 1; i < members.size(); ++i) {
            if (members[i].number == members[i - 1].number && members[i].part == members[i - 1].part) {
                report.warnings.push_back("duplicate chapter " + format_chapter_token(members[i].number) + ": " +
                                          members[i - 1].path.filename().string() + " before " +
                                          members[i].path.filename().string());
                std::cout << "  Warning: " << report.warnings.back() << std::endl;
            }
        }

        // Chunk by distinct chapter numbers so parts of one chapter stay together.
        std::vector<Candidate> chunk;
        int chaptersInChunk = 0;
        auto close_chunk = [&]() {
            if (chunk.empty()) return;
            if (chaptersInChunk < 2) {
                for (const auto& c : chunk) {
                    std::cout << "  Left as is: " << c.path.filename().string() << std::endl;
                    report.skipped.push_back(c.path);
                }
            } else {
                write_bundle(chunk, group, dir, report);
            }
            chunk.clear();
            chaptersInChunk = 0;
        };

        for (const auto& c : members) {
            bool newChapter = chunk.empty() || chunk.back().number != c.number;
            if (newChapter && options_.chapters_per_bundle > 0 && chaptersInChunk == options_.chapters_per_bundle) {
                close_chunk();
            }
            if (newChapter) ++chaptersInChunk;
            chunk.push_back(c);
        }
        close_chunk();
    }

    std::cout << "Merge done: " << report.bundles.size() << " bundle(s), " << report.failures.size()
              << " failure(s)" << std::endl;
    return report;
}

void PdfMerger::write_bundle(const std::vector<Candidate>& members,
                             const std::string& group,
                             const fs::path& dir,
                             MergeReport& report) const {
    const std::string title = group.empty() ? members.front().title : group;
    const fs::path outDir = options_.output_dir.value_or(dir);
    const fs::path outPath = outDir / bundle_file_name(members.front().number, members.back().number, title);
    fs::path tmp = outPath;
    tmp += ".part";

    std::cout << "  Bundling " << members.size() << " file(s) -> " << outPath.filename().string() << std::endl;
    try {
        QPDF out;
        out.emptyPDF();
        QPDFPageDocumentHelper outDoc(out);

        // Sources must outlive the write; their pages are copied lazily.
        std::vector<std::unique_ptr<QPDF>> sources;
        size_t pages = 0;
        for (const auto& m : members) {
            auto src = std::make_unique<QPDF>();
            src->processFile(m.path.string().c_str());
            for (auto& page : QPDFPageDocumentHelper(*src).getAllPages()) {
                outDoc.addPage(page, false);
                ++pages;
            }
            sources.push_back(std::move(src));
        }
        if (pages == 0) throw MergeError("group has no pages to merge");

        fs::create_directories(outDir);
        QPDFWriter writer(out, tmp.string().c_str());
        writer.write();
        fs::rename(tmp, outPath);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        report.failures.push_back(MergeFailure{group, e.what()});
        std::cerr << "  Merge failed for " << outPath.filename().string() << ": " << e.what() << std::endl;
        return;
    }

    MergedBundle bundle;
    bundle.output_path = outPath;
    for (const auto& m : members) bundle.member_files.push_back(m.path);

    if (options_.move_originals) {
        fs::path originals = dir / "_originals";
        std::error_code ec;
        fs::create_directories(originals, ec);
        for (const auto& m : members) {
            fs::rename(m.path, originals / m.path.filename(), ec);
            if (ec) std::cerr << "  Could not move " << m.path.string() << ": " << ec.message() << std::endl;
        }
    }
    report.bundles.push_back(std::move(bundle));
}
