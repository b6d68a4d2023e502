#pragma once
#include "../core/Settings.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct DownloadJob {
    std::string id;
    std::string request_id;
    std::optional<std::string> bot;
    std::optional<std::string> target_folder;
    std::optional<std::string> result_path;
    std::optional<std::string> error;
};

// Turns a downloaded artifact into a filed library item.
class DownloadPipeline {
public:
    // Downloads job.request_id through a one-shot session into download_dir,
    // then files it. Sets job.result_path and returns it.
    static std::string run(DownloadJob& job, const Settings& settings);

    // Classifies artifact (direct ebook, epub container or archive) and moves
    // the chosen file into the library. Returns the final path.
    static std::string file_download(const DownloadJob& job, const std::string& artifact,
                                     const Settings& settings);

    // Request id without a leading "!botname " trigger, as a safe file name.
    static std::string candidate_filename(const std::string& request_id);
    static bool is_ebook_extension(const std::string& filename);
    // ZIP whose "mimetype" member reads application/epub+zip.
    static bool is_epub_container(const std::string& path);

    // Extracts every member of a ZIP or (gzipped) tar archive below job_dir.
    // Entries that are absolute or use ".." raise ExtractionError; unreadable
    // archives raise ArchiveFormatError. Tar links are skipped.
    static std::vector<std::filesystem::path> safe_extract(const std::string& archive,
                                                           const std::filesystem::path& job_dir);
    // First ebook by path order, else the first file; nullopt when empty.
    static std::optional<std::filesystem::path> select_file(const std::vector<std::filesystem::path>& files);
};
