#include "DownloadPipeline.hpp"
#include "../commands/helpers/Config.hpp"
#include "../core/Errors.hpp"
#include "../session/SearchSession.hpp"
#include "../utils/CryptoUtils.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/StringUtils.hpp"
#include "../utils/TarArchive.hpp"
#include "../utils/ZipArchive.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

static const std::set<std::string> EBOOK_EXTENSIONS = {".epub", ".pdf", ".mobi", ".azw3", ".txt"};

bool DownloadPipeline::is_ebook_extension(const std::string& filename) {
    return EBOOK_EXTENSIONS.count(FileUtils::lower_extension(filename)) > 0;
}

std::string DownloadPipeline::candidate_filename(const std::string& request_id) {
    std::string name = StringUtils::trim(request_id);
    if (!name.empty() && name[0] == '!') {
        size_t space = name.find(' ');
        name = space == std::string::npos ? std::string() : StringUtils::trim(name.substr(space + 1));
    }
    return FileUtils::safe_filename(name, "download");
}

bool DownloadPipeline::is_epub_container(const std::string& path) {
    if (!ZipArchive::file_has_signature(path)) {
        return false;
    }
    try {
        ZipArchive archive = ZipArchive::open(path);
        const ZipArchive::Entry* mimetype = archive.find(Config::EPUB_MIMETYPE_MEMBER);
        if (!mimetype) {
            return false;
        }
        return StringUtils::trim(archive.read(*mimetype)) == Config::EPUB_MIMETYPE;
    } catch (const ZipFormatError& e) {
        spdlog::debug("{} is not a readable epub container: {}", path, e.what());
        return false;
    }
}

// Where an archive member lands below job_dir. Absolute names, ".." parts and
// anything resolving outside job_dir raise ExtractionError.
static fs::path member_target(const fs::path& job_dir, const std::string& entry_name) {
    std::string name = entry_name;
    std::replace(name.begin(), name.end(), '\\', '/');

    fs::path relative(name);
    bool escapes = name.empty() || name[0] == '/' || relative.has_root_name() || relative.is_absolute();
    for (const auto& part : relative) {
        if (part.string() == "..") escapes = true;
    }
    fs::path target = (job_dir / relative).lexically_normal();
    if (escapes || !FileUtils::is_within(job_dir, target)) {
        throw ExtractionError("Invalid archive entry: " + entry_name);
    }
    return target;
}

static std::vector<fs::path> extract_zip(const std::string& archive, const fs::path& job_dir) {
    ZipArchive zip = ZipArchive::open(archive);
    fs::create_directories(job_dir);

    std::vector<fs::path> files;
    for (const auto& entry : zip.entries()) {
        fs::path target = member_target(job_dir, entry.name);
        if (entry.is_directory()) {
            fs::create_directories(target);
            continue;
        }
        fs::create_directories(target.parent_path());
        FileUtils::write_file(target.string(), zip.read(entry));
        files.push_back(target);
    }
    return files;
}

static std::vector<fs::path> extract_tar(const std::string& archive, const fs::path& job_dir) {
    TarArchive tar = TarArchive::open(archive);
    fs::create_directories(job_dir);

    std::vector<fs::path> files;
    for (const auto& entry : tar.entries()) {
        fs::path target = member_target(job_dir, entry.name);
        if (entry.is_directory()) {
            fs::create_directories(target);
            continue;
        }
        if (!entry.is_file()) {
            // Links, devices and fifos are never created
            spdlog::warn("Skipping tar entry {} of type '{}'", entry.name, entry.type);
            continue;
        }
        fs::create_directories(target.parent_path());
        FileUtils::write_file(target.string(), tar.read(entry));
        files.push_back(target);
    }
    return files;
}

std::vector<fs::path> DownloadPipeline::safe_extract(const std::string& archive, const fs::path& job_dir) {
    std::vector<fs::path> files;
    if (!ZipArchive::file_has_signature(archive) && TarArchive::file_has_signature(archive)) {
        files = extract_tar(archive, job_dir);
    } else {
        files = extract_zip(archive, job_dir);
    }
    spdlog::info("Extracted {} files from {} into {}", files.size(), archive, job_dir.string());
    return files;
}

std::optional<fs::path> DownloadPipeline::select_file(const std::vector<fs::path>& files) {
    std::vector<fs::path> candidates;
    for (const auto& file : files) {
        if (is_ebook_extension(file.filename().string())) {
            candidates.push_back(file);
        }
    }
    if (!candidates.empty()) {
        return *std::min_element(candidates.begin(), candidates.end());
    }
    if (!files.empty()) {
        return files.front();
    }
    return std::nullopt;
}

static std::string file_into(const fs::path& source, const fs::path& library, const std::string& name) {
    fs::path dest = FileUtils::unique_destination(library, name);
    FileUtils::move_file(source, dest);
    spdlog::info("Filed {} as {}", source.string(), dest.string());
    return dest.string();
}

std::string DownloadPipeline::file_download(const DownloadJob& job, const std::string& artifact,
                                            const Settings& settings) {
    fs::path path(artifact);
    if (!fs::exists(path)) {
        throw ProtocolError("Downloaded file missing: " + artifact);
    }
    if (fs::file_size(path) == 0) {
        fs::remove(path);
        throw ProtocolError("Downloaded file is empty: " + artifact);
    }

    fs::path library = job.target_folder ? fs::path(*job.target_folder) : fs::path(settings.library_dir);
    fs::create_directories(library);
    fs::create_directories(settings.temp_dir);

    std::string candidate = candidate_filename(job.request_id);
    bool direct = is_ebook_extension(candidate);
    if (is_epub_container(artifact)) {
        spdlog::info("{} is an epub container", artifact);
        candidate = fs::path(candidate).stem().string() + ".epub";
        direct = true;
    }

    if (direct) {
        return file_into(path, library, candidate);
    }

    std::string scratch = job.id.empty() ? CryptoUtils::random_hex(Config::JOB_ID_BYTES) : job.id;
    fs::path job_dir = fs::path(settings.temp_dir) / scratch;
    std::vector<fs::path> files;
    try {
        files = safe_extract(artifact, job_dir);
    } catch (const ArchiveFormatError& e) {
        spdlog::info("{} is not an archive ({}), filing as-is", artifact, e.what());
        return file_into(path, library, candidate);
    }

    auto chosen = select_file(files);
    if (!chosen) {
        throw ProtocolError("No files found in archive");
    }
    std::string final_path = file_into(*chosen, library, chosen->filename().string());

    std::error_code ec;
    fs::remove_all(job_dir, ec);
    if (ec) {
        spdlog::warn("Could not remove scratch directory {}: {}", job_dir.string(), ec.message());
    }
    return final_path;
}

std::string DownloadPipeline::run(DownloadJob& job, const Settings& settings) {
    if (job.id.empty()) {
        job.id = CryptoUtils::random_hex(Config::JOB_ID_BYTES);
    }
    fs::create_directories(settings.download_dir);
    fs::create_directories(job.target_folder ? *job.target_folder : settings.library_dir);
    fs::create_directories(settings.temp_dir);

    fs::path dest = fs::path(settings.download_dir) / (job.id + "-" + candidate_filename(job.request_id));
    spdlog::info("Job {}: downloading {} to {}", job.id, job.request_id, dest.string());

    SearchSession session(settings);
    std::string artifact = session.download(job.request_id, job.bot, dest.string());

    job.result_path = file_download(job, artifact, settings);
    spdlog::info("Job {}: finished at {}", job.id, *job.result_path);
    return *job.result_path;
}
