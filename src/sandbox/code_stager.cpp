#include "sandbox/code_stager.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <fstream>
#include <set>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

struct ArchiveWriterDeleter {
    void operator()(struct archive* writer) const { archive_write_free(writer); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const { archive_entry_free(entry); }
};

la_ssize_t AppendToString(struct archive*, void* client_data, const void* buffer, size_t length) {
    auto* out = static_cast<std::string*>(client_data);
    out->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

}  // namespace

StagingArea::StagingArea(std::filesystem::path path)
    : path_(std::move(path)) {}

StagingArea::~StagingArea() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "stager",
                   "failed to remove " + path_.string() + ": " + ec.message());
    }
}

CodeStager::CodeStager(runtime::RuntimeClient& runtime,
                       std::string work_dir,
                       std::filesystem::path staging_root)
    : runtime_(runtime)
    , work_dir_(std::move(work_dir))
    , staging_root_(std::move(staging_root)) {}

std::optional<std::string> CodeStager::SanitizeName(const std::string& name) {
    if (name.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    const auto separator = name.find_last_of("/\\");
    auto base = separator == std::string::npos ? name : name.substr(separator + 1);
    if (base.empty() || base == "." || base == "..") {
        return std::nullopt;
    }
    return base;
}

std::vector<std::pair<std::string, const SourceFile*>> CodeStager::ResolveNames(
    const std::vector<SourceFile>& files) const {
    std::vector<std::pair<std::string, const SourceFile*>> resolved;
    std::set<std::string> seen;
    for (const auto& file : files) {
        const auto name = SanitizeName(file.name);
        if (!name) {
            throw StagingError("invalid file name: " + file.name);
        }
        if (!seen.insert(*name).second) {
            throw StagingError("duplicate file name: " + *name);
        }
        resolved.emplace_back(*name, &file);
    }
    return resolved;
}

CodeBundle CodeStager::Stage(const std::vector<SourceFile>& files) const {
    CodeBundle bundle{};
    const auto resolved = ResolveNames(files);

    std::unique_ptr<struct archive, ArchiveWriterDeleter> writer(archive_write_new());
    if (!writer) {
        throw StagingError("archive_write_new() failed");
    }
    if (archive_write_set_format_pax_restricted(writer.get()) != ARCHIVE_OK ||
        archive_write_open(writer.get(), &bundle.archive, nullptr, AppendToString, nullptr) != ARCHIVE_OK) {
        throw StagingError(std::string("archive open failed: ") + archive_error_string(writer.get()));
    }

    const auto now = std::time(nullptr);
    for (const auto& [name, file] : resolved) {
        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(file->content.size()));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(), now, 0);
        if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
            throw StagingError("archive_write_header() - " + name + ": " + archive_error_string(writer.get()));
        }
        if (!file->content.empty() &&
            archive_write_data(writer.get(), file->content.data(), file->content.size()) < 0) {
            throw StagingError("archive_write_data() - " + name + ": " + archive_error_string(writer.get()));
        }
        bundle.names.push_back(name);
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw StagingError(std::string("archive_write_close() - ") + archive_error_string(writer.get()));
    }
    return bundle;
}

std::optional<Error> CodeStager::Inject(const CodeBundle& bundle, const runtime::SandboxHandle& sandbox) {
    try {
        runtime_.InjectArchive(sandbox, work_dir_, bundle.archive);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kError, "stager",
                   "inject into " + sandbox.id + " failed: " + ex.what());
        return Error{ErrorKind::kStaging, ex.what()};
    }
    return std::nullopt;
}

std::shared_ptr<StagingArea> CodeStager::Materialize(const std::vector<SourceFile>& files) const {
    const auto resolved = ResolveNames(files);
    auto area = std::make_shared<StagingArea>(staging_root_ / ("runbox-" + utils::GenerateUuid()));

    std::error_code ec;
    std::filesystem::create_directories(area->Path(), ec);
    if (ec) {
        throw StagingError("failed to create " + area->Path().string() + ": " + ec.message());
    }
    for (const auto& [name, file] : resolved) {
        std::ofstream output(area->Path() / name, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw StagingError("failed to open " + (area->Path() / name).string());
        }
        output.write(file->content.data(), static_cast<std::streamsize>(file->content.size()));
        if (!output) {
            throw StagingError("failed to write " + (area->Path() / name).string());
        }
    }
    return area;
}

}  // namespace runbox::sandbox
