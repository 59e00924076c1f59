#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "runtime/runtime_client.hpp"
#include "utils/errors.hpp"

namespace runbox::sandbox {

class StagingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SourceFile {
    std::string name;
    std::string content;
};

// Tar archive of submitted files, each stored under its base name.
struct CodeBundle {
    std::string archive;
    std::vector<std::string> names;
};

// Host directory holding a copy of the submitted files; removed on destruction.
class StagingArea {
public:
    explicit StagingArea(std::filesystem::path path);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

class CodeStager {
public:
    CodeStager(runtime::RuntimeClient& runtime,
               std::string work_dir,
               std::filesystem::path staging_root);

    // Reduces name to its last path component. Returns nullopt when nothing
    // usable remains ("", ".", "..", embedded NUL).
    static std::optional<std::string> SanitizeName(const std::string& name);

    CodeBundle Stage(const std::vector<SourceFile>& files) const;
    std::optional<Error> Inject(const CodeBundle& bundle, const runtime::SandboxHandle& sandbox);
    std::shared_ptr<StagingArea> Materialize(const std::vector<SourceFile>& files) const;

    const std::string& WorkDir() const { return work_dir_; }

private:
    std::vector<std::pair<std::string, const SourceFile*>> ResolveNames(
        const std::vector<SourceFile>& files) const;

    runtime::RuntimeClient& runtime_;
    std::string work_dir_;
    std::filesystem::path staging_root_;
};

}  // namespace runbox::sandbox
