#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace code_facts {

namespace fs = std::filesystem;

// File-listing + content-read capability for one revision of the tree.
class SourceTree {
public:
    virtual ~SourceTree() = default;

    // Sorted repository-relative paths with '/' separators
    virtual std::vector<std::string> list_files() const = 0;

    // nullopt when the listed file cannot be read
    virtual std::optional<std::string> read(const std::string& relative_path) const = 0;
};

struct FilterConfig {
    std::unordered_set<std::string> allowed_extensions;  // dot-free, lowercase; empty = all
    std::vector<std::string> blacklist;                  // ignored_paths
    std::vector<std::string> whitelist;                  // included_paths, re-enter ignored dirs

    static FilterConfig from_lists(const std::vector<std::string>& allowed_extensions,
                                   const std::vector<std::string>& ignored_paths,
                                   const std::vector<std::string>& included_paths);
};

// A checked-out directory. Hidden entries and symlinks are never listed.
class FilesystemTree : public SourceTree {
public:
    FilesystemTree(fs::path root, FilterConfig filter);

    // The manifest replaces the directory scan (paths the revision references)
    FilesystemTree(fs::path root, FilterConfig filter, std::vector<std::string> manifest);

    std::vector<std::string> list_files() const override;
    std::optional<std::string> read(const std::string& relative_path) const override;

    const fs::path& root() const { return root_; }

    static std::vector<std::string> load_manifest(const fs::path& manifest_file);

private:
    struct Verdict {
        bool ignored = false;   // under an ignored_paths prefix
        bool included = false;  // under an included_paths prefix
        bool bridge = false;    // an ancestor of an included path
    };
    Verdict classify(const fs::path& rel) const;

    void scan_directory(const fs::path& current_dir, std::vector<std::string>& results) const;
    bool extension_allowed(const fs::path& path) const;

    fs::path root_;
    FilterConfig filter_;
    std::optional<std::vector<std::string>> manifest_;
};

class MemoryTree : public SourceTree {
public:
    void add(const std::string& path, std::string content);
    void add_unreadable(const std::string& path);

    std::vector<std::string> list_files() const override;
    std::optional<std::string> read(const std::string& relative_path) const override;

private:
    std::map<std::string, std::optional<std::string>> files_;
};

// Child inside parent (or equal), after lexical normalisation
bool is_inside(const fs::path& child, const fs::path& parent);

} // namespace code_facts
