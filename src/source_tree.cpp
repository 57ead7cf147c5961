#include "source_tree.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_facts {

namespace {

std::string lowercase_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool is_hidden(const fs::path& rel) {
    for (const auto& part : rel) {
        std::string s = part.string();
        if (s.size() > 1 && s[0] == '.' && s != "..") return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

bool is_inside(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;

    const fs::path c = child.lexically_normal();
    auto it_c = c.begin();
    for (const auto& segment : parent.lexically_normal()) {
        const std::string s = segment.string();
        // "a/b/" normalises with a trailing empty segment
        if (s.empty() || s == ".") continue;
        if (it_c == c.end() || it_c->string() != s) return false;
        ++it_c;
    }
    return true;
}

FilterConfig FilterConfig::from_lists(const std::vector<std::string>& allowed_extensions,
                                      const std::vector<std::string>& ignored_paths,
                                      const std::vector<std::string>& included_paths) {
    FilterConfig cfg;
    // Extensions: always dot-free and lowercase
    for (std::string ext : allowed_extensions) {
        if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) { return std::tolower(ch); });
        if (!ext.empty()) cfg.allowed_extensions.insert(ext);
    }
    for (const auto& p : ignored_paths) {
        if (!p.empty()) cfg.blacklist.push_back(fs::path(p).lexically_normal().generic_string());
    }
    for (const auto& p : included_paths) {
        if (!p.empty()) cfg.whitelist.push_back(fs::path(p).lexically_normal().generic_string());
    }
    return cfg;
}

FilesystemTree::FilesystemTree(fs::path root, FilterConfig filter)
    : root_(std::move(root)), filter_(std::move(filter)) {}

FilesystemTree::FilesystemTree(fs::path root, FilterConfig filter, std::vector<std::string> manifest)
    : root_(std::move(root)), filter_(std::move(filter)), manifest_(std::move(manifest)) {}

bool FilesystemTree::extension_allowed(const fs::path& path) const {
    return filter_.allowed_extensions.empty() || filter_.allowed_extensions.count(lowercase_extension(path));
}

FilesystemTree::Verdict FilesystemTree::classify(const fs::path& rel) const {
    Verdict v;
    v.ignored = std::any_of(filter_.blacklist.begin(), filter_.blacklist.end(),
                            [&](const std::string& ign) { return is_inside(rel, fs::path(ign)); });
    for (const auto& inc : filter_.whitelist) {
        const fs::path inc_path(inc);
        if (is_inside(rel, inc_path)) {
            v.included = true;
            break;
        }
        // An ignored directory still has to be walked to reach an included path below it
        if (is_inside(inc_path, rel)) v.bridge = true;
    }
    return v;
}

void FilesystemTree::scan_directory(const fs::path& current_dir, std::vector<std::string>& results) const {
    try {
        for (const auto& entry : fs::directory_iterator(current_dir)) {
            if (entry.is_symlink()) continue;
            const fs::path& path = entry.path();
            const std::string name = path.filename().string();
            if (!name.empty() && name[0] == '.') continue;

            const fs::path rel = fs::relative(path, root_);
            const std::string rel_str = rel.generic_string();
            const Verdict v = classify(rel);

            if (entry.is_directory()) {
                const bool enter = !v.ignored || v.bridge || v.included;
                spdlog::debug("DIR  | {} | Ignored: {} | Bridge: {} | Action: {}",
                    rel_str, v.ignored ? "YES" : "NO ", v.bridge ? "YES" : "NO ", enter ? "ENTER" : "SKIP");
                if (enter) scan_directory(path, results);
                continue;
            }
            if (!entry.is_regular_file()) continue;

            const bool ext_match = extension_allowed(path);
            if ((!v.ignored || v.included) && ext_match) {
                results.push_back(rel_str);
            } else {
                spdlog::debug("FILE | {} | Action: SKIP (Ignored: {}, ExtMatch: {})",
                    rel_str, v.ignored ? "YES" : "NO ", ext_match ? "YES" : "NO ");
            }
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ Scan of {} failed: {}", current_dir.string(), e.what());
    }
}

std::vector<std::string> FilesystemTree::list_files() const {
    std::vector<std::string> files;
    if (manifest_) {
        for (const auto& entry : *manifest_) {
            fs::path rel(entry);
            if (is_hidden(rel) || !extension_allowed(rel)) continue;
            const Verdict v = classify(rel);
            if (v.ignored && !v.included) continue;
            files.push_back(rel.lexically_normal().generic_string());
        }
    } else if (fs::is_directory(root_)) {
        scan_directory(root_, files);
    } else {
        spdlog::warn("⚠️ Source root {} is not a directory", root_.string());
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

std::optional<std::string> FilesystemTree::read(const std::string& relative_path) const {
    std::ifstream file(root_ / fs::path(relative_path), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) return std::nullopt;
    return content;
}

std::vector<std::string> FilesystemTree::load_manifest(const fs::path& manifest_file) {
    std::ifstream f(manifest_file);
    if (!f.is_open()) throw std::runtime_error("cannot open manifest " + manifest_file.string());

    std::vector<std::string> entries;
    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::replace(line.begin(), line.end(), '\\', '/');
        entries.push_back(line);
    }
    return entries;
}

void MemoryTree::add(const std::string& path, std::string content) {
    files_[path] = std::move(content);
}

void MemoryTree::add_unreadable(const std::string& path) {
    files_[path] = std::nullopt;
}

std::vector<std::string> MemoryTree::list_files() const {
    std::vector<std::string> out;
    out.reserve(files_.size());
    for (const auto& [path, content] : files_) out.push_back(path);
    return out;
}

std::optional<std::string> MemoryTree::read(const std::string& relative_path) const {
    auto it = files_.find(relative_path);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace code_facts
