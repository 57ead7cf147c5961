#pragma once
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>

namespace code_facts {
namespace fs = std::filesystem;

class OutputWriteError : public std::runtime_error {
public:
    OutputWriteError(const std::string& path, const std::string& reason)
        : std::runtime_error("cannot write " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Writes a group of files all-or-nothing: every target is staged to "<path>.tmp",
// then commit() renames them into place. If any rename fails the targets that
// were already replaced get their previous contents back from the journal.
class AtomicJournal {
public:
    AtomicJournal() = default;
    AtomicJournal(const AtomicJournal&) = delete;
    AtomicJournal& operator=(const AtomicJournal&) = delete;

    ~AtomicJournal() {
        if (!finished_) discard_staged();
    }

    void stage(const std::string& target, const std::string& content) {
        Entry entry;
        entry.target = fs::path(target);
        entry.temp = fs::path(target + ".tmp");
        entry.journal = fs::path(target + ".facts_journal");

        std::error_code ec;
        if (entry.target.has_parent_path()) {
            fs::create_directories(entry.target.parent_path(), ec);
            if (ec) throw OutputWriteError(target, ec.message());
        }

        {
            std::ofstream out(entry.temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) throw OutputWriteError(target, "cannot open " + entry.temp.string());
            out << content;
            out.flush();
            if (!out.good()) {
                out.close();
                fs::remove(entry.temp, ec);
                throw OutputWriteError(target, "short write to " + entry.temp.string());
            }
        }
        entries_.push_back(std::move(entry));
    }

    void commit() {
        for (size_t i = 0; i < entries_.size(); ++i) {
            Entry& entry = entries_[i];
            std::error_code ec;

            if (fs::exists(entry.target, ec)) {
                fs::copy_file(entry.target, entry.journal, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    restore(i);
                    throw OutputWriteError(entry.target.string(), "cannot journal previous contents: " + ec.message());
                }
                entry.had_original = true;
            }

            fs::rename(entry.temp, entry.target, ec);
            if (ec) {
                restore(i);
                throw OutputWriteError(entry.target.string(), ec.message());
            }
            entry.placed = true;
        }

        std::error_code ec;
        for (const auto& entry : entries_) fs::remove(entry.journal, ec);
        finished_ = true;
        spdlog::debug("Committed {} output documents", entries_.size());
    }

private:
    struct Entry {
        fs::path target;
        fs::path temp;
        fs::path journal;
        bool had_original = false;
        bool placed = false;
    };

    // Undo entries [0, failed] and drop every temporary
    void restore(size_t failed) {
        std::error_code ec;
        for (size_t i = 0; i <= failed && i < entries_.size(); ++i) {
            Entry& entry = entries_[i];
            if (entry.placed) {
                if (entry.had_original) {
                    fs::copy_file(entry.journal, entry.target, fs::copy_options::overwrite_existing, ec);
                } else {
                    fs::remove(entry.target, ec);
                }
                if (ec) spdlog::error("❌ Rollback of {} failed: {}", entry.target.string(), ec.message());
            }
            fs::remove(entry.journal, ec);
        }
        discard_staged();
        finished_ = true;
    }

    void discard_staged() {
        std::error_code ec;
        for (const auto& entry : entries_) fs::remove(entry.temp, ec);
    }

    std::vector<Entry> entries_;
    bool finished_ = false;
};

}
