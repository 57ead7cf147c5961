#pragma once
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "fact.hpp"

namespace code_facts {

// Two facts in one snapshot share an identity. Always an identity-scheme defect.
class IdentityCollisionError : public std::runtime_error {
public:
    IdentityCollisionError(const std::string& identity, const std::string& first_path, const std::string& second_path);

    const std::string& identity() const { return identity_; }
    const std::string& first_path() const { return first_path_; }
    const std::string& second_path() const { return second_path_; }

private:
    std::string identity_;
    std::string first_path_;
    std::string second_path_;
};

enum class FileStatus {
    Parsed,
    Failed,   // parse failure or unreadable content
    Skipped   // no grammar for this file
};

// One file's contribution to a snapshot
struct FileFacts {
    std::string path;
    FileStatus status = FileStatus::Parsed;
    std::string language;
    std::string failure;
    std::vector<Fact> facts;
};

struct Snapshot {
    std::string revision;
    std::string generated_at;
    std::set<std::string> files_scanned;
    std::set<std::string> files_failed;
    std::set<std::string> files_skipped;
    std::map<std::string, Fact> facts;  // by identity

    const Fact* find(const std::string& identity) const;
};

class FactStore {
public:
    static Snapshot build(std::string revision, std::string generated_at, std::vector<FileFacts> files);

    // Plain (path, facts) pairs, every file counted as parsed
    static Snapshot build(std::string revision, std::string generated_at,
                          std::vector<std::pair<std::string, std::vector<Fact>>> files);
};

} // namespace code_facts
