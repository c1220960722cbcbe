#pragma once

/**
 * @file change_classifier.hpp
 * @brief Turns (raw event, known set, current set) into semantic plan changes
 *
 * The raw event is only trusted to say that something happened. What changed
 * is derived by diffing the previous known set against a fresh scan:
 *
 *   added   = current - known
 *   removed = known - current
 *
 * A rename policy may coalesce one added/removed pair into a single rename.
 * The default policy treats exactly one add plus exactly one remove as a
 * rename. That is a best-effort heuristic: an unrelated create and delete
 * landing in the same scan are reported as a rename too.
 *
 * A modify event on a stem present in both sets is a content change. That
 * includes the target of a rename from a non-plan file, but not a rename
 * between two plan names.
 *
 * Output order: renamed or created, then removed, then modified.
 */

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "events/event_types.hpp"
#include "watch_types.hpp"

namespace trellico {
namespace watch {

struct StemDiff {
    std::vector<std::string> added;    // Sorted
    std::vector<std::string> removed;  // Sorted
};

StemDiff diff_stems(const StemSet &known, const StemSet &current);

struct FileChange {
    events::ChangeType type = events::ChangeType::MODIFIED;
    std::string file_name;
    std::optional<std::string> old_file_name;

    bool operator==(const FileChange &other) const {
        return type == other.type && file_name == other.file_name && old_file_name == other.old_file_name;
    }
};

struct RenamePair {
    std::string old_name;
    std::string new_name;
};

/**
 * @brief Decides whether a diff represents a rename
 */
class IRenamePolicy {
public:
    virtual ~IRenamePolicy() = default;

    virtual std::optional<RenamePair> detect_rename(const StemDiff &diff) const = 0;
};

// |added| == 1 && |removed| == 1
class CountingRenamePolicy : public IRenamePolicy {
public:
    std::optional<RenamePair> detect_rename(const StemDiff &diff) const override;
};

// Never coalesces; every add/remove is reported individually
class NoRenamePolicy : public IRenamePolicy {
public:
    std::optional<RenamePair> detect_rename(const StemDiff &) const override { return std::nullopt; }
};

class ChangeClassifier {
public:
    /**
     * @param watched_dir Directory whose direct children are classified
     * @param extension Plan file extension including the dot (".md")
     * @param policy Rename policy (CountingRenamePolicy if null)
     */
    ChangeClassifier(std::string watched_dir, std::string extension,
                     std::shared_ptr<const IRenamePolicy> policy = nullptr);

    std::vector<FileChange> classify(const RawEvent &event, const StemSet &known, const StemSet &current) const;

    // Stem of a plan file directly inside watched_dir, if path names one
    std::optional<std::string> stem_for_path(const std::string &path) const;

private:
    std::string watched_dir_;
    std::string extension_;
    std::shared_ptr<const IRenamePolicy> policy_;
};

}  // namespace watch
}  // namespace trellico
