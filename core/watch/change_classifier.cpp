#include "change_classifier.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>

namespace trellico {
namespace watch {

namespace fs = std::filesystem;

StemDiff diff_stems(const StemSet &known, const StemSet &current) {
    StemDiff diff;
    std::set_difference(current.begin(), current.end(), known.begin(), known.end(), std::back_inserter(diff.added));
    std::set_difference(known.begin(), known.end(), current.begin(), current.end(),
                        std::back_inserter(diff.removed));
    return diff;
}

std::optional<RenamePair> CountingRenamePolicy::detect_rename(const StemDiff &diff) const {
    if (diff.added.size() == 1 && diff.removed.size() == 1) {
        return RenamePair{diff.removed.front(), diff.added.front()};
    }
    return std::nullopt;
}

ChangeClassifier::ChangeClassifier(std::string watched_dir, std::string extension,
                                   std::shared_ptr<const IRenamePolicy> policy)
    : watched_dir_(std::move(watched_dir)), extension_(std::move(extension)), policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = std::make_shared<CountingRenamePolicy>();
    }
}

std::optional<std::string> ChangeClassifier::stem_for_path(const std::string &path) const {
    const fs::path p(path);
    if (p.extension().string() != extension_) {
        return std::nullopt;
    }
    // Files in nested directories share stems with top-level plans but are not plans
    if (p.parent_path().lexically_normal() != fs::path(watched_dir_).lexically_normal()) {
        return std::nullopt;
    }
    return p.stem().string();
}

std::vector<FileChange> ChangeClassifier::classify(const RawEvent &event, const StemSet &known,
                                                   const StemSet &current) const {
    std::vector<FileChange> changes;
    const StemDiff diff = diff_stems(known, current);

    auto rename = policy_->detect_rename(diff);
    if (rename) {
        changes.push_back(FileChange{events::ChangeType::RENAMED, rename->new_name, rename->old_name});
        // A policy may pair a subset of the diff; everything else is still reported
        for (const auto &name : diff.added) {
            if (name != rename->new_name) {
                changes.push_back(FileChange{events::ChangeType::CREATED, name, std::nullopt});
            }
        }
        for (const auto &name : diff.removed) {
            if (name != rename->old_name) {
                changes.push_back(FileChange{events::ChangeType::REMOVED, name, std::nullopt});
            }
        }
    } else {
        for (const auto &name : diff.added) {
            changes.push_back(FileChange{events::ChangeType::CREATED, name, std::nullopt});
        }
        for (const auto &name : diff.removed) {
            changes.push_back(FileChange{events::ChangeType::REMOVED, name, std::nullopt});
        }
    }

    // Renaming one plan onto another name is already covered by the diff above;
    // a rename from a non-plan source (an editor's temp file) replaces content
    const bool plan_rename = !event.moved_from.empty() && stem_for_path(event.moved_from).has_value();
    if (event.kind == RawEventKind::MODIFY && !plan_rename) {
        auto stem = stem_for_path(event.path);
        if (stem && known.count(*stem) > 0 && current.count(*stem) > 0) {
            changes.push_back(FileChange{events::ChangeType::MODIFIED, *stem, std::nullopt});
        }
    }

    return changes;
}

}  // namespace watch
}  // namespace trellico
