// File: src/grouping/group_assigner.cpp
#include "grouping/group_assigner.hpp"
#include <algorithm>
#include <stdexcept>

namespace simgroup {

// ============================================================================
// ProbableDuplicateSet
// ============================================================================

ProbableDuplicateSet::PathPair ProbableDuplicateSet::Canonical(const std::string& a,
                                                               const std::string& b) {
    return a < b ? PathPair(a, b) : PathPair(b, a);
}

bool ProbableDuplicateSet::Add(const std::string& a, const std::string& b) {
    if (!seen_.insert(Canonical(a, b)).second) {
        return false;
    }
    pairs_.emplace_back(a, b);
    return true;
}

bool ProbableDuplicateSet::Contains(const std::string& a, const std::string& b) const {
    return seen_.count(Canonical(a, b)) > 0;
}

size_t ProbableDuplicateSet::RemovePath(const std::string& path) {
    size_t before = pairs_.size();

    pairs_.erase(std::remove_if(pairs_.begin(), pairs_.end(),
                                [&path](const PathPair& pair) {
                                    return pair.first == path || pair.second == path;
                                }),
                 pairs_.end());

    for (auto it = seen_.begin(); it != seen_.end();) {
        if (it->first == path || it->second == path) {
            it = seen_.erase(it);
        } else {
            ++it;
        }
    }

    return before - pairs_.size();
}

void ProbableDuplicateSet::Clear() {
    pairs_.clear();
    seen_.clear();
}

// ============================================================================
// GroupAssigner
// ============================================================================

GroupAssigner::GroupAssigner(const SimilarityMetric& metric, const Config& config)
    : metric_(metric), config_(config) {}

GroupAssigner::Outcome GroupAssigner::Consume(const CandidatePair& pair,
                                              const std::vector<std::string>& files_found) {
    if (pair.base >= files_found.size() || pair.other >= files_found.size()) {
        throw std::out_of_range("Pair (" + std::to_string(pair.base) + ", " +
                                std::to_string(pair.other) + ") outside " +
                                std::to_string(files_found.size()) + " files");
    }

    if (metric_.PassesThreshold(pair.score, config_.duplicate_threshold)) {
        duplicates_.Add(files_found[pair.base], files_found[pair.other]);
    }

    auto base_it = assignment_.find(pair.base);
    auto other_it = assignment_.find(pair.other);
    bool base_grouped = base_it != assignment_.end();
    bool other_grouped = other_it != assignment_.end();

    if (!base_grouped && !other_grouped) {
        GroupID group_id = next_group_id_++;
        assignment_[pair.base] = GroupMember{group_id, pair.score};
        assignment_[pair.other] = GroupMember{group_id, pair.score};
        return Outcome::NEW_GROUP;
    }

    if (base_grouped && other_grouped) {
        return Outcome::UNCHANGED;
    }

    const GroupMember existing = base_grouped ? base_it->second : other_it->second;
    FileIndex unassigned = base_grouped ? pair.other : pair.base;

    if (metric_.Drift(existing.score, pair.score) > config_.group_cutoff) {
        GroupID group_id = next_group_id_++;
        assignment_[pair.base] = GroupMember{group_id, pair.score};
        assignment_[pair.other] = GroupMember{group_id, pair.score};
        return Outcome::SPLIT;
    }

    assignment_[unassigned] = GroupMember{existing.group_id, pair.score};
    return Outcome::JOINED;
}

void GroupAssigner::Restore(const GroupAssignment& assignment, GroupID next_group_id,
                            const std::vector<ProbableDuplicateSet::PathPair>& duplicates) {
    assignment_ = assignment;
    next_group_id_ = next_group_id;

    // Never hand out an id that is already in use
    for (const auto& [index, member] : assignment_) {
        next_group_id_ = std::max(next_group_id_, member.group_id + 1);
    }

    duplicates_.Clear();
    for (const auto& [a, b] : duplicates) {
        duplicates_.Add(a, b);
    }
}

void GroupAssigner::Reset() {
    assignment_.clear();
    next_group_id_ = 0;
    duplicates_.Clear();
}

GroupMembership GroupAssigner::Finalize(const std::vector<std::string>& files_found) const {
    GroupMembership membership;

    for (const auto& [index, member] : assignment_) {
        if (index >= files_found.size()) {
            throw std::out_of_range("Assigned file index " + std::to_string(index) +
                                    " outside " + std::to_string(files_found.size()) + " files");
        }
        membership[member.group_id][files_found[index]] = member.score;
    }

    for (auto it = membership.begin(); it != membership.end();) {
        if (it->second.size() < 2) {
            it = membership.erase(it);
        } else {
            ++it;
        }
    }

    return membership;
}

const char* ToString(GroupAssigner::Outcome outcome) {
    switch (outcome) {
        case GroupAssigner::Outcome::NEW_GROUP: return "NEW_GROUP";
        case GroupAssigner::Outcome::JOINED: return "JOINED";
        case GroupAssigner::Outcome::SPLIT: return "SPLIT";
        case GroupAssigner::Outcome::UNCHANGED: return "UNCHANGED";
        default: return "UNKNOWN";
    }
}

} // namespace simgroup
