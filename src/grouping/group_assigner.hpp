// File: src/grouping/group_assigner.hpp
#pragma once

#include "core/types.hpp"
#include "scan/pairwise_scanner.hpp"
#include "similarity/similarity_metric.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace simgroup {

/// File-path pairs whose score crossed the duplicate threshold
///
/// Pairs keep insertion order and are deduplicated by unordered identity:
/// (a, b) and (b, a) are the same pair.
class ProbableDuplicateSet {
public:
    using PathPair = std::pair<std::string, std::string>;

    /// @return true if the pair was not present yet
    bool Add(const std::string& a, const std::string& b);

    bool Contains(const std::string& a, const std::string& b) const;

    /// Drop every pair that mentions `path`
    /// @return number of pairs removed
    size_t RemovePath(const std::string& path);

    const std::vector<PathPair>& Pairs() const { return pairs_; }
    size_t Size() const { return pairs_.size(); }
    bool Empty() const { return pairs_.empty(); }
    void Clear();

private:
    std::vector<PathPair> pairs_;
    std::set<PathPair> seen_;

    static PathPair Canonical(const std::string& a, const std::string& b);
};

/// GroupAssigner: greedy online clustering over a scored pair stream
///
/// Each file index is either unassigned or assigned(group_id, score). For
/// every related pair (a, b, score), in stream order:
///   1. neither assigned: both join a new group at `score`
///   2. exactly one assigned to g at s_prev: if the score drifted past the
///      cutoff (higher-is-better: s_prev - score > cutoff, lower-is-better:
///      score - s_prev > cutoff) both move to a new group; otherwise the
///      unassigned file joins g at `score`
///   3. both assigned: nothing changes (groups are never merged)
///
/// The outcome depends on stream order. Pairs beyond the strict duplicate
/// threshold are recorded in the ProbableDuplicateSet whatever the grouping
/// outcome.
class GroupAssigner {
public:
    struct Config {
        /// Allowed drift before a pair splits off into a new group
        float group_cutoff{0.0f};

        /// Strict threshold for probable duplicates
        float duplicate_threshold{0.0f};
    };

    enum class Outcome {
        NEW_GROUP,   // rule 1
        JOINED,      // rule 2, within cutoff
        SPLIT,       // rule 2, drifted past cutoff
        UNCHANGED,   // rule 3
    };

    GroupAssigner(const SimilarityMetric& metric, const Config& config);

    /// Apply one related pair
    /// @param files_found Paths by file index, used for duplicate recording
    /// @throws std::out_of_range if a pair index is outside files_found
    Outcome Consume(const CandidatePair& pair, const std::vector<std::string>& files_found);

    /// Resume from checkpointed state
    void Restore(const GroupAssignment& assignment, GroupID next_group_id,
                 const std::vector<ProbableDuplicateSet::PathPair>& duplicates = {});

    /// Forget all assignments and duplicates
    void Reset();

    /// Build group_id -> {path: score}, hiding groups with fewer than 2 members.
    /// Stragglers stay in GetAssignment().
    GroupMembership Finalize(const std::vector<std::string>& files_found) const;

    const GroupAssignment& GetAssignment() const { return assignment_; }
    GroupID NextGroupId() const { return next_group_id_; }

    const ProbableDuplicateSet& GetDuplicates() const { return duplicates_; }

    const Config& GetConfig() const { return config_; }

private:
    const SimilarityMetric& metric_;
    Config config_;

    GroupAssignment assignment_;
    GroupID next_group_id_{0};
    ProbableDuplicateSet duplicates_;
};

const char* ToString(GroupAssigner::Outcome outcome);

} // namespace simgroup
