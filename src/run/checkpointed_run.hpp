// File: src/run/checkpointed_run.hpp
#pragma once

#include "core/feature_value.hpp"
#include "core/types.hpp"
#include "grouping/group_assigner.hpp"
#include "run/checkpoint.hpp"
#include "scan/pairwise_scanner.hpp"
#include "similarity/similarity_metric.hpp"
#include "storage/blob_store.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace simgroup {

/// Cooperative cancellation flag, polled at scan boundaries
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void Reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Output of a grouping run
struct RunResult {
    GroupAssignment assignment;
    GroupMembership membership;
    std::vector<ProbableDuplicateSet::PathPair> duplicates;

    /// Returned straight from a complete checkpoint, without scanning
    bool from_checkpoint{false};
};

/// CheckpointedRun: resumable, cancellable grouping run
///
/// Wraps PairwiseScanner and GroupAssigner with a RunCheckpoint persisted in
/// a BlobStore:
/// - a stored checkpoint for a different file list raises
///   CheckpointMismatchError (overwrite discards it instead)
/// - a checkpoint whose indices fall outside the file list is discarded;
///   the confirm callback decides between a fresh run and an empty result
/// - an unreadable checkpoint is logged and treated as absent
/// - a complete checkpoint is returned without rescanning
/// - progress is persisted every `checkpoint_interval` scan positions and
///   once more, marked complete, at the end
/// - cancellation is checked at scan boundaries only; the partial state is
///   persisted before RunCancelled is thrown
class CheckpointedRun {
public:
    struct Config {
        /// Blob key of the checkpoint (see MakeCacheKey)
        std::string checkpoint_key;

        /// When false the run neither loads nor saves checkpoints
        bool store_checkpoints{true};

        /// Ignore any stored checkpoint and start fresh
        bool overwrite{false};

        /// Scan positions between persisted checkpoints
        size_t checkpoint_interval{250};

        PairwiseScanner::Config scan;
        GroupAssigner::Config grouping;

        bool verbose{false};
    };

    /// Asked whether to restart after discarding an invalid checkpoint
    using ConfirmCallback = std::function<bool(const std::string& message)>;

    CheckpointedRun(std::shared_ptr<BlobStore> blob_store,
                    const SimilarityMetric& metric,
                    const Config& config);

    void SetProgressListener(ProgressListener listener) { progress_listener_ = std::move(listener); }
    void SetConfirmCallback(ConfirmCallback callback) { confirm_callback_ = std::move(callback); }

    /// Group the corpus
    /// @param files_found Ordered, deduplicated paths
    /// @param features Features parallel to files_found
    /// @param cancel Optional cancellation token
    /// @throws CheckpointMismatchError, RunCancelled
    RunResult Run(const std::vector<std::string>& files_found,
                  const std::vector<FeatureValue>& features,
                  const CancellationToken* cancel = nullptr);

    /// Checkpoint blobs written by this object so far
    size_t CheckpointWrites() const { return checkpoint_writes_; }

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<BlobStore> blob_store_;
    const SimilarityMetric& metric_;
    Config config_;

    ProgressListener progress_listener_;
    ConfirmCallback confirm_callback_;
    size_t checkpoint_writes_{0};

    /// Resolve the starting state. Returns false if the caller declined a
    /// restart after an invalid checkpoint.
    bool ResolveStartState(const std::vector<std::string>& files_found, uint64_t hash,
                           RunCheckpoint& state);

    void Persist(RunCheckpoint& state, const GroupAssigner& assigner,
                 const std::vector<std::string>& files_found, size_t position);

    static RunResult ResultFrom(const RunCheckpoint& state, bool from_checkpoint);

    void LogDebug(const std::string& message) const;
};

} // namespace simgroup
