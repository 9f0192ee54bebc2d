// File: src/run/checkpointed_run.cpp
#include "run/checkpointed_run.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace simgroup {

namespace {

constexpr float kProgressStep = 10.0f;
const char* kProgressLabel = "Image comparison";

} // namespace

CheckpointedRun::CheckpointedRun(std::shared_ptr<BlobStore> blob_store,
                                 const SimilarityMetric& metric,
                                 const Config& config)
    : blob_store_(std::move(blob_store)), metric_(metric), config_(config) {
    if (config_.store_checkpoints && !blob_store_) {
        throw std::invalid_argument("CheckpointedRun requires a BlobStore to store checkpoints");
    }
    if (config_.checkpoint_interval == 0) {
        config_.checkpoint_interval = 1;
    }
    confirm_callback_ = [](const std::string&) { return true; };
}

RunResult CheckpointedRun::Run(const std::vector<std::string>& files_found,
                               const std::vector<FeatureValue>& features,
                               const CancellationToken* cancel) {
    const uint64_t hash = HashFileList(files_found);

    RunCheckpoint state;
    state.file_list_hash = hash;

    if (!ResolveStartState(files_found, hash, state)) {
        return RunResult{};
    }

    if (state.is_complete) {
        LogDebug("Checkpoint is complete, skipping scan");
        return ResultFrom(state, true);
    }

    if (state.next_position > 0) {
        LogDebug("Resuming at scan position " + std::to_string(state.next_position));
    }

    GroupAssigner assigner(metric_, config_.grouping);
    assigner.Restore(state.assignment, state.next_group_id, state.duplicates);

    PairwiseScanner scanner(metric_, config_.scan);

    size_t last_persisted = state.next_position;
    float next_progress = 0.0f;

    auto on_pair = [&](const CandidatePair& pair) {
        assigner.Consume(pair, files_found);
    };

    auto on_boundary = [&](size_t position, size_t total) {
        if (cancel && cancel->IsCancelled()) {
            if (config_.store_checkpoints) {
                Persist(state, assigner, files_found, position);
            }
            throw RunCancelled(position);
        }

        if (config_.store_checkpoints &&
            position - last_persisted >= config_.checkpoint_interval) {
            Persist(state, assigner, files_found, position);
            last_persisted = position;
        }

        float percent = total > 0 ? 100.0f * static_cast<float>(position) / static_cast<float>(total)
                                  : 100.0f;
        if (percent >= next_progress) {
            if (progress_listener_) {
                progress_listener_(kProgressLabel, percent);
            }
            LogDebug(std::to_string(static_cast<int>(percent)) + "% compared");
            while (next_progress <= percent) {
                next_progress += kProgressStep;
            }
        }
    };

    scanner.Scan(features, files_found.size(), state.next_position, on_pair, on_boundary);

    state.is_complete = true;
    size_t n = std::min(features.size(), files_found.size());
    Persist(state, assigner, files_found, scanner.TotalPositions(n));

    if (progress_listener_) {
        progress_listener_(kProgressLabel, 100.0f);
    }

    LogDebug("Found " + std::to_string(state.membership.size()) + " groups");
    return ResultFrom(state, false);
}

bool CheckpointedRun::ResolveStartState(const std::vector<std::string>& files_found,
                                        uint64_t hash, RunCheckpoint& state) {
    if (!config_.store_checkpoints || config_.overwrite) {
        return true;
    }

    auto blob = blob_store_->Load(config_.checkpoint_key);
    if (!blob) {
        return true;
    }

    RunCheckpoint stored;
    try {
        stored = RunCheckpoint::Deserialize(*blob);
    } catch (const CheckpointFormatError& e) {
        std::cerr << "[CheckpointedRun] Ignoring unreadable checkpoint '" << config_.checkpoint_key
                  << "': " << e.what() << std::endl;
        return true;
    }

    if (stored.file_list_hash != hash) {
        throw CheckpointMismatchError(stored.file_list_hash, hash);
    }

    if (!stored.IndicesWithinBounds(files_found.size())) {
        std::string message = "Checkpoint '" + config_.checkpoint_key +
                              "' references files outside the current file list (" +
                              std::to_string(files_found.size()) + " files). Restart the comparison?";
        std::cerr << "[CheckpointedRun] " << message << std::endl;
        // Discarded either way; a restart starts from the fresh state
        return confirm_callback_ ? confirm_callback_(message) : true;
    }

    state = std::move(stored);
    return true;
}

void CheckpointedRun::Persist(RunCheckpoint& state, const GroupAssigner& assigner,
                              const std::vector<std::string>& files_found, size_t position) {
    state.assignment = assigner.GetAssignment();
    state.next_group_id = assigner.NextGroupId();
    state.next_position = position;
    state.membership = assigner.Finalize(files_found);
    state.duplicates = assigner.GetDuplicates().Pairs();

    if (!config_.store_checkpoints) {
        return;
    }

    if (!blob_store_->Save(config_.checkpoint_key, state.Serialize())) {
        throw std::runtime_error("Failed to persist checkpoint '" + config_.checkpoint_key + "'");
    }
    ++checkpoint_writes_;
    LogDebug("Stored checkpoint at position " + std::to_string(position) +
             (state.is_complete ? " (complete)" : ""));
}

RunResult CheckpointedRun::ResultFrom(const RunCheckpoint& state, bool from_checkpoint) {
    RunResult result;
    result.assignment = state.assignment;
    result.membership = state.membership;
    result.duplicates = state.duplicates;
    result.from_checkpoint = from_checkpoint;
    return result;
}

void CheckpointedRun::LogDebug(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[CheckpointedRun] " << message << std::endl;
    }
}

} // namespace simgroup
