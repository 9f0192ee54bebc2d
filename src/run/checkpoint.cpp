// File: src/run/checkpoint.cpp
#include "run/checkpoint.hpp"
#include "core/binary_io.hpp"
#include "core/errors.hpp"
#include <cstring>
#include <sstream>

namespace simgroup {

namespace {

constexpr char kMagic[4] = {'S', 'G', 'C', 'K'};

} // namespace

Blob RunCheckpoint::Serialize() const {
    std::ostringstream out(std::ios::binary);

    out.write(kMagic, sizeof(kMagic));
    binary_io::WritePod(out, kVersion);
    binary_io::WritePod<uint64_t>(out, file_list_hash);
    binary_io::WritePod<uint64_t>(out, next_group_id);
    binary_io::WritePod<uint64_t>(out, next_position);
    binary_io::WritePod<uint8_t>(out, is_complete ? 1 : 0);

    binary_io::WritePod<uint64_t>(out, assignment.size());
    for (const auto& [index, member] : assignment) {
        binary_io::WritePod<uint64_t>(out, index);
        binary_io::WritePod<uint64_t>(out, member.group_id);
        binary_io::WritePod<float>(out, member.score);
    }

    binary_io::WritePod<uint64_t>(out, membership.size());
    for (const auto& [group_id, members] : membership) {
        binary_io::WritePod<uint64_t>(out, group_id);
        binary_io::WritePod<uint64_t>(out, members.size());
        for (const auto& [path, score] : members) {
            binary_io::WriteString(out, path);
            binary_io::WritePod<float>(out, score);
        }
    }

    binary_io::WritePod<uint64_t>(out, duplicates.size());
    for (const auto& [a, b] : duplicates) {
        binary_io::WriteString(out, a);
        binary_io::WriteString(out, b);
    }

    std::string bytes = out.str();
    return Blob(bytes.begin(), bytes.end());
}

RunCheckpoint RunCheckpoint::Deserialize(const Blob& blob) {
    std::istringstream in(std::string(blob.begin(), blob.end()), std::ios::binary);

    char magic[4];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw CheckpointFormatError("Not a run checkpoint (bad magic)");
    }

    RunCheckpoint checkpoint;

    try {
        uint32_t version = binary_io::ReadPod<uint32_t>(in);
        if (version != kVersion) {
            throw CheckpointFormatError("Unsupported checkpoint version " + std::to_string(version));
        }

        checkpoint.file_list_hash = binary_io::ReadPod<uint64_t>(in);
        checkpoint.next_group_id = binary_io::ReadPod<uint64_t>(in);
        checkpoint.next_position = static_cast<size_t>(binary_io::ReadPod<uint64_t>(in));
        checkpoint.is_complete = binary_io::ReadPod<uint8_t>(in) != 0;

        uint64_t n_assigned = binary_io::ReadLength(in);
        for (uint64_t i = 0; i < n_assigned; ++i) {
            FileIndex index = static_cast<FileIndex>(binary_io::ReadPod<uint64_t>(in));
            GroupMember member;
            member.group_id = binary_io::ReadPod<uint64_t>(in);
            member.score = binary_io::ReadPod<float>(in);
            checkpoint.assignment[index] = member;
        }

        uint64_t n_groups = binary_io::ReadLength(in);
        for (uint64_t i = 0; i < n_groups; ++i) {
            GroupID group_id = binary_io::ReadPod<uint64_t>(in);
            uint64_t n_members = binary_io::ReadLength(in);
            auto& members = checkpoint.membership[group_id];
            for (uint64_t j = 0; j < n_members; ++j) {
                std::string path = binary_io::ReadString(in);
                members[path] = binary_io::ReadPod<float>(in);
            }
        }

        uint64_t n_duplicates = binary_io::ReadLength(in);
        for (uint64_t i = 0; i < n_duplicates; ++i) {
            std::string a = binary_io::ReadString(in);
            std::string b = binary_io::ReadString(in);
            checkpoint.duplicates.emplace_back(std::move(a), std::move(b));
        }
    } catch (const CheckpointFormatError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw CheckpointFormatError(std::string("Truncated checkpoint: ") + e.what());
    }

    return checkpoint;
}

bool RunCheckpoint::IndicesWithinBounds(size_t file_count) const {
    for (const auto& [index, member] : assignment) {
        if (index >= file_count) {
            return false;
        }
    }
    return true;
}

bool RunCheckpoint::operator==(const RunCheckpoint& other) const {
    return file_list_hash == other.file_list_hash &&
           assignment == other.assignment &&
           membership == other.membership &&
           next_group_id == other.next_group_id &&
           next_position == other.next_position &&
           is_complete == other.is_complete &&
           duplicates == other.duplicates;
}

} // namespace simgroup
