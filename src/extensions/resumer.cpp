// resumer.cpp
#include "resumer.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bxfer::extensions {

namespace {

auto corrupt(std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::CorruptState,
                             fmt::format("Invalid resume entry: {}", what));
}

// Chunks must cover [0, size) in index order with no gaps or overlaps
auto check_partition(const core::FileEntry& file) -> infra::VoidResult {
    if (file.chunks.empty()) {
        return std::unexpected(corrupt(fmt::format("{} has no chunks", file.pair.remote.string())));
    }
    std::uint64_t expected = 0;
    for (std::size_t i = 0; i < file.chunks.size(); ++i) {
        const auto& chunk = file.chunks[i];
        if (chunk.offset != expected) {
            return std::unexpected(corrupt(fmt::format("{} chunk {} starts at {}, expected {}",
                file.pair.remote.string(), i, chunk.offset, expected)));
        }
        expected += chunk.length;
    }
    if (expected != file.size) {
        return std::unexpected(corrupt(fmt::format("{} chunks cover {} of {} bytes",
            file.pair.remote.string(), expected, file.size)));
    }
    return {};
}

} // namespace

auto encode_job(const core::JobState& state) -> YAML::Node
{
    YAML::Node node;
    node["direction"] = std::string(core::to_string(state.direction));
    node["source"] = state.source_spec;
    node["destination"] = state.dest_spec;
    node["threads"] = state.threads;
    node["chunk_size"] = state.chunk_size;
    node["buffer_size"] = state.buffer_size;
    node["job_id"] = state.job_id;
    node["temp_dir"] = state.temp_dir;

    YAML::Node files(YAML::NodeType::Sequence);
    for (const auto& file : state.files) {
        YAML::Node entry;
        entry["remote"] = file.pair.remote.generic_string();
        entry["local"] = file.pair.local.string();
        entry["size"] = file.size;
        entry["state"] = std::string(core::to_string(file.state));
        if (file.error) {
            entry["error"] = *file.error;
        }

        YAML::Node chunks(YAML::NodeType::Sequence);
        for (const auto& chunk : file.chunks) {
            YAML::Node row(YAML::NodeType::Sequence);
            row.SetStyle(YAML::EmitterStyle::Flow);
            row.push_back(chunk.offset);
            row.push_back(chunk.length);
            row.push_back(std::string(core::to_string(chunk.state)));
            row.push_back(chunk.retry_count);
            chunks.push_back(row);
        }
        chunks.SetStyle(YAML::EmitterStyle::Flow);
        entry["chunks"] = chunks;
        files.push_back(entry);
    }
    node["files"] = files;
    return node;
}

auto decode_job(const YAML::Node& node) -> infra::Result<core::JobState>
{
    try {
        if (!node.IsMap()) {
            return std::unexpected(corrupt("not a mapping"));
        }

        core::JobState state;
        auto direction = core::direction_from_string(node["direction"].as<std::string>());
        if (!direction) return std::unexpected(std::move(direction.error()));
        state.direction = *direction;
        state.source_spec = node["source"].as<std::string>();
        state.dest_spec = node["destination"].as<std::string>();
        state.threads = node["threads"].as<std::uint32_t>();
        state.chunk_size = node["chunk_size"].as<std::uint64_t>();
        state.buffer_size = node["buffer_size"].as<std::uint64_t>();
        state.job_id = node["job_id"].as<std::string>();
        state.temp_dir = node["temp_dir"].as<std::string>();

        for (const auto& entry : node["files"]) {
            core::FileEntry file;
            file.pair.remote = entry["remote"].as<std::string>();
            file.pair.local = entry["local"].as<std::string>();
            file.size = entry["size"].as<std::uint64_t>();

            auto file_state = core::file_state_from_string(entry["state"].as<std::string>());
            if (!file_state) return std::unexpected(std::move(file_state.error()));
            file.state = *file_state;
            if (entry["error"]) {
                file.error = entry["error"].as<std::string>();
            }

            const auto file_index = state.files.size();
            for (const auto& row : entry["chunks"]) {
                if (!row.IsSequence() || row.size() != 4) {
                    return std::unexpected(corrupt("chunk row must be [offset, length, state, retries]"));
                }
                auto chunk_state = core::chunk_state_from_string(row[2].as<std::string>());
                if (!chunk_state) return std::unexpected(std::move(chunk_state.error()));

                core::Chunk chunk{
                    .file_index = file_index,
                    .index = file.chunks.size(),
                    .offset = row[0].as<std::uint64_t>(),
                    .length = row[1].as<std::uint64_t>(),
                    .state = *chunk_state,
                    .retry_count = row[3].as<int>(),
                };
                // A chunk that was in flight when the process died starts over
                if (chunk.state == core::ChunkState::InProgress) {
                    chunk.state = core::ChunkState::Waiting;
                }
                file.chunks.push_back(chunk);
            }

            if (auto res = check_partition(file); !res) {
                return std::unexpected(std::move(res.error()));
            }
            state.files.push_back(std::move(file));
        }

        state.fingerprint = core::compute_fingerprint(state);
        return state;

    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupt(e.what()));
    }
}

} // namespace bxfer::extensions
