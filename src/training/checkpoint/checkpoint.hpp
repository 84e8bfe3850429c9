/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

/**
 * @file checkpoint.hpp
 * @brief Checkpoint record format
 *
 * Binary Format (v1):
 * ┌─────────────────────────────────────────────────────────────────┐
 * │ CheckpointHeader (48 bytes)                                    │
 * │   - magic: uint32 = 0x4C41434B ("LACK")                        │
 * │   - version: uint32 = 1                                        │
 * │   - kind: uint32 (STATE = 0, MODEL = 1)                        │
 * │   - num_sections: uint32                                       │
 * │   - epoch: uint64                                              │
 * │   - iteration: uint64                                          │
 * │   - meta_json_offset: uint64                                   │
 * │   - meta_json_size: uint64                                     │
 * ├─────────────────────────────────────────────────────────────────┤
 * │ Sections (num_sections times)                                  │
 * │   - name_len: uint32, name: char[name_len]                     │
 * │   - blob_size: uint64, blob: char[blob_size]                   │
 * │   State records: trainer, evaluator, metrics, model,           │
 * │   optimizer, scheduler. Model records: model.                  │
 * ├─────────────────────────────────────────────────────────────────┤
 * │ Metadata JSON (at meta_json_offset)                            │
 * │   - experiment, suffix, created, parameters                    │
 * └─────────────────────────────────────────────────────────────────┘
 */

#include "checkpoint/state_archive.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace laia::training {

    constexpr uint32_t CHECKPOINT_MAGIC = 0x4C41434B; // "LACK"
    constexpr uint32_t CHECKPOINT_VERSION = 1;

    enum class CheckpointKind : uint32_t {
        STATE = 0, // full resumable state
        MODEL = 1, // model weights only
    };

    const char* to_string(CheckpointKind kind);

    struct CheckpointHeader {
        uint32_t magic = CHECKPOINT_MAGIC;
        uint32_t version = CHECKPOINT_VERSION;
        CheckpointKind kind = CheckpointKind::STATE;
        uint32_t num_sections = 0;
        uint64_t epoch = 0;
        uint64_t iteration = 0;
        uint64_t meta_json_offset = 0;
        uint64_t meta_json_size = 0;
    };
    static_assert(sizeof(CheckpointHeader) == 48, "CheckpointHeader must be 48 bytes");

    struct CheckpointRecord {
        CheckpointHeader header;
        StateArchive archive;
        nlohmann::json metadata;
    };

    /**
     * @brief Write a record to path.
     *
     * The bytes go to a staging file next to path which is renamed over path only
     * once fully written; on any failure the staging file is removed and path is
     * left as it was.
     */
    std::expected<void, std::string> write_checkpoint(
        const std::filesystem::path& path,
        CheckpointKind kind,
        const StateArchive& archive,
        const nlohmann::json& metadata);

    std::expected<CheckpointHeader, std::string> read_checkpoint_header(
        const std::filesystem::path& path);

    std::expected<CheckpointRecord, std::string> read_checkpoint(
        const std::filesystem::path& path);

} // namespace laia::training
