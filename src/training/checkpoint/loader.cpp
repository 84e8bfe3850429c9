/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint/loader.hpp"
#include "checkpoint/resolver.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

namespace laia::training {

    namespace fs = std::filesystem;

    CheckpointLoader::CheckpointLoader(const std::optional<CheckpointKind> required_kind)
        : required_kind_(required_kind) {}

    std::expected<CheckpointRecord, std::string> CheckpointLoader::load(const fs::path& path) const {
        auto record = read_checkpoint(path);
        if (!record) {
            return std::unexpected(record.error());
        }
        if (required_kind_ && record->header.kind != *required_kind_) {
            return std::unexpected("Checkpoint " + core::path_to_utf8(path) + " is a " +
                                   to_string(record->header.kind) + " record, expected " +
                                   to_string(*required_kind_));
        }
        return record;
    }

    std::expected<std::optional<CheckpointRecord>, std::string> CheckpointLoader::load_by(
        const std::string& pattern, const fs::path& base_dir) const {

        const auto resolution = CheckpointResolver::resolve(pattern, base_dir);
        if (!resolution.selected) {
            return std::optional<CheckpointRecord>{};
        }
        auto record = load(*resolution.selected);
        if (!record) {
            return std::unexpected(record.error());
        }
        return std::optional<CheckpointRecord>(std::move(*record));
    }

    StateCheckpointLoader::StateCheckpointLoader(StateConsumer consumer)
        : consumer_(std::move(consumer)) {
        if (!consumer_) {
            throw std::invalid_argument("StateCheckpointLoader requires a state consumer");
        }
    }

    std::expected<CheckpointHeader, std::string> StateCheckpointLoader::load(const fs::path& path) const {
        auto record = reader_.load(path);
        if (!record) {
            return std::unexpected(record.error());
        }
        try {
            consumer_(record->archive);
        } catch (const std::exception& e) {
            return std::unexpected("Restoring state from " + core::path_to_utf8(path) + " failed: " + e.what());
        }
        LOG_INFO("Checkpoint loaded: {} (epoch {}, iteration {})",
                 core::path_to_utf8(path), record->header.epoch, record->header.iteration);
        return record->header;
    }

    std::expected<std::optional<fs::path>, std::string> StateCheckpointLoader::load_by(
        const std::string& pattern, const fs::path& base_dir) const {

        const auto resolution = CheckpointResolver::resolve(pattern, base_dir);
        if (!resolution.selected) {
            return std::optional<fs::path>{};
        }
        if (auto header = load(*resolution.selected); !header) {
            return std::unexpected(header.error());
        }
        return resolution.selected;
    }

    ModelCheckpointLoader::ModelCheckpointLoader(Module& model, const bool strict)
        : model_(model),
          strict_(strict) {}

    std::expected<LoadReport, std::string> ModelCheckpointLoader::load(const fs::path& path) const {
        auto record = reader_.load(path);
        if (!record) {
            return std::unexpected(record.error());
        }
        try {
            LoadReport report;
            record->archive.read("model", [&](std::istream& is) { report = model_.deserialize(is, strict_); });
            if (report.dropped.empty()) {
                LOG_INFO("Model loaded from {} ({} parameters)", core::path_to_utf8(path), report.loaded.size());
            } else {
                LOG_WARN("Model loaded from {} non-strictly: {} loaded, {} dropped",
                         core::path_to_utf8(path), report.loaded.size(), report.dropped.size());
            }
            return report;
        } catch (const std::exception& e) {
            return std::unexpected("Loading model from " + core::path_to_utf8(path) + " failed: " + e.what());
        }
    }

} // namespace laia::training
