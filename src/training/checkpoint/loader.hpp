/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "checkpoint/checkpoint.hpp"
#include "model/module.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace laia::training {

    /**
     * @brief Reads records, optionally requiring a kind.
     *
     * Loading never modifies or deletes files, so it is safe to repeat and does
     * not interact with any RollingSaver retention set.
     */
    class CheckpointLoader {
    public:
        explicit CheckpointLoader(std::optional<CheckpointKind> required_kind = std::nullopt);

        std::expected<CheckpointRecord, std::string> load(const std::filesystem::path& path) const;

        // nullopt when nothing matches the pattern
        std::expected<std::optional<CheckpointRecord>, std::string> load_by(
            const std::string& pattern, const std::filesystem::path& base_dir) const;

    private:
        std::optional<CheckpointKind> required_kind_;
    };

    /**
     * @brief Loads a full state record and hands it to a consumer (the experiment).
     *
     * A consumer failure (corrupt section) is reported as an error, not thrown.
     */
    class StateCheckpointLoader {
    public:
        using StateConsumer = std::function<void(const StateArchive&)>;

        explicit StateCheckpointLoader(StateConsumer consumer);

        std::expected<CheckpointHeader, std::string> load(const std::filesystem::path& path) const;

        // nullopt when nothing matches: the caller starts fresh
        std::expected<std::optional<std::filesystem::path>, std::string> load_by(
            const std::string& pattern, const std::filesystem::path& base_dir) const;

    private:
        CheckpointLoader reader_{CheckpointKind::STATE};
        StateConsumer consumer_;
    };

    /**
     * @brief Loads model weights from a model record or from the model section of a state record.
     *
     * Non-strict by default: mismatched parameters are dropped and reported.
     */
    class ModelCheckpointLoader {
    public:
        explicit ModelCheckpointLoader(Module& model, bool strict = false);

        std::expected<LoadReport, std::string> load(const std::filesystem::path& path) const;

    private:
        CheckpointLoader reader_;
        Module& model_;
        bool strict_;
    };

} // namespace laia::training
