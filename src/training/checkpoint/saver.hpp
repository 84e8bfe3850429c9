/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "checkpoint/checkpoint.hpp"

#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace laia::training {

    /**
     * @brief Something that can persist a record under <directory>/<filename>-<suffix>.
     */
    class ISaver {
    public:
        virtual ~ISaver() = default;

        virtual std::expected<std::filesystem::path, std::string> save(const std::string& suffix) = 0;

        [[nodiscard]] virtual const std::filesystem::path& directory() const = 0;
        [[nodiscard]] virtual const std::string& filename() const = 0;

        [[nodiscard]] std::filesystem::path path_for(const std::string& suffix) const {
            return directory() / (filename() + "-" + suffix);
        }
    };

    /**
     * @brief Writes archives of one kind under one logical name.
     *
     * Metadata (experiment name, parameters) is attached to every record together
     * with the suffix and the creation time.
     */
    class CheckpointSaver {
    public:
        CheckpointSaver(std::filesystem::path directory, std::string filename, CheckpointKind kind);

        std::expected<std::filesystem::path, std::string> save(const StateArchive& archive, const std::string& suffix) const;

        void set_metadata(nlohmann::json metadata) { metadata_ = std::move(metadata); }

        [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
        [[nodiscard]] const std::string& filename() const { return filename_; }
        [[nodiscard]] CheckpointKind kind() const { return kind_; }

    private:
        std::filesystem::path directory_;
        std::string filename_;
        CheckpointKind kind_;
        nlohmann::json metadata_ = nlohmann::json::object();
    };

    using StateProvider = std::function<StateArchive()>;

    // Saves the full resumable state produced by the provider
    class StateCheckpointSaver final : public ISaver {
    public:
        StateCheckpointSaver(std::filesystem::path directory, std::string filename, StateProvider provider);

        std::expected<std::filesystem::path, std::string> save(const std::string& suffix) override;

        [[nodiscard]] const std::filesystem::path& directory() const override { return writer_.directory(); }
        [[nodiscard]] const std::string& filename() const override { return writer_.filename(); }

        void set_metadata(nlohmann::json metadata) { writer_.set_metadata(std::move(metadata)); }

    private:
        CheckpointSaver writer_;
        StateProvider provider_;
    };

    // Saves only the "model" section of the provider's state
    class ModelCheckpointSaver final : public ISaver {
    public:
        ModelCheckpointSaver(std::filesystem::path directory, std::string filename, StateProvider provider);

        std::expected<std::filesystem::path, std::string> save(const std::string& suffix) override;

        [[nodiscard]] const std::filesystem::path& directory() const override { return writer_.directory(); }
        [[nodiscard]] const std::string& filename() const override { return writer_.filename(); }

        void set_metadata(nlohmann::json metadata) { writer_.set_metadata(std::move(metadata)); }

    private:
        CheckpointSaver writer_;
        StateProvider provider_;
    };

    /**
     * @brief Bounded retention on top of another saver.
     *
     * Every successful save appends its record; once more than `keep` records
     * exist the oldest are deleted until `keep` remain. Deletion happens only
     * after the new record has been written, and a failed save leaves the
     * retention set untouched. Records already on disk for the same logical name
     * are adopted at construction, oldest first, so retention spans restarts.
     * Saving an existing suffix again refreshes that record and makes it the
     * newest.
     */
    class RollingSaver final : public ISaver {
    public:
        RollingSaver(std::unique_ptr<ISaver> inner, size_t keep);

        std::expected<std::filesystem::path, std::string> save(const std::string& suffix) override;

        [[nodiscard]] const std::filesystem::path& directory() const override { return inner_->directory(); }
        [[nodiscard]] const std::string& filename() const override { return inner_->filename(); }

        [[nodiscard]] size_t keep() const { return keep_; }
        [[nodiscard]] const std::deque<std::filesystem::path>& records() const { return records_; }

    private:
        void evict();

        std::unique_ptr<ISaver> inner_;
        size_t keep_;
        std::deque<std::filesystem::path> records_;
    };

} // namespace laia::training
