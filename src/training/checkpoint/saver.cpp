/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint/saver.hpp"
#include "checkpoint/resolver.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

namespace laia::training {

    namespace fs = std::filesystem;

    namespace {
        std::string utc_timestamp() {
            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            gmtime_r(&now, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
            return buf;
        }
    } // namespace

    CheckpointSaver::CheckpointSaver(fs::path directory, std::string filename, const CheckpointKind kind)
        : directory_(std::move(directory)),
          filename_(std::move(filename)),
          kind_(kind) {
        if (filename_.empty()) {
            throw std::invalid_argument("Checkpoint filename must not be empty");
        }
    }

    std::expected<fs::path, std::string> CheckpointSaver::save(const StateArchive& archive, const std::string& suffix) const {
        if (suffix.empty()) {
            return std::unexpected("Checkpoint suffix must not be empty");
        }
        const auto path = directory_ / (filename_ + "-" + suffix);

        auto metadata = metadata_;
        metadata["suffix"] = suffix;
        metadata["created"] = utc_timestamp();
        metadata["kind"] = to_string(kind_);

        if (auto result = write_checkpoint(path, kind_, archive, metadata); !result) {
            LOG_ERROR("Failed to save {} checkpoint {}: {}", to_string(kind_), core::path_to_utf8(path), result.error());
            return std::unexpected(result.error());
        }
        LOG_INFO("Saved {} checkpoint {} (epoch {})", to_string(kind_), core::path_to_utf8(path), archive.epoch);
        return path;
    }

    StateCheckpointSaver::StateCheckpointSaver(fs::path directory, std::string filename, StateProvider provider)
        : writer_(std::move(directory), std::move(filename), CheckpointKind::STATE),
          provider_(std::move(provider)) {
        if (!provider_) {
            throw std::invalid_argument("StateCheckpointSaver requires a state provider");
        }
    }

    std::expected<fs::path, std::string> StateCheckpointSaver::save(const std::string& suffix) {
        StateArchive archive;
        try {
            archive = provider_();
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Collecting state failed: ") + e.what());
        }
        return writer_.save(archive, suffix);
    }

    ModelCheckpointSaver::ModelCheckpointSaver(fs::path directory, std::string filename, StateProvider provider)
        : writer_(std::move(directory), std::move(filename), CheckpointKind::MODEL),
          provider_(std::move(provider)) {
        if (!provider_) {
            throw std::invalid_argument("ModelCheckpointSaver requires a state provider");
        }
    }

    std::expected<fs::path, std::string> ModelCheckpointSaver::save(const std::string& suffix) {
        StateArchive model_only;
        try {
            const auto full = provider_();
            model_only.epoch = full.epoch;
            model_only.iteration = full.iteration;
            model_only.put("model", full.get("model"));
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Collecting model state failed: ") + e.what());
        }
        return writer_.save(model_only, suffix);
    }

    RollingSaver::RollingSaver(std::unique_ptr<ISaver> inner, const size_t keep)
        : inner_(std::move(inner)),
          keep_(keep) {
        if (!inner_) {
            throw std::invalid_argument("RollingSaver requires a saver");
        }
        if (keep_ == 0) {
            throw std::invalid_argument("RollingSaver keep must be positive");
        }

        const auto existing = CheckpointResolver::list(inner_->directory(), glob_escape(inner_->filename()) + "-*");
        records_.assign(existing.begin(), existing.end());
        if (!records_.empty()) {
            LOG_INFO("Adopted {} existing '{}' checkpoints (keep={})", records_.size(), inner_->filename(), keep_);
        }
    }

    std::expected<fs::path, std::string> RollingSaver::save(const std::string& suffix) {
        auto result = inner_->save(suffix);
        if (!result) {
            return result;
        }

        const auto& path = *result;
        records_.erase(std::remove(records_.begin(), records_.end(), path), records_.end());
        records_.push_back(path);
        evict();
        return result;
    }

    void RollingSaver::evict() {
        while (records_.size() > keep_) {
            const auto oldest = records_.front();
            records_.pop_front();
            if (core::safe_remove(oldest)) {
                LOG_INFO("Evicted checkpoint {}", core::path_to_utf8(oldest));
            } else if (core::safe_exists(oldest)) {
                LOG_WARN("Could not delete evicted checkpoint {}", core::path_to_utf8(oldest));
            }
        }
    }

} // namespace laia::training
