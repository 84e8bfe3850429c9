/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <nlohmann/json.hpp>

namespace laia::core::param {

    namespace {
        template <typename T>
        void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
            if (const auto it = j.find(key); it != j.end()) {
                if (it->is_null()) {
                    out.reset();
                } else {
                    out = it->get<T>();
                }
            }
        }

        template <typename T>
        void write_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
            if (value) {
                j[key] = *value;
            } else {
                j[key] = nullptr;
            }
        }

        // Unsigned fields are read as signed first so "-1" is rejected instead of wrapping
        size_t read_count(const nlohmann::json& j, const char* key, const size_t fallback) {
            const auto it = j.find(key);
            if (it == j.end()) {
                return fallback;
            }
            const auto value = it->get<int64_t>();
            if (value < 0) {
                throw std::invalid_argument(std::string("'") + key + "' must not be negative");
            }
            return static_cast<size_t>(value);
        }
    } // namespace

    nlohmann::json OptimizationParameters::to_json() const {
        nlohmann::json j;
        j["learning_rate"] = learning_rate;
        j["momentum"] = momentum;
        j["lr_decay"] = lr_decay;
        j["batch_size"] = batch_size;
        j["iterations_per_update"] = iterations_per_update;
        write_optional(j, "max_epochs", max_epochs);
        write_optional(j, "early_stop_epochs", early_stop_epochs);
        j["valid_every"] = valid_every;
        return j;
    }

    OptimizationParameters OptimizationParameters::from_json(const nlohmann::json& j) {
        OptimizationParameters p;
        p.learning_rate = j.value("learning_rate", p.learning_rate);
        p.momentum = j.value("momentum", p.momentum);
        p.lr_decay = j.value("lr_decay", p.lr_decay);
        p.batch_size = read_count(j, "batch_size", p.batch_size);
        p.iterations_per_update = read_count(j, "iterations_per_update", p.iterations_per_update);
        read_optional(j, "max_epochs", p.max_epochs);
        read_optional(j, "early_stop_epochs", p.early_stop_epochs);
        p.valid_every = read_count(j, "valid_every", p.valid_every);
        return p;
    }

    nlohmann::json CheckpointParameters::to_json() const {
        nlohmann::json j;
        j["output_dir"] = path_to_utf8(output_dir);
        j["experiment_name"] = experiment_name;
        j["model_filename"] = model_filename;
        j["checkpoint_keep"] = checkpoint_keep;
        write_optional(j, "save_every", save_every);
        j["best_metric"] = best_metric;
        write_optional(j, "resume_pattern", resume_pattern);
        return j;
    }

    CheckpointParameters CheckpointParameters::from_json(const nlohmann::json& j) {
        CheckpointParameters p;
        if (j.contains("output_dir")) {
            p.output_dir = j["output_dir"].get<std::string>();
        }
        p.experiment_name = j.value("experiment_name", p.experiment_name);
        p.model_filename = j.value("model_filename", p.model_filename);
        p.checkpoint_keep = read_count(j, "checkpoint_keep", p.checkpoint_keep);
        read_optional(j, "save_every", p.save_every);
        p.best_metric = j.value("best_metric", p.best_metric);
        read_optional(j, "resume_pattern", p.resume_pattern);
        return p;
    }

    nlohmann::json DataParameters::to_json() const {
        nlohmann::json j;
        j["seed"] = seed;
        j["num_workers"] = num_workers;
        j["prefetch_batches"] = prefetch_batches;
        j["train_samples"] = train_samples;
        j["valid_samples"] = valid_samples;
        write_optional(j, "samples_per_epoch", samples_per_epoch);
        j["feature_dim"] = feature_dim;
        j["num_symbols"] = num_symbols;
        j["word_delimiters"] = word_delimiters;
        return j;
    }

    DataParameters DataParameters::from_json(const nlohmann::json& j) {
        DataParameters p;
        p.seed = j.value("seed", p.seed);
        p.num_workers = read_count(j, "num_workers", p.num_workers);
        p.prefetch_batches = read_count(j, "prefetch_batches", p.prefetch_batches);
        p.train_samples = read_count(j, "train_samples", p.train_samples);
        p.valid_samples = read_count(j, "valid_samples", p.valid_samples);
        read_optional(j, "samples_per_epoch", p.samples_per_epoch);
        p.feature_dim = read_count(j, "feature_dim", p.feature_dim);
        p.num_symbols = read_count(j, "num_symbols", p.num_symbols);
        p.word_delimiters = j.value("word_delimiters", p.word_delimiters);
        return p;
    }

    nlohmann::json TrainingParameters::to_json() const {
        nlohmann::json j;
        j["optimization"] = optimization.to_json();
        j["checkpoint"] = checkpoint.to_json();
        j["data"] = data.to_json();
        return j;
    }

    TrainingParameters TrainingParameters::from_json(const nlohmann::json& j) {
        TrainingParameters p;
        if (j.contains("optimization")) {
            p.optimization = OptimizationParameters::from_json(j["optimization"]);
        }
        if (j.contains("checkpoint")) {
            p.checkpoint = CheckpointParameters::from_json(j["checkpoint"]);
        }
        if (j.contains("data")) {
            p.data = DataParameters::from_json(j["data"]);
        }
        return p;
    }

    std::expected<void, std::string> TrainingParameters::validate() const {
        const auto& opt = optimization;
        const auto& ckpt = checkpoint;

        if (opt.batch_size == 0) {
            return std::unexpected("batch_size must be greater than 0");
        }
        if (opt.iterations_per_update == 0) {
            return std::unexpected("iterations_per_update must be greater than 0");
        }
        if (opt.valid_every == 0) {
            return std::unexpected("valid_every must be greater than 0");
        }
        if (!(opt.lr_decay > 0.0f)) {
            return std::unexpected("lr_decay must be greater than 0");
        }
        if (opt.max_epochs && *opt.max_epochs <= 0) {
            return std::unexpected("max_epochs must be greater than 0 when set");
        }
        if (opt.early_stop_epochs && *opt.early_stop_epochs <= 0) {
            return std::unexpected("early_stop_epochs must be greater than 0 when set");
        }
        if (ckpt.checkpoint_keep == 0) {
            return std::unexpected("checkpoint_keep must be greater than 0");
        }
        if (ckpt.save_every && *ckpt.save_every <= 0) {
            return std::unexpected("save_every must be greater than 0 when set");
        }
        if (ckpt.best_metric != "valid_cer" && ckpt.best_metric != "valid_wer") {
            return std::unexpected("best_metric must be 'valid_cer' or 'valid_wer', got '" + ckpt.best_metric + "'");
        }
        if (ckpt.experiment_name.empty() || ckpt.model_filename.empty()) {
            return std::unexpected("experiment_name and model_filename must not be empty");
        }
        if (data.num_symbols < 2) {
            return std::unexpected("num_symbols must be at least 2 (blank plus one symbol)");
        }
        if (data.feature_dim == 0) {
            return std::unexpected("feature_dim must be greater than 0");
        }
        if (data.train_samples == 0 || data.valid_samples == 0) {
            return std::unexpected("train_samples and valid_samples must be greater than 0");
        }
        if (data.samples_per_epoch && *data.samples_per_epoch == 0) {
            return std::unexpected("samples_per_epoch must be greater than 0 when set");
        }
        for (const int symbol : data.word_delimiters) {
            if (symbol <= 0 || static_cast<size_t>(symbol) >= data.num_symbols) {
                return std::unexpected("word delimiter " + std::to_string(symbol) + " is not a valid symbol");
            }
        }
        return {};
    }

    std::expected<TrainingParameters, std::string> load_parameters(const std::filesystem::path& path) {
        std::ifstream file;
        if (!open_file_for_read(path, file)) {
            return std::unexpected("Failed to open config: " + path_to_utf8(path));
        }

        try {
            const auto j = nlohmann::json::parse(file);
            auto params = TrainingParameters::from_json(j);
            LOG_DEBUG("Loaded parameters from {}", path_to_utf8(path));
            return params;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Invalid config ") + path_to_utf8(path) + ": " + e.what());
        }
    }

} // namespace laia::core::param
