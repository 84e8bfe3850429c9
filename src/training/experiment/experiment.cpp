/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "experiment/experiment.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"

namespace laia::training {

    namespace {
        constexpr uint32_t METRICS_MAGIC = 0x4C414D54; // "LAMT"
        constexpr uint32_t METRICS_VERSION = 1;
    } // namespace

    Experiment::Experiment(std::string name,
                           Trainer& trainer,
                           Evaluator& evaluator,
                           Module& model,
                           IOptimizer& optimizer,
                           ExponentialLR* scheduler,
                           ExperimentOptions options)
        : name_(std::move(name)),
          trainer_(trainer),
          evaluator_(evaluator),
          model_(model),
          optimizer_(optimizer),
          scheduler_(scheduler),
          options_(options) {
        if (options_.valid_every == 0) {
            throw std::invalid_argument("valid_every must be positive");
        }
        for (const char* metric_name : {TRAIN_LOSS, VALID_LOSS, VALID_CER, VALID_WER}) {
            metrics_.emplace(metric_name, MetricStream(metric_name));
        }
        trainer_.add_epoch_callback([this](Engine& engine) { on_epoch_complete(engine); });
    }

    const MetricStream& Experiment::metric(const std::string& name) const {
        const auto it = metrics_.find(name);
        if (it == metrics_.end()) {
            throw std::out_of_range("Unknown metric: " + name);
        }
        return it->second;
    }

    MetricStream& Experiment::stream(const std::string& name) {
        return metrics_.at(name);
    }

    void Experiment::on_epoch_complete(const Engine& engine) {
        const uint64_t epoch = engine.epochs().value();
        const double train_loss = trainer_.loss_meter().value();
        stream(TRAIN_LOSS).append(train_loss);

        const bool validate = epoch % options_.valid_every == 0;
        if (validate) {
            evaluator_.run();
            stream(VALID_LOSS).append(evaluator_.loss_meter().value());
            stream(VALID_CER).append(evaluator_.error_meter().cer());
            stream(VALID_WER).append(evaluator_.error_meter().wer());
        }

        const double lr = optimizer_.get_lr();
        if (scheduler_) {
            scheduler_->step();
        }

        if (validate) {
            LOG_INFO("[{}] Epoch {}: train loss {:.5f} | valid loss {:.5f} | CER {:.2f}% | WER {:.2f}% | lr {:.3e} | {:.2f}s",
                     trainer_.name(), epoch, train_loss,
                     evaluator_.loss_meter().value(),
                     evaluator_.error_meter().cer() * 100.0,
                     evaluator_.error_meter().wer() * 100.0,
                     lr, trainer_.timer().seconds());
        } else {
            LOG_INFO("[{}] Epoch {}: train loss {:.5f} | lr {:.3e} | {:.2f}s",
                     trainer_.name(), epoch, train_loss, lr, trainer_.timer().seconds());
        }
    }

    StateArchive Experiment::state() const {
        StateArchive archive;
        archive.epoch = trainer_.epochs().value();
        archive.iteration = trainer_.iterations().value();

        archive.write("trainer", [&](std::ostream& os) { trainer_.serialize(os); });
        archive.write("evaluator", [&](std::ostream& os) { evaluator_.serialize(os); });
        archive.write("metrics", [&](std::ostream& os) {
            core::write_pod(os, METRICS_MAGIC);
            core::write_pod(os, METRICS_VERSION);
            core::write_pod(os, static_cast<uint32_t>(metrics_.size()));
            for (const auto& [name, metric] : metrics_) {
                core::write_string(os, name);
                metric.serialize(os);
            }
        });
        archive.write("model", [&](std::ostream& os) { model_.serialize(os); });
        archive.write("gradients", [&](std::ostream& os) { model_.serialize_gradients(os); });
        archive.write("optimizer", [&](std::ostream& os) { optimizer_.serialize(os); });
        if (scheduler_) {
            archive.write("scheduler", [&](std::ostream& os) { scheduler_->serialize(os); });
        }
        return archive;
    }

    StateArchive Experiment::model_state() const {
        StateArchive archive;
        archive.epoch = trainer_.epochs().value();
        archive.iteration = trainer_.iterations().value();
        archive.write("model", [&](std::ostream& os) { model_.serialize(os); });
        return archive;
    }

    LoadReport Experiment::load_state(const StateArchive& archive) {
        archive.read("trainer", [&](std::istream& is) { trainer_.deserialize(is); });

        if (archive.contains("evaluator")) {
            archive.read("evaluator", [&](std::istream& is) { evaluator_.deserialize(is); });
        } else {
            LOG_WARN("[{}] No evaluator state in checkpoint", name_);
        }

        if (archive.contains("metrics")) {
            archive.read("metrics", [&](std::istream& is) {
                core::expect_header(is, METRICS_MAGIC, METRICS_VERSION, "metrics");
                const auto count = core::read_pod<uint32_t>(is);
                for (uint32_t i = 0; i < count; ++i) {
                    const auto metric_name = core::read_string(is);
                    const auto it = metrics_.find(metric_name);
                    if (it == metrics_.end()) {
                        MetricStream ignored(metric_name);
                        ignored.deserialize(is);
                        LOG_WARN("[{}] Ignoring unknown metric '{}' from checkpoint", name_, metric_name);
                        continue;
                    }
                    it->second.deserialize(is);
                }
            });
        } else {
            LOG_WARN("[{}] No metric history in checkpoint", name_);
        }

        LoadReport report;
        archive.read("model", [&](std::istream& is) { report = model_.deserialize(is, false); });

        if (archive.contains("gradients")) {
            archive.read("gradients", [&](std::istream& is) { model_.deserialize_gradients(is); });
        } else {
            model_.zero_grad();
            if (trainer_.window_open()) {
                LOG_WARN("[{}] Checkpoint taken inside an update window has no gradients, "
                         "the open window restarts from zero", name_);
            }
        }

        if (archive.contains("optimizer")) {
            archive.read("optimizer", [&](std::istream& is) { optimizer_.deserialize(is); });
        } else {
            LOG_WARN("[{}] No optimizer state in checkpoint, keeping fresh optimizer", name_);
        }

        if (scheduler_) {
            if (archive.contains("scheduler")) {
                archive.read("scheduler", [&](std::istream& is) { scheduler_->deserialize(is); });
            } else {
                LOG_WARN("[{}] No scheduler state in checkpoint", name_);
            }
        }

        LOG_INFO("[{}] Restored state at epoch {} (iteration {})", name_,
                 trainer_.epochs().value(), trainer_.iterations().value());
        return report;
    }

    EngineState Experiment::run() {
        LOG_INFO("[{}] Starting at epoch {}", name_, trainer_.epochs().value());
        const auto state = trainer_.run();
        LOG_INFO("[{}] Finished: {} after {} epochs", name_, to_string(state), trainer_.epochs().value());
        return state;
    }

} // namespace laia::training
