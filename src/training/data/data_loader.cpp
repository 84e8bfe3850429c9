/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "data/data_loader.hpp"
#include "core/logger.hpp"
#include "core/seed.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace laia::training {

    DataLoader::DataLoader(const Dataset& dataset, DataLoaderOptions options, SampleTransform transform)
        : dataset_(dataset),
          options_(options),
          transform_(std::move(transform)) {
        if (options_.batch_size == 0) {
            throw std::invalid_argument("DataLoader batch_size must be greater than 0");
        }
        if (options_.samples_per_epoch && *options_.samples_per_epoch == 0) {
            throw std::invalid_argument("DataLoader samples_per_epoch must be greater than 0 when set");
        }
        if (dataset_.size() == 0) {
            throw std::invalid_argument("DataLoader requires a non-empty dataset");
        }
        options_.prefetch_batches = std::max<size_t>(options_.prefetch_batches, 1);
    }

    DataLoader::~DataLoader() { stop_workers(); }

    uint64_t DataLoader::shuffle_seed(const uint64_t root_seed, const uint64_t epoch) {
        return core::derive_seed(core::derive_seed(root_seed, 0), epoch);
    }

    uint64_t DataLoader::worker_seed(const uint64_t root_seed, const uint64_t epoch, const size_t worker) {
        return core::derive_seed(core::derive_seed(root_seed, worker + 1), epoch);
    }

    size_t DataLoader::samples_per_epoch() const {
        return options_.samples_per_epoch.value_or(dataset_.size());
    }

    size_t DataLoader::batches_per_epoch() const {
        return (samples_per_epoch() + options_.batch_size - 1) / options_.batch_size;
    }

    std::vector<std::vector<size_t>> DataLoader::plan_epoch(const uint64_t epoch) const {
        const size_t total = samples_per_epoch();
        const size_t n = dataset_.size();

        std::vector<size_t> order;
        order.reserve(total);
        std::mt19937_64 rng(shuffle_seed(options_.seed, epoch));

        // A budget larger than the dataset draws further full passes
        std::vector<size_t> pass(n);
        while (order.size() < total) {
            std::iota(pass.begin(), pass.end(), size_t{0});
            if (options_.shuffle) {
                std::shuffle(pass.begin(), pass.end(), rng);
            }
            const size_t take = std::min(n, total - order.size());
            order.insert(order.end(), pass.begin(), pass.begin() + static_cast<std::ptrdiff_t>(take));
        }

        std::vector<std::vector<size_t>> batches;
        for (size_t start = 0; start < order.size(); start += options_.batch_size) {
            const size_t end = std::min(order.size(), start + options_.batch_size);
            batches.emplace_back(order.begin() + static_cast<std::ptrdiff_t>(start),
                                 order.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return batches;
    }

    Batch DataLoader::build_batch(const size_t batch_index, std::mt19937_64& rng) const {
        Batch batch;
        batch.index = batch_index;
        const auto& indices = plan_[batch_index];
        batch.samples.reserve(indices.size());
        batch.ids.reserve(indices.size());
        for (const size_t idx : indices) {
            auto sample = dataset_.get(idx);
            if (transform_) {
                transform_(sample, rng);
            }
            batch.ids.push_back(sample.id);
            batch.samples.push_back(std::move(sample));
        }
        return batch;
    }

    void DataLoader::start_epoch(const uint64_t epoch) {
        stop_workers();

        plan_ = plan_epoch(epoch);
        next_batch_ = 0;
        ready_.clear();
        worker_error_ = nullptr;
        stop_ = false;

        if (options_.num_workers == 0) {
            inline_rng_.seed(worker_seed(options_.seed, epoch, 0));
            return;
        }

        const size_t num_workers = std::min(options_.num_workers, std::max<size_t>(plan_.size(), 1));
        LOG_DEBUG("Epoch {}: {} batches, {} worker threads", epoch, plan_.size(), num_workers);
        for (size_t w = 0; w < num_workers; ++w) {
            workers_.emplace_back(&DataLoader::worker_thread, this, w, num_workers, epoch);
        }
    }

    std::optional<Batch> DataLoader::next() {
        if (next_batch_ >= plan_.size()) {
            return std::nullopt;
        }

        if (workers_.empty()) {
            return build_batch(next_batch_++, inline_rng_);
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_ready_.wait(lock, [this] { return worker_error_ || ready_.contains(next_batch_); });
        if (worker_error_) {
            std::rethrow_exception(worker_error_);
        }

        auto node = ready_.extract(next_batch_);
        ++next_batch_;
        lock.unlock();
        cv_space_.notify_all();
        return std::move(node.mapped());
    }

    void DataLoader::worker_thread(const size_t worker, const size_t num_workers, const uint64_t epoch) {
        std::mt19937_64 rng(worker_seed(options_.seed, epoch, worker));

        for (size_t b = worker; b < plan_.size(); b += num_workers) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_space_.wait(lock, [&] { return stop_ || b < next_batch_ + options_.prefetch_batches; });
                if (stop_) {
                    return;
                }
            }

            try {
                auto batch = build_batch(b, rng);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ready_.emplace(b, std::move(batch));
                }
                cv_ready_.notify_all();
            } catch (const std::exception& e) {
                LOG_ERROR("Data worker {} failed on batch {}: {}", worker, b, e.what());
                record_worker_error(std::current_exception());
                return;
            } catch (...) {
                LOG_ERROR("Data worker {} failed on batch {}: non-standard exception", worker, b);
                record_worker_error(std::current_exception());
                return;
            }
        }
    }

    void DataLoader::record_worker_error(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!worker_error_) {
                worker_error_ = std::move(error);
            }
        }
        cv_ready_.notify_all();
    }

    void DataLoader::stop_workers() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_space_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) {
                w.join();
            }
        }
        workers_.clear();
    }

} // namespace laia::training
