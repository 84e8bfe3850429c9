/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "data/dataset.hpp"

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace laia::training {

    /**
     * @brief Restartable producer of batches consumed by an engine.
     *
     * start_epoch() resets the source for the given epoch; next() returns batches
     * in order until the epoch's budget is exhausted.
     */
    class BatchSource {
    public:
        virtual ~BatchSource() = default;

        virtual void start_epoch(uint64_t epoch) = 0;
        virtual std::optional<Batch> next() = 0;
        [[nodiscard]] virtual size_t batches_per_epoch() const = 0;
    };

    // Per-sample augmentation run on a worker with that worker's RNG
    using SampleTransform = std::function<void(Sample&, std::mt19937_64&)>;

    struct DataLoaderOptions {
        size_t batch_size = 16;
        bool shuffle = true;
        std::optional<size_t> samples_per_epoch; // fixed sampling budget, independent of dataset size
        size_t num_workers = 2;                  // 0 = build batches on the calling thread
        size_t prefetch_batches = 4;
        uint64_t seed = 0;
    };

    /**
     * @brief Batch source with a pool of prefetching worker threads.
     *
     * Worker w builds the batches whose index is congruent to w modulo the worker
     * count, drawing augmentation randomness from its own RNG seeded with
     * worker_seed(seed, epoch, w). Batches are handed out in index order, so the
     * produced sequence does not depend on thread scheduling. Workers only touch
     * the dataset and their own RNG.
     */
    class DataLoader final : public BatchSource {
    public:
        DataLoader(const Dataset& dataset, DataLoaderOptions options, SampleTransform transform = {});
        ~DataLoader() override;

        DataLoader(const DataLoader&) = delete;
        DataLoader& operator=(const DataLoader&) = delete;

        void start_epoch(uint64_t epoch) override;
        std::optional<Batch> next() override;
        [[nodiscard]] size_t batches_per_epoch() const override;

        [[nodiscard]] size_t samples_per_epoch() const;
        [[nodiscard]] const DataLoaderOptions& options() const { return options_; }

        static uint64_t shuffle_seed(uint64_t root_seed, uint64_t epoch);
        static uint64_t worker_seed(uint64_t root_seed, uint64_t epoch, size_t worker);

    private:
        std::vector<std::vector<size_t>> plan_epoch(uint64_t epoch) const;
        Batch build_batch(size_t batch_index, std::mt19937_64& rng) const;
        void worker_thread(size_t worker, size_t num_workers, uint64_t epoch);
        void record_worker_error(std::exception_ptr error);
        void stop_workers();

        const Dataset& dataset_;
        DataLoaderOptions options_;
        SampleTransform transform_;

        std::vector<std::vector<size_t>> plan_;
        size_t next_batch_ = 0;
        std::mt19937_64 inline_rng_;

        std::vector<std::thread> workers_;
        mutable std::mutex mutex_;
        std::condition_variable cv_ready_;
        std::condition_variable cv_space_;
        std::map<size_t, Batch> ready_;
        std::exception_ptr worker_error_;
        bool stop_ = false;
    };

} // namespace laia::training
