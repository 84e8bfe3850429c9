/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <vector>

namespace laia::training {

    // Running mean of a scalar (loss per batch)
    class AverageMeter {
    public:
        void add(double value, uint64_t weight = 1);
        void reset();

        [[nodiscard]] double value() const;
        [[nodiscard]] uint64_t count() const { return count_; }

    private:
        double sum_ = 0.0;
        uint64_t count_ = 0;
    };

    class TimeMeter {
    public:
        TimeMeter() { reset(); }

        void reset() { start_ = std::chrono::steady_clock::now(); }
        [[nodiscard]] double seconds() const {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        }

    private:
        std::chrono::steady_clock::time_point start_;
    };

    /// Levenshtein distance between two symbol sequences (unit insert/delete/substitute costs)
    uint64_t edit_distance(const std::vector<int>& ref, const std::vector<int>& hyp);

    /// Split a symbol sequence into words at delimiter symbols; empty words are dropped
    std::vector<std::vector<int>> split_words(const std::vector<int>& symbols, const std::set<int>& delimiters);

    /**
     * @brief Accumulates character and word error rates over an evaluation pass.
     *
     * CER = sum(edit distance over symbols) / sum(reference symbols).
     * WER = sum(edit distance over words) / sum(reference words), where words are
     * maximal runs of non-delimiter symbols.
     */
    class ErrorRateMeter {
    public:
        explicit ErrorRateMeter(std::set<int> word_delimiters = {});

        void add(const std::vector<std::vector<int>>& refs, const std::vector<std::vector<int>>& hyps);
        void reset();

        [[nodiscard]] double cer() const;
        [[nodiscard]] double wer() const;

        [[nodiscard]] uint64_t char_errors() const { return char_errors_; }
        [[nodiscard]] uint64_t char_total() const { return char_total_; }
        [[nodiscard]] uint64_t word_errors() const { return word_errors_; }
        [[nodiscard]] uint64_t word_total() const { return word_total_; }

    private:
        std::set<int> delimiters_;
        uint64_t char_errors_ = 0;
        uint64_t char_total_ = 0;
        uint64_t word_errors_ = 0;
        uint64_t word_total_ = 0;
    };

} // namespace laia::training
