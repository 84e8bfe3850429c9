/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "metrics/meters.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace laia::training {

    namespace {
        template <typename T>
        uint64_t levenshtein(const std::vector<T>& ref, const std::vector<T>& hyp) {
            // Single-row dynamic programming over the hypothesis
            std::vector<uint64_t> row(hyp.size() + 1);
            std::iota(row.begin(), row.end(), uint64_t{0});
            for (size_t i = 1; i <= ref.size(); ++i) {
                uint64_t diag = row[0];
                row[0] = i;
                for (size_t j = 1; j <= hyp.size(); ++j) {
                    const uint64_t up = row[j];
                    const uint64_t cost = ref[i - 1] == hyp[j - 1] ? 0 : 1;
                    row[j] = std::min({row[j] + 1, row[j - 1] + 1, diag + cost});
                    diag = up;
                }
            }
            return row[hyp.size()];
        }

        struct PairErrors {
            uint64_t char_errors = 0;
            uint64_t char_total = 0;
            uint64_t word_errors = 0;
            uint64_t word_total = 0;
        };
    } // namespace

    void AverageMeter::add(const double value, const uint64_t weight) {
        sum_ += value * static_cast<double>(weight);
        count_ += weight;
    }

    void AverageMeter::reset() {
        sum_ = 0.0;
        count_ = 0;
    }

    double AverageMeter::value() const {
        return count_ == 0 ? 0.0 : sum_ / static_cast<double>(count_);
    }

    uint64_t edit_distance(const std::vector<int>& ref, const std::vector<int>& hyp) {
        return levenshtein(ref, hyp);
    }

    std::vector<std::vector<int>> split_words(const std::vector<int>& symbols, const std::set<int>& delimiters) {
        std::vector<std::vector<int>> words;
        std::vector<int> current;
        for (const int s : symbols) {
            if (delimiters.contains(s)) {
                if (!current.empty()) {
                    words.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current.push_back(s);
            }
        }
        if (!current.empty()) {
            words.push_back(std::move(current));
        }
        return words;
    }

    ErrorRateMeter::ErrorRateMeter(std::set<int> word_delimiters)
        : delimiters_(std::move(word_delimiters)) {}

    void ErrorRateMeter::add(const std::vector<std::vector<int>>& refs, const std::vector<std::vector<int>>& hyps) {
        if (refs.size() != hyps.size()) {
            throw std::invalid_argument("ErrorRateMeter: " + std::to_string(refs.size()) + " references vs " +
                                        std::to_string(hyps.size()) + " hypotheses");
        }

        std::vector<PairErrors> per_pair(refs.size());
        tbb::parallel_for(tbb::blocked_range<size_t>(0, refs.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); ++i) {
                    auto& out = per_pair[i];
                    out.char_errors = levenshtein(refs[i], hyps[i]);
                    out.char_total = refs[i].size();

                    const auto ref_words = split_words(refs[i], delimiters_);
                    const auto hyp_words = split_words(hyps[i], delimiters_);
                    out.word_errors = levenshtein(ref_words, hyp_words);
                    out.word_total = ref_words.size();
                }
            });

        for (const auto& p : per_pair) {
            char_errors_ += p.char_errors;
            char_total_ += p.char_total;
            word_errors_ += p.word_errors;
            word_total_ += p.word_total;
        }
    }

    void ErrorRateMeter::reset() {
        char_errors_ = char_total_ = word_errors_ = word_total_ = 0;
    }

    double ErrorRateMeter::cer() const {
        return char_total_ == 0 ? 0.0 : static_cast<double>(char_errors_) / static_cast<double>(char_total_);
    }

    double ErrorRateMeter::wer() const {
        return word_total_ == 0 ? 0.0 : static_cast<double>(word_errors_) / static_cast<double>(word_total_);
    }

} // namespace laia::training
