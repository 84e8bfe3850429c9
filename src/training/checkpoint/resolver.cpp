/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint/resolver.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace laia::training {

    namespace fs = std::filesystem;

    namespace {
        bool is_digit(const char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        // Matches one bracket expression at pattern[p]; advances p past it
        bool match_bracket(std::string_view pattern, size_t& p, const char c) {
            size_t i = p + 1;
            bool negate = false;
            if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
                negate = true;
                ++i;
            }
            bool matched = false;
            bool first = true;
            while (i < pattern.size() && (first || pattern[i] != ']')) {
                first = false;
                if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                    if (pattern[i] <= c && c <= pattern[i + 2]) matched = true;
                    i += 3;
                } else {
                    if (pattern[i] == c) matched = true;
                    ++i;
                }
            }
            if (i >= pattern.size()) {
                // Unterminated: treat '[' as a literal
                p += 1;
                return c == '[';
            }
            p = i + 1;
            return matched != negate;
        }
    } // namespace

    bool glob_match(std::string_view pattern, std::string_view name) {
        size_t p = 0, n = 0;
        size_t star_p = std::string_view::npos, star_n = 0;

        while (n < name.size()) {
            if (p < pattern.size()) {
                const char pc = pattern[p];
                if (pc == '*') {
                    star_p = p++;
                    star_n = n;
                    continue;
                }
                if (pc == '?') {
                    ++p;
                    ++n;
                    continue;
                }
                if (pc == '[') {
                    size_t next = p;
                    if (match_bracket(pattern, next, name[n])) {
                        p = next;
                        ++n;
                        continue;
                    }
                } else if (pc == '\\' && p + 1 < pattern.size()) {
                    if (pattern[p + 1] == name[n]) {
                        p += 2;
                        ++n;
                        continue;
                    }
                } else if (pc == name[n]) {
                    ++p;
                    ++n;
                    continue;
                }
            }
            if (star_p == std::string_view::npos) {
                return false;
            }
            // Backtrack: let the last '*' absorb one more character
            p = star_p + 1;
            n = ++star_n;
        }
        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    bool natural_less(std::string_view a, std::string_view b) {
        size_t i = 0, j = 0;
        while (i < a.size() && j < b.size()) {
            if (is_digit(a[i]) && is_digit(b[j])) {
                size_t ei = i, ej = j;
                while (ei < a.size() && is_digit(a[ei])) ++ei;
                while (ej < b.size() && is_digit(b[ej])) ++ej;

                // Compare by value: strip leading zeros, then length, then digits
                size_t si = i, sj = j;
                while (si + 1 < ei && a[si] == '0') ++si;
                while (sj + 1 < ej && b[sj] == '0') ++sj;
                const auto da = a.substr(si, ei - si);
                const auto db = b.substr(sj, ej - sj);
                if (da.size() != db.size()) return da.size() < db.size();
                if (da != db) return da < db;
                i = ei;
                j = ej;
            } else {
                if (a[i] != b[j]) return a[i] < b[j];
                ++i;
                ++j;
            }
        }
        return (a.size() - i) < (b.size() - j);
    }

    std::string glob_escape(std::string_view literal) {
        std::string out;
        out.reserve(literal.size());
        for (const char c : literal) {
            if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        return out;
    }

    const char* to_string(const ResolveOutcome outcome) {
        switch (outcome) {
        case ResolveOutcome::NoMatch: return "no match";
        case ResolveOutcome::Unique: return "unique";
        case ResolveOutcome::Multiple: return "multiple";
        }
        return "unknown";
    }

    std::vector<fs::path> CheckpointResolver::list(const fs::path& dir, const std::string& name_pattern) {
        struct Candidate {
            fs::path path;
            std::string name;
            fs::file_time_type mtime;
        };

        std::vector<Candidate> found;
        if (!core::safe_is_directory(dir)) {
            return {};
        }

        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            if (!core::safe_is_regular_file(entry.path())) {
                continue;
            }
            auto name = entry.path().filename().string();
            if (name.ends_with(".tmp") || !glob_match(name_pattern, name)) {
                continue;
            }
            std::error_code time_ec;
            const auto mtime = fs::last_write_time(entry.path(), time_ec);
            if (time_ec) {
                LOG_WARN("Skipping {}: {}", core::path_to_utf8(entry.path()), time_ec.message());
                continue;
            }
            found.push_back({entry.path(), std::move(name), mtime});
        }
        if (ec) {
            LOG_WARN("Listing {} failed: {}", core::path_to_utf8(dir), ec.message());
        }

        std::sort(found.begin(), found.end(), [](const Candidate& a, const Candidate& b) {
            if (a.mtime != b.mtime) return a.mtime < b.mtime;
            if (natural_less(a.name, b.name)) return true;
            if (natural_less(b.name, a.name)) return false;
            return a.name < b.name;
        });

        std::vector<fs::path> out;
        out.reserve(found.size());
        for (auto& c : found) {
            out.push_back(std::move(c.path));
        }
        return out;
    }

    Resolution CheckpointResolver::resolve(const std::string& pattern, const fs::path& base_dir) {
        const fs::path as_path(pattern);
        const fs::path dir = as_path.has_parent_path()
                                 ? (as_path.is_absolute() ? as_path.parent_path() : base_dir / as_path.parent_path())
                                 : base_dir;
        const auto name_pattern = as_path.filename().string();

        Resolution resolution;
        resolution.candidates = list(dir, name_pattern);

        if (resolution.candidates.empty()) {
            resolution.outcome = ResolveOutcome::NoMatch;
            LOG_INFO("No checkpoint matches '{}' in {}", name_pattern, core::path_to_utf8(dir));
            return resolution;
        }

        resolution.selected = resolution.candidates.back();
        if (resolution.candidates.size() == 1) {
            resolution.outcome = ResolveOutcome::Unique;
            LOG_INFO("Checkpoint '{}' resolved to {}", name_pattern, core::path_to_utf8(*resolution.selected));
        } else {
            resolution.outcome = ResolveOutcome::Multiple;
            LOG_INFO("Checkpoint '{}' matched {} files, picked the most recent: {}",
                     name_pattern, resolution.candidates.size(), core::path_to_utf8(*resolution.selected));
            for (const auto& c : resolution.candidates) {
                LOG_DEBUG("  candidate: {}", core::path_to_utf8(c));
            }
        }
        return resolution;
    }

} // namespace laia::training
