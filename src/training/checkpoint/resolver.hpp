/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace laia::training {

    /// Shell-style match of a file name against a pattern with '*', '?' and '[...]' ('[!...]' negates)
    bool glob_match(std::string_view pattern, std::string_view name);

    /// Ordering that compares embedded digit runs by value ("ckpt-9" < "ckpt-10")
    bool natural_less(std::string_view a, std::string_view b);

    /// Escapes glob metacharacters so a literal name can be used as a pattern prefix
    std::string glob_escape(std::string_view literal);

    enum class ResolveOutcome {
        NoMatch,
        Unique,
        Multiple
    };

    const char* to_string(ResolveOutcome outcome);

    struct Resolution {
        ResolveOutcome outcome = ResolveOutcome::NoMatch;
        std::optional<std::filesystem::path> selected; // set unless NoMatch
        std::vector<std::filesystem::path> candidates; // oldest first
    };

    /**
     * @brief Maps a resume pattern to one concrete checkpoint file.
     *
     * Candidates are the regular files of the pattern's directory whose name
     * matches the pattern's file part; staging files (".tmp") never match. They are
     * ordered by modification time, then by numeric-aware name order, then by
     * plain name order, and the last one is selected. The result does not depend
     * on directory enumeration order.
     */
    class CheckpointResolver {
    public:
        // Patterns without a directory part are looked up in base_dir
        static Resolution resolve(const std::string& pattern, const std::filesystem::path& base_dir);

        // Matching files in dir, oldest first
        static std::vector<std::filesystem::path> list(const std::filesystem::path& dir,
                                                       const std::string& name_pattern);
    };

} // namespace laia::training
