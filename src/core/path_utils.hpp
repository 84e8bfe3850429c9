/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace laia::core {

    namespace fs = std::filesystem;

    /**
     * @brief Convert filesystem path to UTF-8 string for logging and metadata
     *
     * Native path encoding is UTF-8 on the platforms this project targets.
     */
    inline std::string path_to_utf8(const fs::path& p) {
        return p.string();
    }

    // Safe filesystem operations that don't throw
    inline bool safe_exists(const fs::path& path) {
        std::error_code ec;
        return fs::exists(path, ec);
    }

    inline bool safe_is_directory(const fs::path& path) {
        std::error_code ec;
        return fs::is_directory(path, ec);
    }

    inline bool safe_is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    inline bool safe_remove(const fs::path& path) {
        std::error_code ec;
        return fs::remove(path, ec) && !ec;
    }

    /**
     * @brief Open an output file stream
     *
     * @param path The filesystem path to open
     * @param mode The open mode
     * @param[out] stream Reference to store the opened ofstream
     * @return true if the file was opened successfully, false otherwise
     */
    inline bool open_file_for_write(
        const fs::path& path,
        std::ios_base::openmode mode,
        std::ofstream& stream) {
        stream.open(path, mode);
        return stream.is_open();
    }

    inline bool open_file_for_write(const fs::path& path, std::ofstream& stream) {
        return open_file_for_write(path, std::ios::out, stream);
    }

    inline bool open_file_for_read(
        const fs::path& path,
        std::ios_base::openmode mode,
        std::ifstream& stream) {
        stream.open(path, mode);
        return stream.is_open();
    }

    inline bool open_file_for_read(const fs::path& path, std::ifstream& stream) {
        return open_file_for_read(path, std::ios::in, stream);
    }

    // Sibling path used while a file is being written; never matched as a finished record
    inline fs::path staging_path(const fs::path& path) {
        auto staged = path;
        staged += ".tmp";
        return staged;
    }

    namespace detail {
        inline bool fsync_path(const fs::path& path, const int flags, std::error_code& ec) {
            const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
            if (fd < 0) {
                ec.assign(errno, std::generic_category());
                return false;
            }
            int rc;
            do {
                rc = ::fsync(fd);
            } while (rc != 0 && errno == EINTR);
            if (rc != 0) {
                ec.assign(errno, std::generic_category());
            } else {
                ec.clear();
            }
            ::close(fd);
            return rc == 0;
        }
    } // namespace detail

    // Flush a closed file's data and metadata to stable storage
    inline bool sync_file(const fs::path& path, std::error_code& ec) {
        return detail::fsync_path(path, O_RDONLY, ec);
    }

    // Persist directory entries, e.g. after a rename into the directory
    inline bool sync_directory(const fs::path& dir, std::error_code& ec) {
        return detail::fsync_path(dir.empty() ? fs::path(".") : dir, O_RDONLY | O_DIRECTORY, ec);
    }

} // namespace laia::core
