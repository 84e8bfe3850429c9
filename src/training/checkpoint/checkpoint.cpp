/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint/checkpoint.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

#include <fstream>

namespace laia::training {

    const char* to_string(const CheckpointKind kind) {
        switch (kind) {
        case CheckpointKind::STATE: return "state";
        case CheckpointKind::MODEL: return "model";
        }
        return "unknown";
    }

    namespace {
        std::expected<CheckpointHeader, std::string> read_header(std::istream& file) {
            CheckpointHeader header{};
            file.read(reinterpret_cast<char*>(&header), sizeof(header));
            if (!file) {
                return std::unexpected("Truncated checkpoint header");
            }
            if (header.magic != CHECKPOINT_MAGIC) {
                return std::unexpected("Invalid checkpoint: wrong magic");
            }
            if (header.version > CHECKPOINT_VERSION) {
                return std::unexpected("Unsupported version: " + std::to_string(header.version));
            }
            if (header.kind != CheckpointKind::STATE && header.kind != CheckpointKind::MODEL) {
                return std::unexpected("Unknown checkpoint kind: " +
                                       std::to_string(static_cast<uint32_t>(header.kind)));
            }
            return header;
        }
    } // namespace

    std::expected<void, std::string> write_checkpoint(
        const std::filesystem::path& path,
        const CheckpointKind kind,
        const StateArchive& archive,
        const nlohmann::json& metadata) {

        const auto staging = core::staging_path(path);
        try {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }

            {
                std::ofstream file;
                if (!core::open_file_for_write(staging, std::ios::binary | std::ios::trunc, file)) {
                    return std::unexpected("Failed to open: " + core::path_to_utf8(staging));
                }

                CheckpointHeader header{};
                header.kind = kind;
                header.num_sections = static_cast<uint32_t>(archive.sections().size());
                header.epoch = archive.epoch;
                header.iteration = archive.iteration;

                const auto header_pos = file.tellp();
                file.write(reinterpret_cast<const char*>(&header), sizeof(header));

                for (const auto& [name, blob] : archive.sections()) {
                    core::write_string(file, name);
                    core::write_pod(file, static_cast<uint64_t>(blob.size()));
                    file.write(blob.data(), static_cast<std::streamsize>(blob.size()));
                }

                // Metadata as JSON
                const auto meta_pos = file.tellp();
                const std::string meta_str = metadata.dump();
                file.write(meta_str.data(), static_cast<std::streamsize>(meta_str.size()));
                const auto meta_end = file.tellp();

                // Update header with JSON offset
                header.meta_json_offset = static_cast<uint64_t>(meta_pos);
                header.meta_json_size = static_cast<uint64_t>(meta_end - meta_pos);
                file.seekp(header_pos);
                file.write(reinterpret_cast<const char*>(&header), sizeof(header));

                file.flush();
                if (!file) {
                    core::safe_remove(staging);
                    return std::unexpected("Write failed: " + core::path_to_utf8(staging));
                }
            }

            std::error_code ec;
            if (!core::sync_file(staging, ec)) {
                core::safe_remove(staging);
                return std::unexpected("Failed to sync " + core::path_to_utf8(staging) + ": " + ec.message());
            }

            std::filesystem::rename(staging, path, ec);
            if (ec) {
                core::safe_remove(staging);
                return std::unexpected("Failed to move " + core::path_to_utf8(staging) + " to " +
                                       core::path_to_utf8(path) + ": " + ec.message());
            }

            // The record only counts once its directory entry is durable
            if (!core::sync_directory(path.parent_path(), ec)) {
                return std::unexpected("Failed to sync directory of " + core::path_to_utf8(path) + ": " +
                                       ec.message());
            }

            LOG_DEBUG("Checkpoint written: {} ({}, {} sections, epoch {})",
                      core::path_to_utf8(path), to_string(kind), archive.sections().size(), archive.epoch);
            return {};

        } catch (const std::exception& e) {
            core::safe_remove(staging);
            return std::unexpected(std::string("Save checkpoint failed: ") + e.what());
        }
    }

    std::expected<CheckpointHeader, std::string> read_checkpoint_header(
        const std::filesystem::path& path) {

        try {
            std::ifstream file;
            if (!core::open_file_for_read(path, std::ios::binary, file)) {
                return std::unexpected("Failed to open: " + core::path_to_utf8(path));
            }
            return read_header(file);

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Read header failed: ") + e.what());
        }
    }

    std::expected<CheckpointRecord, std::string> read_checkpoint(
        const std::filesystem::path& path) {

        try {
            std::ifstream file;
            if (!core::open_file_for_read(path, std::ios::binary, file)) {
                return std::unexpected("Failed to open: " + core::path_to_utf8(path));
            }

            auto header = read_header(file);
            if (!header) {
                return std::unexpected(header.error());
            }

            CheckpointRecord record;
            record.header = *header;
            record.archive.epoch = header->epoch;
            record.archive.iteration = header->iteration;

            for (uint32_t i = 0; i < header->num_sections; ++i) {
                auto name = core::read_string(file);
                const auto size = core::read_pod<uint64_t>(file);
                std::string blob(size, '\0');
                file.read(blob.data(), static_cast<std::streamsize>(size));
                if (!file) {
                    return std::unexpected("Truncated section '" + name + "'");
                }
                record.archive.put(name, std::move(blob));
            }

            if (header->meta_json_size > 0) {
                file.seekg(static_cast<std::streamoff>(header->meta_json_offset));
                std::string meta_str(header->meta_json_size, '\0');
                file.read(meta_str.data(), static_cast<std::streamsize>(header->meta_json_size));
                if (!file) {
                    return std::unexpected("Truncated checkpoint metadata");
                }
                record.metadata = nlohmann::json::parse(meta_str);
            }

            return record;

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Load checkpoint failed: ") + e.what());
        }
    }

} // namespace laia::training
