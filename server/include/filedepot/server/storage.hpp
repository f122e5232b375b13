/**
 * FileDepot - Server-side storage namespace.
 *
 * Current files live directly under the root. Uploads are written to a
 * temporary file under .incoming/ and promoted by rename once verified.
 * Archived versions of a file live under .versions/<filename>/ next to an
 * append-only manifest.json describing them, oldest first.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "filedepot/error_codes.hpp"
#include "filedepot/logger.hpp"
#include "filedepot/protocol.hpp"

namespace filedepot::server
{

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(filedepot::ErrorCode code, std::string message);

        filedepot::ErrorCode code() const noexcept { return code_; }

    private:
        filedepot::ErrorCode code_;
    };

    /**
     * Append-only temporary file for one upload. Destroying it without a
     * successful commit() removes the temporary file.
     */
    class StagedUpload
    {
    public:
        StagedUpload(std::filesystem::path temp_path, std::filesystem::path final_path);
        ~StagedUpload();

        StagedUpload(const StagedUpload &) = delete;
        StagedUpload &operator=(const StagedUpload &) = delete;

        // Throws StorageError(IoError) when the write fails.
        void append(std::span<const char> data);

        // Flushes and atomically renames the temporary file onto the final path.
        void commit();

        void discard() noexcept;

        std::uint64_t bytes_written() const noexcept { return bytes_written_; }
        const std::filesystem::path &temp_path() const noexcept { return temp_path_; }
        const std::filesystem::path &final_path() const noexcept { return final_path_; }

    private:
        std::filesystem::path temp_path_;
        std::filesystem::path final_path_;
        std::ofstream out_;
        std::uint64_t bytes_written_{0};
        bool finished_{false};
    };

    // Sequential reader over one opened file, positioned at a byte offset.
    class RangeReader
    {
    public:
        explicit RangeReader(const std::filesystem::path &path);

        std::uint64_t size() const noexcept { return size_; }
        std::uint64_t remaining() const noexcept { return size_ - position_; }

        // Hash of the whole opened file; the read position is preserved.
        std::string hash();

        void seek(std::uint64_t offset);

        // Returns the number of bytes placed in buffer, 0 once the end is reached.
        std::size_t read(std::span<char> buffer);

    private:
        std::ifstream in_;
        std::uint64_t size_{0};
        std::uint64_t position_{0};
    };

    class Storage
    {
    public:
        explicit Storage(std::filesystem::path root, filedepot::Logger logger = {});

        const std::filesystem::path &root() const noexcept { return root_; }

        // Throws StorageError(InvalidRequest) for anything but a plain, visible file name.
        static void validate_filename(std::string_view filename);

        bool exists(const std::string &filename) const;

        // Path of a current file. Throws StorageError(NotFound).
        std::filesystem::path resolve(const std::string &filename) const;

        // Path of an archived version of filename. Throws StorageError(NotFound).
        std::filesystem::path resolve_version(const std::string &filename, const std::string &version) const;

        // Lowest free "<stem>_vN<ext>" with N starting at 2.
        std::string next_free_name(const std::string &filename) const;

        // Moves the current file into its archive and records it. Returns
        // nullopt when there was no current file to archive.
        std::optional<protocol::VersionRecord> archive_move(const std::string &filename);

        std::vector<protocol::VersionRecord> versions(const std::string &filename) const;

        std::vector<protocol::FileRecord> list() const;

        std::unique_ptr<StagedUpload> stage(const std::string &filename);

        std::unique_ptr<RangeReader> read_range(const std::filesystem::path &path, std::uint64_t offset = 0) const;

        std::uint64_t file_size(const std::filesystem::path &path) const;

        std::string hash(const std::filesystem::path &path) const;

        // Removes temporary uploads left behind by an earlier process.
        std::size_t purge_stale_uploads();

    private:
        std::filesystem::path archive_dir(const std::string &filename) const;
        std::vector<protocol::VersionRecord> load_manifest(const std::filesystem::path &dir) const;
        void store_manifest(const std::filesystem::path &dir, const std::vector<protocol::VersionRecord> &records) const;

        std::filesystem::path root_;
        std::filesystem::path incoming_dir_;
        std::filesystem::path versions_dir_;
        filedepot::Logger logger_;
        mutable std::mutex manifest_mutex_;
    };

} // namespace filedepot::server
