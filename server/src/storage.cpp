#include "filedepot/server/storage.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedepot/crypto.hpp"

namespace filedepot::server
{

    StorageError::StorageError(filedepot::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kIncomingDir = ".incoming";
        constexpr auto kVersionsDir = ".versions";
        constexpr auto kManifestName = "manifest.json";
        constexpr auto kUploadExtension = ".upload";
        constexpr std::size_t kMaxFilenameBytes = 255;
        // Leaves room for the random token and extension within NAME_MAX.
        constexpr std::size_t kTempPrefixBytes = 200;
        constexpr std::size_t kHashBufferSize = 64 * 1024;

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       system_clock::now());
            return static_cast<std::uint64_t>(sctp.time_since_epoch().count());
        }

        std::uint64_t unix_now()
        {
            using namespace std::chrono;
            return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
        }

        std::string utc_stamp(std::chrono::system_clock::time_point when)
        {
            const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::array<char, 32> buffer{};
            const auto length = std::strftime(buffer.data(), buffer.size(), "%Y%m%d_%H%M%S", &utc);
            return std::string(buffer.data(), length);
        }

        // Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
        std::string utf8_prefix(const std::string &value, std::size_t max_bytes)
        {
            if (value.size() <= max_bytes)
            {
                return value;
            }
            auto cut = max_bytes;
            while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80)
            {
                --cut;
            }
            return value.substr(0, cut);
        }

        StorageError io_failure(const std::string &what, const std::error_code &ec)
        {
            return StorageError(filedepot::ErrorCode::IoError, what + ": " + ec.message());
        }

    } // namespace

    StagedUpload::StagedUpload(std::filesystem::path temp_path, std::filesystem::path final_path)
        : temp_path_(std::move(temp_path)), final_path_(std::move(final_path))
    {
        out_.open(temp_path_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open())
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Cannot stage upload of " + final_path_.filename().string());
        }
    }

    StagedUpload::~StagedUpload()
    {
        discard();
    }

    void StagedUpload::append(std::span<const char> data)
    {
        if (finished_)
        {
            throw StorageError(filedepot::ErrorCode::InternalError, "Upload already finished");
        }
        out_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!out_)
        {
            throw StorageError(filedepot::ErrorCode::IoError,
                               "Write failed while receiving " + final_path_.filename().string());
        }
        bytes_written_ += data.size();
    }

    void StagedUpload::commit()
    {
        if (finished_)
        {
            throw StorageError(filedepot::ErrorCode::InternalError, "Upload already finished");
        }
        out_.flush();
        out_.close();
        if (out_.fail())
        {
            discard();
            throw StorageError(filedepot::ErrorCode::IoError, "Failed to flush upload of " + final_path_.filename().string());
        }
        std::error_code ec;
        std::filesystem::rename(temp_path_, final_path_, ec);
        if (ec)
        {
            discard();
            throw io_failure("Failed to promote " + final_path_.filename().string(), ec);
        }
        finished_ = true;
    }

    void StagedUpload::discard() noexcept
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        if (out_.is_open())
        {
            out_.close();
        }
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }

    RangeReader::RangeReader(const std::filesystem::path &path)
    {
        in_.open(path, std::ios::binary);
        if (!in_.is_open())
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Cannot open " + path.filename().string());
        }
        in_.seekg(0, std::ios::end);
        const auto end = in_.tellg();
        if (end < 0)
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Cannot size " + path.filename().string());
        }
        size_ = static_cast<std::uint64_t>(end);
        in_.seekg(0, std::ios::beg);
    }

    std::string RangeReader::hash()
    {
        in_.clear();
        in_.seekg(0, std::ios::beg);
        crypto::Sha256 digest;
        std::vector<char> buffer(kHashBufferSize);
        std::uint64_t left = size_;
        while (left > 0)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), left));
            in_.read(buffer.data(), static_cast<std::streamsize>(want));
            const auto got = static_cast<std::size_t>(in_.gcount());
            if (got == 0)
            {
                throw StorageError(filedepot::ErrorCode::IoError, "Short read while hashing");
            }
            digest.update(std::span<const char>(buffer.data(), got));
            left -= got;
        }
        seek(position_);
        return digest.finalize();
    }

    void RangeReader::seek(std::uint64_t offset)
    {
        if (offset > size_)
        {
            throw StorageError(filedepot::ErrorCode::InvalidRequest, "Offset beyond end of file");
        }
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!in_)
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Seek failed");
        }
        position_ = offset;
    }

    std::size_t RangeReader::read(std::span<char> buffer)
    {
        if (remaining() == 0 || buffer.empty())
        {
            return 0;
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining()));
        in_.read(buffer.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in_.gcount());
        if (got == 0)
        {
            throw StorageError(filedepot::ErrorCode::IoError, "File shrank while being read");
        }
        position_ += got;
        return got;
    }

    Storage::Storage(std::filesystem::path root, filedepot::Logger logger)
        : root_(std::move(root)),
          incoming_dir_(root_ / kIncomingDir),
          versions_dir_(root_ / kVersionsDir),
          logger_(std::move(logger))
    {
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(incoming_dir_);
        std::filesystem::create_directories(versions_dir_);
        const auto purged = purge_stale_uploads();
        if (purged > 0)
        {
            logger_.warn("storage", "Removed ", purged, " stale temporary upload(s)");
        }
    }

    void Storage::validate_filename(std::string_view filename)
    {
        if (filename.empty())
        {
            throw StorageError(filedepot::ErrorCode::InvalidRequest, "Filename must not be empty");
        }
        if (filename.size() > kMaxFilenameBytes)
        {
            throw StorageError(filedepot::ErrorCode::InvalidRequest, "Filename is too long");
        }
        if (filename.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos)
        {
            throw StorageError(filedepot::ErrorCode::InvalidRequest, "Filename must be a single path component");
        }
        if (filename.front() == '.')
        {
            throw StorageError(filedepot::ErrorCode::InvalidRequest, "Filename must not start with '.'");
        }
    }

    bool Storage::exists(const std::string &filename) const
    {
        validate_filename(filename);
        std::error_code ec;
        return std::filesystem::is_regular_file(root_ / filename, ec);
    }

    std::filesystem::path Storage::resolve(const std::string &filename) const
    {
        if (!exists(filename))
        {
            throw StorageError(filedepot::ErrorCode::NotFound, "File not found: " + filename);
        }
        return root_ / filename;
    }

    std::filesystem::path Storage::resolve_version(const std::string &filename, const std::string &version) const
    {
        validate_filename(filename);
        validate_filename(version);
        const auto records = versions(filename);
        const auto match = std::find_if(records.begin(), records.end(), [&](const auto &record)
                                        { return record.filename == version; });
        const auto path = archive_dir(filename) / version;
        std::error_code ec;
        if (match == records.end() || !std::filesystem::is_regular_file(path, ec))
        {
            throw StorageError(filedepot::ErrorCode::NotFound, "Version not found: " + filename + " @ " + version);
        }
        return path;
    }

    std::string Storage::next_free_name(const std::string &filename) const
    {
        validate_filename(filename);
        const std::filesystem::path original(filename);
        const auto stem = original.stem().string();
        const auto extension = original.extension().string();
        for (std::uint64_t n = 2;; ++n)
        {
            auto candidate = stem + "_v" + std::to_string(n) + extension;
            validate_filename(candidate);
            std::error_code ec;
            if (!std::filesystem::exists(root_ / candidate, ec))
            {
                return candidate;
            }
        }
    }

    std::optional<protocol::VersionRecord> Storage::archive_move(const std::string &filename)
    {
        validate_filename(filename);
        std::lock_guard lock(manifest_mutex_);

        const auto current = root_ / filename;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(current, ec))
        {
            return std::nullopt;
        }

        const auto dir = archive_dir(filename);
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw io_failure("Cannot create archive for " + filename, ec);
        }

        const std::filesystem::path original(filename);
        const auto stem = original.stem().string() + "_" + utc_stamp(std::chrono::system_clock::now());
        const auto extension = original.extension().string();
        auto archived = stem + extension;
        for (std::uint64_t n = 2; std::filesystem::exists(dir / archived, ec); ++n)
        {
            archived = stem + "_" + std::to_string(n) + extension;
        }

        std::filesystem::rename(current, dir / archived, ec);
        if (ec == std::errc::no_such_file_or_directory)
        {
            return std::nullopt;
        }
        if (ec)
        {
            throw io_failure("Cannot archive " + filename, ec);
        }

        protocol::VersionRecord record{
            .filename = archived,
            .size = file_size(dir / archived),
            .created = unix_now(),
            .hash = hash(dir / archived),
        };
        auto records = load_manifest(dir);
        records.push_back(record);
        store_manifest(dir, records);

        logger_.info("storage", "Archived ", filename, " as ", archived);
        return record;
    }

    std::vector<protocol::VersionRecord> Storage::versions(const std::string &filename) const
    {
        validate_filename(filename);
        std::lock_guard lock(manifest_mutex_);
        return load_manifest(archive_dir(filename));
    }

    std::vector<protocol::FileRecord> Storage::list() const
    {
        std::vector<protocol::FileRecord> files;
        try
        {
            for (const auto &entry : std::filesystem::directory_iterator(root_))
            {
                const auto name = entry.path().filename().string();
                std::error_code ec;
                if (name.empty() || name.front() == '.' || !entry.is_regular_file(ec))
                {
                    continue;
                }
                protocol::FileRecord record;
                record.filename = name;
                try
                {
                    RangeReader reader(entry.path());
                    record.size = reader.size();
                    record.hash = reader.hash();
                }
                catch (const StorageError &)
                {
                    // Replaced or archived between the scan and the open.
                    if (!std::filesystem::exists(entry.path(), ec))
                    {
                        continue;
                    }
                    throw;
                }
                record.modified = to_unix_time(std::filesystem::last_write_time(entry.path()));
                record.versions = versions(name);
                files.push_back(std::move(record));
            }
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Cannot list storage: " + ex.code().message());
        }
        std::sort(files.begin(), files.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.filename < rhs.filename; });
        return files;
    }

    std::unique_ptr<StagedUpload> Storage::stage(const std::string &filename)
    {
        validate_filename(filename);
        std::error_code ec;
        std::filesystem::create_directories(incoming_dir_, ec);
        if (ec)
        {
            throw io_failure("Cannot prepare upload area", ec);
        }
        const auto temp_name =
            utf8_prefix(filename, kTempPrefixBytes) + "." + crypto::random_hex(8) + kUploadExtension;
        return std::make_unique<StagedUpload>(incoming_dir_ / temp_name, root_ / filename);
    }

    std::unique_ptr<RangeReader> Storage::read_range(const std::filesystem::path &path, std::uint64_t offset) const
    {
        auto reader = std::make_unique<RangeReader>(path);
        reader->seek(offset);
        return reader;
    }

    std::uint64_t Storage::file_size(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec == std::errc::no_such_file_or_directory)
        {
            throw StorageError(filedepot::ErrorCode::NotFound, "File not found: " + path.filename().string());
        }
        if (ec)
        {
            throw io_failure("Cannot stat " + path.filename().string(), ec);
        }
        return size;
    }

    std::string Storage::hash(const std::filesystem::path &path) const
    {
        RangeReader reader(path);
        return reader.hash();
    }

    std::size_t Storage::purge_stale_uploads()
    {
        std::size_t removed = 0;
        std::error_code ec;
        for (auto it = std::filesystem::directory_iterator(incoming_dir_, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
        {
            const auto &path = it->path();
            if (path.extension() == kUploadExtension && std::filesystem::remove(path, ec))
            {
                ++removed;
            }
        }
        if (ec)
        {
            throw io_failure("Cannot clean upload area", ec);
        }
        return removed;
    }

    std::filesystem::path Storage::archive_dir(const std::string &filename) const
    {
        return versions_dir_ / filename;
    }

    std::vector<protocol::VersionRecord> Storage::load_manifest(const std::filesystem::path &dir) const
    {
        const auto path = dir / kManifestName;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return {};
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Cannot open manifest for " + dir.filename().string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Corrupt manifest for " + dir.filename().string());
        }
        try
        {
            return json.get<std::vector<protocol::VersionRecord>>();
        }
        catch (const protocol::ProtocolError &ex)
        {
            throw StorageError(filedepot::ErrorCode::IoError, "Corrupt manifest for " + dir.filename().string() + ": " + ex.what());
        }
    }

    void Storage::store_manifest(const std::filesystem::path &dir,
                                 const std::vector<protocol::VersionRecord> &records) const
    {
        const auto target = dir / kManifestName;
        const auto temp = dir / (std::string(kManifestName) + "." + crypto::random_hex(4) + ".tmp");
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            out << nlohmann::json(records).dump(2);
            out.flush();
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(temp, ec);
                throw StorageError(filedepot::ErrorCode::IoError, "Cannot write manifest for " + dir.filename().string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::filesystem::remove(temp, ec);
            throw io_failure("Cannot replace manifest for " + dir.filename().string(), ec);
        }
    }

} // namespace filedepot::server
