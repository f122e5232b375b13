#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include "filedepot/client/connection.hpp"
#include "filedepot/client/session.hpp"
#include "filedepot/crypto.hpp"
#include "filedepot/framing.hpp"
#include "filedepot/logger.hpp"
#include "filedepot/protocol.hpp"
#include "filedepot/server/server.hpp"

using namespace filedepot;
using namespace filedepot::client;
using namespace filedepot::protocol;
using filedepot::server::Server;
using filedepot::server::ServerConfig;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string make_content(std::size_t size, unsigned seed)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>((i * 31 + seed * 7 + (i >> 8)) & 0xFF);
        }
        return content;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::string sha256_of(const std::string &content)
    {
        return crypto::hash_bytes(std::as_bytes(std::span<const char>(content.data(), content.size())));
    }

    template <typename Predicate>
    bool eventually(Predicate predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return predicate();
    }

    class TestServer
    {
    public:
        explicit TestServer(const std::string &name, std::chrono::seconds idle_timeout = std::chrono::seconds(300))
            : root_(std::filesystem::temp_directory_path() / name)
        {
            cleanup_path(root_);
            ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = root_ / "storage";
            config.worker_threads = 2;
            config.idle_timeout = idle_timeout;
            config.chunk_size = 4096;
            server_ = std::make_unique<Server>(std::move(config), Logger{});
            thread_ = std::thread([this]
                                  { server_->run(); });
        }

        ~TestServer()
        {
            server_->stop();
            thread_.join();
            server_.reset();
            cleanup_path(root_);
        }

        std::uint16_t port() const { return server_->port(); }
        std::filesystem::path storage_root() const { return root_ / "storage"; }
        std::filesystem::path workspace() const { return root_; }

    private:
        std::filesystem::path root_;
        std::unique_ptr<Server> server_;
        std::thread thread_;
    };

    class RecordingProgress : public ProgressListener
    {
    public:
        void on_progress(TransferDirection, const std::string &, std::uint64_t done, std::uint64_t total) override
        {
            ++calls;
            last_done = done;
            last_total = total;
        }

        std::size_t calls{0};
        std::uint64_t last_done{0};
        std::uint64_t last_total{0};
    };

    ClientConfig client_config(const TestServer &server, const std::string &download_subdir = "downloads")
    {
        ClientConfig config;
        config.host = "127.0.0.1";
        config.port = server.port();
        config.download_dir = server.workspace() / download_subdir;
        config.connect_timeout = std::chrono::seconds(5);
        config.io_timeout = std::chrono::seconds(10);
        config.connect_attempts = 3;
        config.connect_backoff = std::chrono::milliseconds(50);
        config.transfer_attempts = 3;
        config.chunk_size = 1000;
        return config;
    }

    std::unique_ptr<Connection> raw_connection(const TestServer &server)
    {
        auto connection = std::make_unique<Connection>(std::chrono::seconds(10));
        connection->open("127.0.0.1", server.port(), std::chrono::seconds(5));
        return connection;
    }

    nlohmann::json read_message(asio::ip::tcp::socket &socket)
    {
        std::array<std::uint8_t, kFrameHeaderSize> header{};
        asio::read(socket, asio::buffer(header));
        std::vector<std::uint8_t> payload(frame_payload_size(header));
        asio::read(socket, asio::buffer(payload));
        return parse_frame_payload(payload);
    }

    void write_message(asio::ip::tcp::socket &socket, const nlohmann::json &message)
    {
        const auto frame = encode_frame(message);
        asio::write(socket, asio::buffer(frame));
    }

    constexpr std::uint64_t kWholeFile = std::numeric_limits<std::uint64_t>::max();

    /**
     * Answers one DOWNLOAD per accepted connection for a single file and hangs
     * up after the byte offset scheduled for that connection. Honors the
     * requested resume offset the same way the real server does.
     */
    class ScriptedDownloadServer
    {
    public:
        ScriptedDownloadServer(std::string content, std::vector<std::uint64_t> stop_at,
                               std::function<void()> before_final_byte = {})
            : content_(std::move(content)),
              stop_at_(std::move(stop_at)),
              before_final_byte_(std::move(before_final_byte)),
              acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        {
            thread_ = std::thread([this]
                                  { serve(); });
        }

        ~ScriptedDownloadServer()
        {
            join();
        }

        void join()
        {
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

        // Valid after join().
        const std::vector<std::uint64_t> &requested_offsets() const { return offsets_; }
        const std::string &failure() const { return failure_; }

    private:
        void serve()
        {
            try
            {
                for (const auto stop : stop_at_)
                {
                    asio::ip::tcp::socket socket(io_);
                    acceptor_.accept(socket);
                    const auto request = std::get<DownloadRequest>(decode_request(read_message(socket)));
                    const auto offset = request.resume_offset.value_or(0);
                    offsets_.push_back(offset);

                    DownloadReady ready{.filesize = content_.size(), .hash = sha256_of(content_)};
                    std::uint64_t start = 0;
                    if (offset > 0 && offset <= content_.size())
                    {
                        start = offset;
                        ready.resuming_from = offset;
                    }
                    write_message(socket, nlohmann::json(ready));
                    static_cast<void>(read_message(socket).get<TransferAck>());

                    const auto end = std::min<std::uint64_t>(stop, content_.size());
                    if (end > start)
                    {
                        const bool hold_last = end == content_.size() && before_final_byte_;
                        const auto first_part = end - start - (hold_last ? 1 : 0);
                        asio::write(socket, asio::buffer(content_.data() + start, first_part));
                        if (hold_last)
                        {
                            before_final_byte_();
                            asio::write(socket, asio::buffer(content_.data() + end - 1, 1));
                        }
                    }
                    std::error_code ec;
                    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
                    socket.close(ec);
                }
            }
            catch (const std::exception &ex)
            {
                failure_ = ex.what();
            }
        }

        std::string content_;
        std::vector<std::uint64_t> stop_at_;
        std::function<void()> before_final_byte_;
        asio::io_context io_;
        asio::ip::tcp::acceptor acceptor_;
        std::thread thread_;
        std::vector<std::uint64_t> offsets_;
        std::string failure_;
    };

    ClientConfig scripted_client_config(const ScriptedDownloadServer &server, const std::filesystem::path &download_dir,
                                        std::size_t transfer_attempts)
    {
        ClientConfig config;
        config.host = "127.0.0.1";
        config.port = server.port();
        config.download_dir = download_dir;
        config.connect_timeout = std::chrono::seconds(5);
        config.io_timeout = std::chrono::seconds(10);
        config.connect_attempts = 2;
        config.connect_backoff = std::chrono::milliseconds(20);
        config.transfer_attempts = transfer_attempts;
        config.chunk_size = 1000;
        return config;
    }

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    void test_interrupted_download_resumes_on_next_call()
    {
        const auto workspace = fresh_directory("filedepot_it_interrupted");
        const auto content = make_content(50000, 50);
        constexpr std::uint64_t kCut = 20000;
        ScriptedDownloadServer server(content, {kCut, kWholeFile});

        NullProgress progress;
        ClientSession session(scripted_client_config(server, workspace, 1), Logger{}, progress);
        session.connect();

        const auto interrupted = session.download("movie.bin");
        assert(interrupted.code == ErrorCode::ConnectionError);
        assert(interrupted.bytes_transferred == kCut);
        assert(std::filesystem::file_size(session.partial_path("movie.bin")) == kCut);
        assert(!std::filesystem::exists(workspace / "movie.bin"));

        const auto resumed = session.download("movie.bin");
        assert(resumed.ok());
        assert(resumed.bytes_transferred == content.size() - kCut);
        assert(read_file(workspace / "movie.bin") == content);
        assert(!std::filesystem::exists(session.partial_path("movie.bin")));

        session.disconnect();
        server.join();
        assert(server.failure().empty());
        assert((server.requested_offsets() == std::vector<std::uint64_t>{0, kCut}));
        cleanup_path(workspace);
    }

    void test_download_retries_within_one_call()
    {
        const auto workspace = fresh_directory("filedepot_it_retry");
        const auto content = make_content(50000, 51);
        ScriptedDownloadServer server(content, {12000, 31000, kWholeFile});

        NullProgress progress;
        ClientSession session(scripted_client_config(server, workspace, 3), Logger{}, progress);
        session.connect();

        const auto outcome = session.download("movie.bin");
        assert(outcome.ok());
        // Each attempt resumes where the previous one stopped.
        assert(outcome.bytes_transferred == content.size());
        assert(read_file(workspace / "movie.bin") == content);

        session.disconnect();
        server.join();
        assert(server.failure().empty());
        assert((server.requested_offsets() == std::vector<std::uint64_t>{0, 12000, 31000}));
        cleanup_path(workspace);
    }

    void test_unreadable_partial_reports_io_error()
    {
        const auto workspace = fresh_directory("filedepot_it_unreadable_part");
        const auto content = make_content(8000, 52);
        const auto part = workspace / "movie.bin.part";
        // The partial file disappears just before the final byte arrives.
        ScriptedDownloadServer server(content, {kWholeFile}, [&part, size = content.size()]
                                      {
            eventually([&] {
                std::error_code ec;
                return std::filesystem::file_size(part, ec) == size - 1;
            });
            std::error_code ec;
            std::filesystem::remove(part, ec); });

        NullProgress progress;
        ClientSession session(scripted_client_config(server, workspace, 3), Logger{}, progress);
        session.connect();

        const auto outcome = session.download("movie.bin");
        assert(outcome.code == ErrorCode::IoError);
        assert(!std::filesystem::exists(workspace / "movie.bin"));

        session.disconnect();
        server.join();
        assert(server.failure().empty());
        cleanup_path(workspace);
    }

    void test_list_with_undecodable_name()
    {
        TestServer server("filedepot_it_non_utf8");
        write_file(server.storage_root() / "caf\xe9.txt", "abc");
        write_file(server.storage_root() / "plain.txt", "hello");

        auto connection = raw_connection(server);
        for (int round = 0; round < 2; ++round)
        {
            connection->write_frame(encode_request(ListRequest{}));
            const auto reply = decode_reply<FileList>(connection->read_frame());
            const auto &files = std::get<FileList>(reply).files;
            assert(files.size() == 2);
            assert(std::any_of(files.begin(), files.end(), [](const auto &f)
                               { return f.filename == "caf\xEF\xBF\xBD.txt" && f.size == 3; }));
            assert(std::any_of(files.begin(), files.end(), [](const auto &f)
                               { return f.filename == "plain.txt"; }));
        }

        // Other sessions are unaffected.
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();
        assert(session.list().ok());
    }

    void test_list_empty_then_two_files()
    {
        TestServer server("filedepot_it_list");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto empty = session.list();
        assert(empty.ok());
        assert(empty.files.empty());

        const auto local = server.workspace() / "local";
        write_file(local / "a.txt", make_content(10, 1));
        write_file(local / "b.txt", make_content(20, 2));
        assert(session.upload(local / "a.txt").ok());
        assert(session.upload(local / "b.txt").ok());

        const auto listed = session.list();
        assert(listed.ok());
        assert(listed.files.size() == 2);
        const auto a = std::find_if(listed.files.begin(), listed.files.end(), [](const auto &f)
                                    { return f.filename == "a.txt"; });
        const auto b = std::find_if(listed.files.begin(), listed.files.end(), [](const auto &f)
                                    { return f.filename == "b.txt"; });
        assert(a != listed.files.end() && a->size == 10);
        assert(b != listed.files.end() && b->size == 20);
        assert(a->hash == sha256_of(make_content(10, 1)));
    }

    void test_round_trip_with_overwrite()
    {
        TestServer server("filedepot_it_overwrite");
        RecordingProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto local = server.workspace() / "local" / "data.bin";
        const auto first = make_content(150000, 3);
        write_file(local, first);
        const auto uploaded = session.upload(local, DuplicateAction::Overwrite);
        assert(uploaded.ok());
        assert(uploaded.filename == "data.bin");
        assert(uploaded.hash == sha256_of(first));
        assert(uploaded.bytes_transferred == first.size());
        assert(progress.last_done == first.size() && progress.last_total == first.size());
        assert(progress.calls > 1);

        const auto second = make_content(90000, 4);
        write_file(local, second);
        assert(session.upload(local, DuplicateAction::Overwrite).ok());

        const auto downloaded = session.download("data.bin");
        assert(downloaded.ok());
        assert(downloaded.bytes_transferred == second.size());
        assert(read_file(client_config(server).download_dir / "data.bin") == second);
        assert(!std::filesystem::exists(session.partial_path("data.bin")));
        assert(session.list().files.size() == 1);
    }

    void test_rename_keeps_original()
    {
        TestServer server("filedepot_it_rename");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto local = server.workspace() / "local" / "report.txt";
        const auto original = make_content(5000, 5);
        write_file(local, original);
        assert(session.upload(local, DuplicateAction::Rename).ok());

        const auto replacement = make_content(7000, 6);
        write_file(local, replacement);
        const auto renamed = session.upload(local, DuplicateAction::Rename);
        assert(renamed.ok());
        assert(renamed.filename == "report_v2.txt");

        write_file(local, make_content(100, 7));
        assert(session.upload(local, DuplicateAction::Rename).filename == "report_v3.txt");

        assert(read_file(server.storage_root() / "report.txt") == original);
        assert(session.download("report.txt").ok());
        assert(session.download("report_v2.txt").ok());
        const auto downloads = client_config(server).download_dir;
        assert(read_file(downloads / "report.txt") == original);
        assert(read_file(downloads / "report_v2.txt") == replacement);

        const auto listed = session.list();
        const auto entry = std::find_if(listed.files.begin(), listed.files.end(), [](const auto &f)
                                        { return f.filename == "report.txt"; });
        assert(entry != listed.files.end());
        assert(entry->hash == sha256_of(original));
    }

    void test_versioning_keeps_every_revision()
    {
        TestServer server("filedepot_it_versions");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto local = server.workspace() / "local" / "doc.txt";
        std::vector<std::string> revisions;
        for (unsigned i = 0; i < 3; ++i)
        {
            revisions.push_back(make_content(3000 + i * 100, 10 + i));
            write_file(local, revisions.back());
            const auto outcome = session.upload(local, DuplicateAction::Version);
            assert(outcome.ok());
            assert(outcome.filename == "doc.txt");
        }

        const auto listed = session.list();
        assert(listed.ok());
        assert(listed.files.size() == 1);
        const auto &record = listed.files.front();
        assert(record.hash == sha256_of(revisions[2]));
        assert(record.versions.size() == 2);
        assert(record.versions[0].filename != record.versions[1].filename);

        for (std::size_t i = 0; i < record.versions.size(); ++i)
        {
            const auto &version = record.versions[i];
            assert(version.hash == sha256_of(revisions[i]));
            const auto outcome = session.download("doc.txt", version.filename);
            assert(outcome.ok());
            assert(outcome.hash == version.hash);
            assert(read_file(client_config(server).download_dir / version.filename) == revisions[i]);
        }

        const auto current = session.download("doc.txt");
        assert(current.ok());
        assert(read_file(client_config(server).download_dir / "doc.txt") == revisions[2]);
    }

    void test_empty_file_round_trip()
    {
        TestServer server("filedepot_it_empty");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto local = server.workspace() / "local" / "empty.dat";
        write_file(local, "");
        const auto uploaded = session.upload(local);
        assert(uploaded.ok());
        assert(uploaded.hash == sha256_of(""));

        const auto downloaded = session.download("empty.dat");
        assert(downloaded.ok());
        assert(std::filesystem::file_size(client_config(server).download_dir / "empty.dat") == 0);
    }

    void test_hash_mismatch_rejected()
    {
        TestServer server("filedepot_it_mismatch");
        auto connection = raw_connection(server);

        auto content = make_content(10000, 20);
        const UploadRequest request{.filename = "bad.bin", .filesize = content.size(), .hash = sha256_of(content)};
        connection->write_frame(encode_request(request));
        const auto ready = decode_reply<UploadReady>(connection->read_frame());
        assert(std::holds_alternative<UploadReady>(ready));

        content[4321] = static_cast<char>(content[4321] ^ 0x5A);
        connection->write_bytes(std::span<const char>(content.data(), content.size()));
        const auto result = decode_reply<TransferResult>(connection->read_frame());
        const auto *error = std::get_if<ErrorResponse>(&result);
        assert(error != nullptr);
        assert(error->error == ErrorCode::HashMismatch);

        assert(!std::filesystem::exists(server.storage_root() / "bad.bin"));
        assert(std::filesystem::is_empty(server.storage_root() / ".incoming"));

        // The connection stays in sync for the next command.
        connection->write_frame(encode_request(ListRequest{}));
        const auto listed = decode_reply<FileList>(connection->read_frame());
        assert(std::get<FileList>(listed).files.empty());
    }

    void test_dropped_upload_leaves_nothing()
    {
        TestServer server("filedepot_it_dropped");
        {
            auto connection = raw_connection(server);
            const auto content = make_content(50000, 21);
            const UploadRequest request{.filename = "cut.bin", .filesize = content.size(), .hash = sha256_of(content)};
            connection->write_frame(encode_request(request));
            assert(std::holds_alternative<UploadReady>(decode_reply<UploadReady>(connection->read_frame())));
            connection->write_bytes(std::span<const char>(content.data(), 20000));
            connection->close();
        }

        assert(eventually([&]
                          { return std::filesystem::is_empty(server.storage_root() / ".incoming"); }));
        assert(!std::filesystem::exists(server.storage_root() / "cut.bin"));
    }

    void test_resume_from_partial_file()
    {
        TestServer server("filedepot_it_resume");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto content = make_content(200000, 30);
        write_file(server.workspace() / "local" / "big.bin", content);
        assert(session.upload(server.workspace() / "local" / "big.bin").ok());

        constexpr std::size_t kAlreadyHave = 70001;
        write_file(session.partial_path("big.bin"), content.substr(0, kAlreadyHave));

        const auto outcome = session.download("big.bin");
        assert(outcome.ok());
        assert(outcome.bytes_transferred == content.size() - kAlreadyHave);
        assert(read_file(client_config(server).download_dir / "big.bin") == content);
        assert(!std::filesystem::exists(session.partial_path("big.bin")));
    }

    void test_oversized_partial_restarts()
    {
        TestServer server("filedepot_it_oversized_part");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto content = make_content(4000, 31);
        write_file(server.workspace() / "local" / "small.bin", content);
        assert(session.upload(server.workspace() / "local" / "small.bin").ok());

        write_file(session.partial_path("small.bin"), make_content(9000, 99));
        const auto outcome = session.download("small.bin");
        assert(outcome.ok());
        assert(outcome.bytes_transferred == content.size());
        assert(read_file(client_config(server).download_dir / "small.bin") == content);
    }

    void test_corrupt_partial_is_discarded()
    {
        TestServer server("filedepot_it_corrupt_part");
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        const auto content = make_content(6000, 32);
        write_file(server.workspace() / "local" / "file.bin", content);
        assert(session.upload(server.workspace() / "local" / "file.bin").ok());

        write_file(session.partial_path("file.bin"), make_content(2500, 77));
        const auto broken = session.download("file.bin");
        assert(broken.code == ErrorCode::HashMismatch);
        assert(!std::filesystem::exists(session.partial_path("file.bin")));
        assert(!std::filesystem::exists(client_config(server).download_dir / "file.bin"));

        // Without the stale partial the next attempt starts clean.
        const auto retried = session.download("file.bin");
        assert(retried.ok());
        assert(read_file(client_config(server).download_dir / "file.bin") == content);
    }

    void test_protocol_errors_keep_connection()
    {
        TestServer server("filedepot_it_protocol");
        auto connection = raw_connection(server);

        connection->write_frame(nlohmann::json{{"command", "DELETE"}, {"filename", "x"}});
        auto reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<ErrorResponse>(reply).error == ErrorCode::UnknownCommand);

        const std::string garbage = "not json";
        std::vector<char> frame{0, 0, 0, static_cast<char>(garbage.size())};
        frame.insert(frame.end(), garbage.begin(), garbage.end());
        connection->write_bytes(frame);
        reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<ErrorResponse>(reply).error == ErrorCode::ProtocolError);

        connection->write_frame(nlohmann::json{{"command", "UPLOAD"}, {"filename", ".hidden"}, {"filesize", 1}, {"hash", "00"}});
        reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<ErrorResponse>(reply).error == ErrorCode::InvalidRequest);

        connection->write_frame(encode_request(DownloadRequest{.filename = "ghost.txt"}));
        reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<ErrorResponse>(reply).error == ErrorCode::NotFound);

        connection->write_frame(encode_request(ListRequest{}));
        reply = decode_reply<FileList>(connection->read_frame());
        assert(std::holds_alternative<FileList>(reply));
    }

    void test_download_requires_ack()
    {
        TestServer server("filedepot_it_ack");
        write_file(server.storage_root() / "a.txt", "payload");

        auto connection = raw_connection(server);
        connection->write_frame(encode_request(DownloadRequest{.filename = "a.txt", .resume_offset = 3}));
        const auto ready = std::get<DownloadReady>(decode_reply<DownloadReady>(connection->read_frame()));
        assert(ready.filesize == 7);
        assert(ready.resuming_from == std::optional<std::uint64_t>(3));

        connection->write_frame(encode_request(ListRequest{}));
        auto reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<ErrorResponse>(reply).error == ErrorCode::ProtocolError);

        connection->write_frame(encode_request(DownloadRequest{.filename = "a.txt", .resume_offset = 3}));
        static_cast<void>(connection->read_frame());
        connection->write_frame(nlohmann::json(TransferAck{}));
        std::string tail(4, '\0');
        std::size_t got = 0;
        while (got < tail.size())
        {
            got += connection->read_some(std::span<char>(tail.data() + got, tail.size() - got));
        }
        assert(tail == "load");

        connection->write_frame(encode_request(ListRequest{}));
        reply = decode_reply<FileList>(connection->read_frame());
        assert(std::get<FileList>(reply).files.size() == 1);
    }

    void test_concurrent_uploads()
    {
        TestServer server("filedepot_it_concurrent");
        const auto left = make_content(300000, 40);
        const auto right = make_content(250000, 41);
        write_file(server.workspace() / "local" / "left.bin", left);
        write_file(server.workspace() / "local" / "right.bin", right);

        TransferOutcome left_outcome;
        TransferOutcome right_outcome;
        std::thread left_thread([&]
                                {
            NullProgress progress;
            ClientSession session(client_config(server, "dl-left"), Logger{}, progress);
            session.connect();
            left_outcome = session.upload(server.workspace() / "local" / "left.bin"); });
        std::thread right_thread([&]
                                 {
            NullProgress progress;
            ClientSession session(client_config(server, "dl-right"), Logger{}, progress);
            session.connect();
            right_outcome = session.upload(server.workspace() / "local" / "right.bin"); });
        left_thread.join();
        right_thread.join();

        assert(left_outcome.ok());
        assert(right_outcome.ok());
        assert(left_outcome.hash == sha256_of(left));
        assert(right_outcome.hash == sha256_of(right));
        assert(read_file(server.storage_root() / "left.bin") == left);
        assert(read_file(server.storage_root() / "right.bin") == right);
    }

    void test_idle_connection_is_closed_and_client_reconnects()
    {
        TestServer server("filedepot_it_idle", std::chrono::seconds(1));
        NullProgress progress;
        ClientSession session(client_config(server), Logger{}, progress);
        session.connect();

        auto idle = raw_connection(server);
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        try
        {
            static_cast<void>(idle->read_frame());
            assert(false);
        }
        catch (const ClientError &ex)
        {
            assert(ex.code() == ErrorCode::ConnectionError);
        }

        // The session's socket was closed by the server as well; one resend recovers.
        const auto listed = session.list();
        assert(listed.ok());
    }

    void test_connect_failure()
    {
        std::uint16_t unused_port = 0;
        {
            asio::io_context io;
            const asio::ip::tcp::endpoint loopback(asio::ip::make_address("127.0.0.1"), 0);
            asio::ip::tcp::acceptor placeholder(io, loopback);
            unused_port = placeholder.local_endpoint().port();
        }

        ClientConfig config;
        config.host = "127.0.0.1";
        config.port = unused_port;
        config.connect_timeout = std::chrono::seconds(2);
        config.connect_attempts = 2;
        config.connect_backoff = std::chrono::milliseconds(10);
        NullProgress progress;
        ClientSession session(config, Logger{}, progress);
        try
        {
            session.connect();
            assert(false);
        }
        catch (const ClientError &ex)
        {
            assert(ex.code() == ErrorCode::ConnectionError);
        }
        assert(!session.connected());

        const auto listed = session.list();
        assert(listed.code == ErrorCode::ConnectionError);
    }

} // namespace

int main()
{
    try
    {
        test_list_empty_then_two_files();
        test_round_trip_with_overwrite();
        test_rename_keeps_original();
        test_versioning_keeps_every_revision();
        test_empty_file_round_trip();
        test_hash_mismatch_rejected();
        test_dropped_upload_leaves_nothing();
        test_resume_from_partial_file();
        test_oversized_partial_restarts();
        test_corrupt_partial_is_discarded();
        test_protocol_errors_keep_connection();
        test_download_requires_ack();
        test_concurrent_uploads();
        test_idle_connection_is_closed_and_client_reconnects();
        test_connect_failure();
        test_interrupted_download_resumes_on_next_call();
        test_download_retries_within_one_call();
        test_unreadable_partial_reports_io_error();
        test_list_with_undecodable_name();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All integration tests passed\n";
    return 0;
}
