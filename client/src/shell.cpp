#include "filedepot/client/shell.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace filedepot::client
{

    namespace
    {
        constexpr auto kRedrawInterval = std::chrono::milliseconds(200);

        std::string to_upper(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            return value;
        }

        std::string format_time(std::uint64_t unix_seconds)
        {
            const auto seconds = static_cast<std::time_t>(unix_seconds);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream oss;
            oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }

    } // namespace

    ConsoleProgress::ConsoleProgress(std::ostream &out) : out_(out) {}

    void ConsoleProgress::on_progress(TransferDirection direction, const std::string &filename,
                                      std::uint64_t bytes_done, std::uint64_t total_bytes)
    {
        const auto now = std::chrono::steady_clock::now();
        const bool finished = bytes_done >= total_bytes;
        if (!finished && now - last_draw_ < kRedrawInterval)
        {
            return;
        }
        last_draw_ = now;
        const auto percent = total_bytes == 0 ? 100.0 : 100.0 * static_cast<double>(bytes_done) / static_cast<double>(total_bytes);
        out_ << '\r' << (direction == TransferDirection::Upload ? "Uploading " : "Downloading ") << filename << ": "
             << std::fixed << std::setprecision(1) << percent << "% (" << format_size(bytes_done) << " / "
             << format_size(total_bytes) << ")" << std::flush;
        if (finished)
        {
            out_ << '\n';
        }
    }

    std::string format_size(std::uint64_t bytes)
    {
        std::ostringstream oss;
        if (bytes < 1024)
        {
            oss << bytes << " B";
        }
        else if (bytes < 1024 * 1024)
        {
            oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
        }
        else
        {
            oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
        }
        return oss.str();
    }

    std::vector<std::string> split_command(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string current;
        bool quoted = false;
        bool has_token = false;
        for (const char ch : line)
        {
            if (ch == '"')
            {
                quoted = !quoted;
                has_token = true;
            }
            else if (!quoted && std::isspace(static_cast<unsigned char>(ch)))
            {
                if (has_token)
                {
                    tokens.push_back(std::move(current));
                    current.clear();
                    has_token = false;
                }
            }
            else
            {
                current.push_back(ch);
                has_token = true;
            }
        }
        if (has_token)
        {
            tokens.push_back(std::move(current));
        }
        return tokens;
    }

    Shell::Shell(ClientSession &session, std::ostream &out) : session_(session), out_(out) {}

    bool Shell::execute(const std::vector<std::string> &tokens)
    {
        if (tokens.empty())
        {
            return true;
        }
        const auto command = to_upper(tokens.front());
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "EXIT" || command == "QUIT")
        {
            return false;
        }
        if (command == "HELP")
        {
            print_help();
            last_succeeded_ = true;
        }
        else if (command == "UPLOAD")
        {
            handle_upload(args);
        }
        else if (command == "DOWNLOAD")
        {
            handle_download(args);
        }
        else if (command == "LIST")
        {
            handle_list();
        }
        else if (command == "VERSIONS")
        {
            handle_versions(args);
        }
        else
        {
            out_ << "ERROR: unknown_command" << std::endl;
            out_ << "Type HELP for the list of commands." << std::endl;
            last_succeeded_ = false;
        }
        return true;
    }

    int Shell::run(std::istream &in)
    {
        print_help();
        std::string line;
        while (true)
        {
            out_ << "filedepot> " << std::flush;
            if (!std::getline(in, line))
            {
                out_ << std::endl;
                break;
            }
            if (!execute(split_command(line)))
            {
                break;
            }
        }
        return 0;
    }

    void Shell::print_help() const
    {
        out_ << "Commands:\n"
             << "  UPLOAD <path> [overwrite|rename|versioning]\n"
             << "  DOWNLOAD <name> [version]\n"
             << "  LIST\n"
             << "  VERSIONS <name>\n"
             << "  HELP\n"
             << "  EXIT" << std::endl;
    }

    void Shell::report(const TransferOutcome &outcome)
    {
        if (outcome.ok())
        {
            out_ << "OK" << std::endl;
            out_ << outcome.message << " (" << outcome.filename << ", sha256 " << outcome.hash << ")" << std::endl;
            last_succeeded_ = true;
            return;
        }
        report_error(outcome.code, outcome.message);
    }

    void Shell::report_error(filedepot::ErrorCode code, const std::string &message)
    {
        out_ << "ERROR: " << filedepot::to_string(code) << std::endl;
        if (!message.empty())
        {
            out_ << message << std::endl;
        }
        last_succeeded_ = false;
    }

    void Shell::handle_upload(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            report_error(filedepot::ErrorCode::InvalidRequest, "Usage: UPLOAD <path> [overwrite|rename|versioning]");
            return;
        }
        auto action = protocol::DuplicateAction::Overwrite;
        if (args.size() == 2)
        {
            const auto parsed = protocol::duplicate_action_from_string(args[1]);
            if (!parsed)
            {
                report_error(filedepot::ErrorCode::InvalidRequest, "Unknown handling mode: " + args[1]);
                return;
            }
            action = *parsed;
        }
        report(session_.upload(args[0], action));
    }

    void Shell::handle_download(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            report_error(filedepot::ErrorCode::InvalidRequest, "Usage: DOWNLOAD <name> [version]");
            return;
        }
        std::optional<std::string> version;
        if (args.size() == 2)
        {
            version = args[1];
        }
        report(session_.download(args[0], version));
    }

    void Shell::handle_list()
    {
        const auto outcome = session_.list();
        if (!outcome.ok())
        {
            report_error(outcome.code, outcome.message);
            return;
        }
        out_ << "OK" << std::endl;
        if (outcome.files.empty())
        {
            out_ << "No files on server." << std::endl;
            last_succeeded_ = true;
            return;
        }
        std::size_t name_width = 8;
        for (const auto &file : outcome.files)
        {
            name_width = std::max(name_width, file.filename.size());
        }
        out_ << std::left << std::setw(static_cast<int>(name_width + 2)) << "Filename" << std::setw(12) << "Size"
             << std::setw(22) << "Modified (UTC)" << "Versions" << '\n';
        for (const auto &file : outcome.files)
        {
            out_ << std::left << std::setw(static_cast<int>(name_width + 2)) << file.filename << std::setw(12)
                 << format_size(file.size) << std::setw(22) << format_time(file.modified) << file.versions.size()
                 << '\n';
        }
        out_ << std::right << std::flush;
        last_succeeded_ = true;
    }

    void Shell::handle_versions(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            report_error(filedepot::ErrorCode::InvalidRequest, "Usage: VERSIONS <name>");
            return;
        }
        const auto outcome = session_.list();
        if (!outcome.ok())
        {
            report_error(outcome.code, outcome.message);
            return;
        }
        const auto it = std::find_if(outcome.files.begin(), outcome.files.end(), [&](const auto &file)
                                     { return file.filename == args[0]; });
        if (it == outcome.files.end())
        {
            report_error(filedepot::ErrorCode::NotFound, "File not found: " + args[0]);
            return;
        }
        out_ << "OK" << std::endl;
        out_ << it->filename << " (current, " << format_size(it->size) << ", sha256 " << it->hash << ")\n";
        if (it->versions.empty())
        {
            out_ << "  no archived versions" << std::endl;
        }
        for (const auto &version : it->versions)
        {
            out_ << "  " << version.filename << "  " << format_size(version.size) << "  "
                 << format_time(version.created) << "  sha256 " << version.hash << '\n';
        }
        out_ << std::flush;
        last_succeeded_ = true;
    }

} // namespace filedepot::client
