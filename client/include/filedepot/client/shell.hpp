#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "filedepot/client/progress.hpp"
#include "filedepot/client/session.hpp"

namespace filedepot::client
{

    // Redraws one console line per transfer, at most every few hundred ms.
    class ConsoleProgress : public ProgressListener
    {
    public:
        explicit ConsoleProgress(std::ostream &out);

        void on_progress(TransferDirection direction, const std::string &filename, std::uint64_t bytes_done,
                         std::uint64_t total_bytes) override;

    private:
        std::ostream &out_;
        std::chrono::steady_clock::time_point last_draw_{};
    };

    std::string format_size(std::uint64_t bytes);

    // Splits on whitespace; double quotes group a token containing spaces.
    std::vector<std::string> split_command(const std::string &line);

    class Shell
    {
    public:
        Shell(ClientSession &session, std::ostream &out);

        // Returns false once the user asked to leave.
        bool execute(const std::vector<std::string> &tokens);

        // Interactive loop until EXIT or end of input. Returns the process exit code.
        int run(std::istream &in);

        bool last_succeeded() const noexcept { return last_succeeded_; }

    private:
        void print_help() const;
        void report(const TransferOutcome &outcome);
        void report_error(filedepot::ErrorCode code, const std::string &message);
        void handle_upload(const std::vector<std::string> &args);
        void handle_download(const std::vector<std::string> &args);
        void handle_list();
        void handle_versions(const std::vector<std::string> &args);

        ClientSession &session_;
        std::ostream &out_;
        bool last_succeeded_{true};
    };

} // namespace filedepot::client
