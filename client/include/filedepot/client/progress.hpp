#pragma once

#include <cstdint>
#include <string>

namespace filedepot::client
{

    enum class TransferDirection
    {
        Upload,
        Download
    };

    class ProgressListener
    {
    public:
        virtual ~ProgressListener() = default;

        virtual void on_progress(TransferDirection direction, const std::string &filename, std::uint64_t bytes_done,
                                 std::uint64_t total_bytes) = 0;
    };

    class NullProgress : public ProgressListener
    {
    public:
        void on_progress(TransferDirection, const std::string &, std::uint64_t, std::uint64_t) override {}
    };

} // namespace filedepot::client
