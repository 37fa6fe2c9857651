#pragma once

#include <kmsdash/core/Error.hpp>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace KD {

inline constexpr std::size_t kDefaultTailMaxBytes = 1024 * 1024;

// Append-only text log shared by the supervised child (stdout/stderr) and the
// dashboard (audit lines). Readers never write and only the child start
// truncates.
class LogSink {
public:
    explicit LogSink(std::filesystem::path path, std::size_t tail_max_bytes = kDefaultTailMaxBytes);

    LogSink(LogSink const&)                    = delete;
    auto operator=(LogSink const&) -> LogSink& = delete;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }
    [[nodiscard]] auto tail_max_bytes() const -> std::size_t { return tail_max_bytes_; }

    // Appends one line plus '\n'. Serialized against other appends and against
    // open_child_descriptor.
    auto append_line(std::string_view line) -> Expected<void>;

    // Last max_lines lines (oldest first) of the file as it was when the call
    // started. A missing file yields an empty list.
    [[nodiscard]] auto tail(std::size_t max_lines) const -> Expected<std::vector<std::string>>;

    // O_APPEND descriptor for a child's stdout/stderr, optionally truncating the
    // file first. The caller owns the returned descriptor.
    [[nodiscard]] auto open_child_descriptor(bool truncate) -> Expected<int>;

private:
    std::filesystem::path path_;
    std::size_t           tail_max_bytes_;
    std::mutex            write_mutex_;
};

// Bounded tail read: scans backwards from the end in chunks and never reads more
// than max_bytes, so the result may hold fewer than max_lines lines when lines
// are very long.
[[nodiscard]] auto TailFileLines(std::filesystem::path const& path,
                                 std::size_t                  max_lines,
                                 std::size_t                  max_bytes = kDefaultTailMaxBytes)
    -> Expected<std::vector<std::string>>;

} // namespace KD
