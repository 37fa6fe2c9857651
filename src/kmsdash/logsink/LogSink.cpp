#include <kmsdash/logsink/LogSink.hpp>

#include <kmsdash/log/TaggedLogger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace KD {

namespace {

constexpr std::size_t kTailChunkBytes = 64 * 1024;

auto io_error(std::string_view action, std::filesystem::path const& path, int err) -> Error {
    std::string message{action};
    message.append(" ");
    message.append(path.string());
    if (err != 0) {
        message.append(": ");
        message.append(std::strerror(err));
    }
    return Error{Error::Code::IoFailure, std::move(message)};
}

void split_lines(std::string_view text, std::vector<std::string>& out) {
    while (!text.empty()) {
        auto newline = text.find('\n');
        auto line    = text.substr(0, newline);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        out.emplace_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }
}

} // namespace

auto TailFileLines(std::filesystem::path const& path, std::size_t max_lines, std::size_t max_bytes)
    -> Expected<std::vector<std::string>> {
    std::vector<std::string> lines;
    if (max_lines == 0) {
        return lines;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return lines;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(io_error("cannot open log", path, errno));
    }

    // The size observed here bounds the read; later appends are not visible.
    stream.seekg(0, std::ios::end);
    auto const end_pos = stream.tellg();
    if (end_pos < 0) {
        return std::unexpected(io_error("cannot size log", path, 0));
    }

    std::uint64_t end      = static_cast<std::uint64_t>(end_pos);
    std::string   window;
    std::size_t   newlines = 0;
    while (end > 0 && window.size() < max_bytes && newlines <= max_lines) {
        auto chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>({end, kTailChunkBytes, max_bytes - window.size()}));
        std::string block(chunk, '\0');
        stream.seekg(static_cast<std::streamoff>(end - chunk));
        stream.read(block.data(), static_cast<std::streamsize>(chunk));
        if (stream.gcount() != static_cast<std::streamsize>(chunk)) {
            // Truncated underneath us; report whatever is already in the window.
            break;
        }
        newlines += static_cast<std::size_t>(std::count(block.begin(), block.end(), '\n'));
        window.insert(0, block);
        end -= chunk;
    }

    std::string_view view{window};
    if (end > 0) {
        // The window starts mid-file; its first line is incomplete.
        auto first_newline = view.find('\n');
        view = first_newline == std::string_view::npos ? std::string_view{} : view.substr(first_newline + 1);
    }

    split_lines(view, lines);
    if (lines.size() > max_lines) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(max_lines));
    }
    return lines;
}

LogSink::LogSink(std::filesystem::path path, std::size_t tail_max_bytes)
    : path_(std::move(path))
    , tail_max_bytes_(tail_max_bytes == 0 ? kDefaultTailMaxBytes : tail_max_bytes) {}

auto LogSink::append_line(std::string_view line) -> Expected<void> {
    std::lock_guard const lock{write_mutex_};
    std::ofstream         stream(path_, std::ios::binary | std::ios::app);
    if (!stream) {
        return std::unexpected(io_error("cannot append to log", path_, errno));
    }
    stream.write(line.data(), static_cast<std::streamsize>(line.size()));
    stream.put('\n');
    stream.flush();
    if (!stream) {
        return std::unexpected(io_error("failed writing log", path_, errno));
    }
    kd_log("appended audit line", "LogSink");
    return {};
}

auto LogSink::tail(std::size_t max_lines) const -> Expected<std::vector<std::string>> {
    return TailFileLines(path_, max_lines, tail_max_bytes_);
}

auto LogSink::open_child_descriptor(bool truncate) -> Expected<int> {
    std::lock_guard const lock{write_mutex_};
    int flags = O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }
    int fd = ::open(path_.c_str(), flags, 0644);
    if (fd < 0) {
        return std::unexpected(io_error("cannot open log for child output", path_, errno));
    }
    return fd;
}

} // namespace KD
