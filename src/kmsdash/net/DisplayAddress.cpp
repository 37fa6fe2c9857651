#include <kmsdash/net/DisplayAddress.hpp>

#include <kmsdash/log/TaggedLogger.hpp>

#include <array>
#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace KD {

namespace {

class SocketHandle {
public:
    explicit SocketHandle(int fd)
        : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketHandle(SocketHandle const&)                    = delete;
    auto operator=(SocketHandle const&) -> SocketHandle& = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }

private:
    int fd_;
};

} // namespace

auto DiscoverDisplayAddress(std::string_view probe_host, int probe_port) -> std::string {
    std::string const fallback{kLoopbackAddress};

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port   = htons(static_cast<std::uint16_t>(probe_port));
    std::string host{probe_host};
    if (::inet_pton(AF_INET, host.c_str(), &remote.sin_addr) != 1) {
        return fallback;
    }

    SocketHandle sock{::socket(AF_INET, SOCK_DGRAM, 0)};
    if (!sock.valid()) {
        return fallback;
    }
    if (::connect(sock.get(), reinterpret_cast<sockaddr const*>(&remote), sizeof(remote)) != 0) {
        kd_log("display address probe could not route", "Net");
        return fallback;
    }

    sockaddr_in local{};
    socklen_t   length = sizeof(local);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &length) != 0) {
        return fallback;
    }

    std::array<char, INET_ADDRSTRLEN> buffer{};
    if (::inet_ntop(AF_INET, &local.sin_addr, buffer.data(), buffer.size()) == nullptr) {
        return fallback;
    }
    std::string address{buffer.data()};
    if (address.empty() || address == "0.0.0.0") {
        return fallback;
    }
    return address;
}

} // namespace KD
