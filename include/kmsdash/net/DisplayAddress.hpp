#pragma once

#include <string>
#include <string_view>

namespace KD {

inline constexpr std::string_view kLoopbackAddress = "127.0.0.1";

// Best-effort local IPv4 address that other hosts can reach. Connects a UDP
// socket towards probe_host (no datagram is sent) and reads the chosen source
// address; falls back to 127.0.0.1 on any failure.
[[nodiscard]] auto DiscoverDisplayAddress(std::string_view probe_host = "8.8.8.8",
                                          int              probe_port = 80) -> std::string;

} // namespace KD
