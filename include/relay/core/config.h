#ifndef RELAY_CORE_CONFIG_H
#define RELAY_CORE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace relay::core::config {

inline constexpr std::uint16_t kDefaultPort = 8080;
inline constexpr std::size_t kReadChunkSize = 16384;
inline constexpr std::size_t kMaxHeaderBytes = 1024 * 1024;
inline constexpr std::chrono::milliseconds kConnectTimeout{10000};
inline constexpr std::size_t kDiagnosticRetention = 256;
inline constexpr int kListenBacklog = 64;

}  // namespace relay::core::config

#endif  // RELAY_CORE_CONFIG_H
