/// @file types.hpp
/// @brief Identity types: JobId, HandshakeId, RequestHash.

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace offload_cpp {

/// Correlation id carried by every job-scoped message.
using JobId = std::string;

/// Correlation id of one INIT/READY exchange.
using HandshakeId = std::string;

/// Clock used for every deadline and timestamp in the library.
using Clock = std::chrono::steady_clock;

/// A stable fingerprint of a request payload.
///
/// Two requests with the same canonical CBOR serialization produce the
/// same hash. Strings are hashed byte for byte, whether or not they are
/// valid UTF-8. Used to coalesce identical discrete jobs and to replace
/// identical queued streaming jobs.
struct RequestHash {
    std::uint64_t digest{0};  ///< FNV-1a over the canonical serialization.
    std::size_t length{0};    ///< Length of the canonical serialization in bytes.

    auto operator<=>(const RequestHash&) const = default;
    auto operator==(const RequestHash&) const -> bool = default;
};

/// Hash a request. Object keys are serialized in sorted order, so
/// logically equal requests hash equally.
auto hash_request(const nlohmann::json& request) -> RequestHash;

/// Render a hash as "<length>-<hex digest>" for logging.
auto to_string(const RequestHash& hash) -> std::string;

}  // namespace offload_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<offload_cpp::RequestHash> {
    auto operator()(const offload_cpp::RequestHash& h) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(h.digest);
        auto h2 = std::hash<std::size_t>{}(h.length);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
