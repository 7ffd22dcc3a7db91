#include <offload-cpp/types.hpp>

#include <cstdio>

namespace offload_cpp {

auto hash_request(const nlohmann::json& request) -> RequestHash {
    // CBOR keeps string bytes as given; dump() would reject invalid UTF-8.
    const auto canonical = nlohmann::json::to_cbor(request);
    // FNV-1a over the serialized bytes
    auto h = std::uint64_t{14695981039346656037ULL};
    for (auto byte : canonical) {
        h ^= static_cast<std::uint64_t>(byte);
        h *= std::uint64_t{1099511628211ULL};
    }
    return RequestHash{h, canonical.size()};
}

auto to_string(const RequestHash& hash) -> std::string {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(hash.digest));
    return std::to_string(hash.length) + "-" + buf;
}

}  // namespace offload_cpp
