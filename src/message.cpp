#include <offload-cpp/message.hpp>
#include <offload-cpp/error.hpp>

#include <type_traits>

namespace offload_cpp {

namespace {

template <typename T>
inline constexpr bool always_false = false;

auto optional_id(const nlohmann::json& j) -> std::optional<JobId> {
    auto it = j.find("id");
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

auto payload_or_null(const nlohmann::json& j, const char* key) -> nlohmann::json {
    auto it = j.find(key);
    return it == j.end() ? nlohmann::json{} : *it;
}

}  // namespace

auto message_type(const ToWorkerMessage& msg) -> std::string_view {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InitRequest>) return "INIT";
        else if constexpr (std::is_same_v<T, StartJob>) return m.job_type;
        else if constexpr (std::is_same_v<T, CancelJob>) return "CANCEL";
        else if constexpr (std::is_same_v<T, HealthCheck>) return "HEALTH_CHECK";
        else static_assert(always_false<T>, "unhandled ToWorkerMessage");
    }, msg);
}

auto message_type(const FromWorkerMessage& msg) -> std::string_view {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ready>) return "READY";
        else if constexpr (std::is_same_v<T, JobResult>) return "JOB_RESULT";
        else if constexpr (std::is_same_v<T, Chunk>) return "CHUNK";
        else if constexpr (std::is_same_v<T, Complete>) return "COMPLETE";
        else if constexpr (std::is_same_v<T, WorkerFailure>) return "ERROR";
        else if constexpr (std::is_same_v<T, Cancelled>) return "CANCELLED";
        else if constexpr (std::is_same_v<T, HealthResponse>) return "HEALTH_RESPONSE";
        else static_assert(always_false<T>, "unhandled FromWorkerMessage");
    }, msg);
}

auto correlation_id(const FromWorkerMessage& msg) -> std::optional<JobId> {
    return std::visit([](const auto& m) -> std::optional<JobId> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ready>) return std::nullopt;
        else if constexpr (std::is_same_v<T, WorkerFailure>) return m.job_id;
        else if constexpr (std::is_same_v<T, HealthResponse>) return m.probe_id;
        else return m.job_id;
    }, msg);
}

// -- Host to worker -----------------------------------------------------------

void to_json(nlohmann::json& j, const ToWorkerMessage& msg) {
    j = nlohmann::json{{"type", std::string{message_type(msg)}}};
    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InitRequest>) {
            j["id"] = m.handshake_id;
            if (!m.payload.is_null()) j["payload"] = m.payload;
        } else if constexpr (std::is_same_v<T, StartJob>) {
            j["id"] = m.job_id;
            j["payload"] = m.payload;
        } else if constexpr (std::is_same_v<T, CancelJob>) {
            j["id"] = m.job_id;
        } else if constexpr (std::is_same_v<T, HealthCheck>) {
            j["id"] = m.probe_id;
        } else {
            static_assert(always_false<T>, "unhandled ToWorkerMessage");
        }
    }, msg);
}

void from_json(const nlohmann::json& j, ToWorkerMessage& msg) {
    const auto type = j.at("type").get<std::string>();
    if (type == "INIT") {
        msg = InitRequest{j.value("id", std::string{}), payload_or_null(j, "payload")};
    } else if (type == "CANCEL") {
        msg = CancelJob{j.at("id").get<std::string>()};
    } else if (type == "HEALTH_CHECK") {
        msg = HealthCheck{j.at("id").get<std::string>()};
    } else {
        msg = StartJob{j.at("id").get<std::string>(), type, payload_or_null(j, "payload")};
    }
}

// -- Worker to host -----------------------------------------------------------

void to_json(nlohmann::json& j, const FromWorkerMessage& msg) {
    j = nlohmann::json{{"type", std::string{message_type(msg)}}};
    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ready>) {
            j["id"] = m.handshake_id;
        } else if constexpr (std::is_same_v<T, JobResult>) {
            j["id"] = m.job_id;
            j["result"] = m.result;
            j["fallback"] = m.used_fallback;
        } else if constexpr (std::is_same_v<T, Chunk> || std::is_same_v<T, Complete>) {
            j["id"] = m.job_id;
            j["payload"] = m.payload;
        } else if constexpr (std::is_same_v<T, WorkerFailure>) {
            if (m.job_id) j["id"] = *m.job_id;
            j["error"] = m.message;
        } else if constexpr (std::is_same_v<T, Cancelled>) {
            j["id"] = m.job_id;
        } else if constexpr (std::is_same_v<T, HealthResponse>) {
            j["id"] = m.probe_id;
            j["healthy"] = m.healthy;
        } else {
            static_assert(always_false<T>, "unhandled FromWorkerMessage");
        }
    }, msg);
}

void from_json(const nlohmann::json& j, FromWorkerMessage& msg) {
    const auto type = j.at("type").get<std::string>();
    if (type == "READY" || type == "INIT_COMPLETE" || type == "WORKER_READY") {
        msg = Ready{j.value("id", std::string{})};
    } else if (type == "JOB_RESULT") {
        msg = JobResult{j.at("id").get<std::string>(), j.at("result"), j.value("fallback", false)};
    } else if (type == "CHUNK") {
        msg = Chunk{j.at("id").get<std::string>(), payload_or_null(j, "payload")};
    } else if (type == "COMPLETE") {
        msg = Complete{j.at("id").get<std::string>(), payload_or_null(j, "payload")};
    } else if (type == "ERROR") {
        msg = WorkerFailure{optional_id(j), j.value("error", std::string{"unknown worker error"})};
    } else if (type == "CANCELLED") {
        msg = Cancelled{j.at("id").get<std::string>()};
    } else if (type == "HEALTH_RESPONSE") {
        msg = HealthResponse{j.at("id").get<std::string>(), j.value("healthy", false)};
    } else {
        throw WorkerError{ErrorKind::protocol_error, "unknown worker message type: " + type};
    }
}

// -- Line codec ---------------------------------------------------------------

auto decode_from_worker(std::string_view line) -> FromWorkerMessage {
    try {
        return nlohmann::json::parse(line).get<FromWorkerMessage>();
    } catch (const nlohmann::json::exception& e) {
        throw WorkerError{ErrorKind::protocol_error, e.what()};
    }
}

auto decode_to_worker(std::string_view line) -> ToWorkerMessage {
    try {
        return nlohmann::json::parse(line).get<ToWorkerMessage>();
    } catch (const nlohmann::json::exception& e) {
        throw WorkerError{ErrorKind::protocol_error, e.what()};
    }
}

auto encode(const ToWorkerMessage& msg) -> std::string {
    return nlohmann::json(msg).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto encode(const FromWorkerMessage& msg) -> std::string {
    return nlohmann::json(msg).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace offload_cpp
