#include <offload-cpp/options.hpp>
#include <offload-cpp/error.hpp>

#include <string>

namespace offload_cpp {

namespace {

void require(bool condition, const char* field) {
    if (!condition) {
        throw WorkerError{ErrorKind::invalid_config, std::string{field} + " must be positive"};
    }
}

template <typename Duration>
void read_duration(const nlohmann::json& j, const char* key, Duration& out) {
    auto it = j.find(key);
    if (it != j.end()) out = Duration{it->template get<typename Duration::rep>()};
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end()) out = it->template get<T>();
}

}  // namespace

void validate(const PoolOptions& options) {
    require(options.pool_size > 0, "poolSize");
    require(options.queue_max_size > 0, "queueMaxSize");
    require(options.operation_timeout.count() > 0, "operationTimeoutMs");
    require(options.health_check_timeout.count() > 0, "healthCheckTimeoutMs");
    require(options.init_timeout.count() > 0, "initTimeoutMs");
    require(options.failure_window.count() > 0, "failureWindowMs");
    require(options.max_failures_in_window > 0, "maxFailuresInWindow");
    if (options.health_check_interval.count() < 0) {
        throw WorkerError{ErrorKind::invalid_config, "healthCheckIntervalSec must not be negative"};
    }
}

void validate(const StreamingOptions& options) {
    require(options.init_timeout.count() > 0, "initTimeoutMs");
    require(options.cancel_timeout.count() > 0, "cancelTimeoutMs");
}

void to_json(nlohmann::json& j, const PoolOptions& options) {
    j = nlohmann::json{
        {"poolSize", options.pool_size},
        {"operationTimeoutMs", options.operation_timeout.count()},
        {"healthCheckTimeoutMs", options.health_check_timeout.count()},
        {"healthCheckIntervalSec", options.health_check_interval.count()},
        {"queueMaxSize", options.queue_max_size},
        {"initTimeoutMs", options.init_timeout.count()},
        {"failureWindowMs", options.failure_window.count()},
        {"maxFailuresInWindow", options.max_failures_in_window},
    };
}

void from_json(const nlohmann::json& j, PoolOptions& options) {
    try {
        read_value(j, "poolSize", options.pool_size);
        read_duration(j, "operationTimeoutMs", options.operation_timeout);
        read_duration(j, "healthCheckTimeoutMs", options.health_check_timeout);
        read_duration(j, "healthCheckIntervalSec", options.health_check_interval);
        read_value(j, "queueMaxSize", options.queue_max_size);
        read_duration(j, "initTimeoutMs", options.init_timeout);
        read_duration(j, "failureWindowMs", options.failure_window);
        read_value(j, "maxFailuresInWindow", options.max_failures_in_window);
    } catch (const nlohmann::json::exception& e) {
        throw WorkerError{ErrorKind::invalid_config, e.what()};
    }
}

void to_json(nlohmann::json& j, const StreamingOptions& options) {
    j = nlohmann::json{
        {"initTimeoutMs", options.init_timeout.count()},
        {"cancelTimeoutMs", options.cancel_timeout.count()},
    };
}

void from_json(const nlohmann::json& j, StreamingOptions& options) {
    try {
        read_duration(j, "initTimeoutMs", options.init_timeout);
        read_duration(j, "cancelTimeoutMs", options.cancel_timeout);
    } catch (const nlohmann::json::exception& e) {
        throw WorkerError{ErrorKind::invalid_config, e.what()};
    }
}

}  // namespace offload_cpp
