/**
 * @file buffered_client.cpp
 * @brief BufferedClient implementation.
 * @author Dimitris Kafetzis
 */

#include "client/buffered_client.hpp"

#include <limits>
#include <string>

namespace buffered_statsd {

BufferedClient::BufferedClient(const BufferConfig& config,
                               std::shared_ptr<ITransport> transport,
                               const Logger& logger,
                               FaultHandler on_fault)
    : buffer_(config, std::move(transport),
              logger.with_component("buffered_client"), std::move(on_fault)) {}

Result<void> BufferedClient::increment(std::string_view name, int64_t delta) {
    if (delta == 0) return ok();
    return buffer_.submit(Increment{.name = std::string(name), .value = delta});
}

Result<void> BufferedClient::decrement(std::string_view name, int64_t delta) {
    if (delta == 0) return ok();
    if (delta == std::numeric_limits<int64_t>::min()) {
        return Error{"Decrement of '" + std::string(name) + "' by INT64_MIN cannot be negated"};
    }
    return buffer_.submit(Increment{.name = std::string(name), .value = -delta});
}

Result<void> BufferedClient::timing(std::string_view name, Duration duration) {
    return buffer_.submit(Timing::sample(std::string(name), duration));
}

Result<void> BufferedClient::gauge(std::string_view name, int64_t value) {
    return buffer_.submit(Gauge{.name = std::string(name), .value = value});
}

Result<void> BufferedClient::gauge_delta(std::string_view name, int64_t delta) {
    if (delta == 0) return ok();
    return buffer_.submit(GaugeDelta{.name = std::string(name), .value = delta});
}

Result<void> BufferedClient::absolute(std::string_view name, int64_t value) {
    return buffer_.submit(Absolute{.name = std::string(name), .values = {value}});
}

Result<void> BufferedClient::total(std::string_view name, int64_t value) {
    return buffer_.submit(Total{.name = std::string(name), .value = value});
}

Result<void> BufferedClient::record(Event event) {
    return buffer_.submit(std::move(event));
}

Result<void> BufferedClient::flush() { return buffer_.flush(); }
Result<void> BufferedClient::close() { return buffer_.close(); }

}  // namespace buffered_statsd
