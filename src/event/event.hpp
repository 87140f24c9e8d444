/**
 * @file event.hpp
 * @brief Closed set of metric events with per-kind merge rules.
 * @author Dimitris Kafetzis
 *
 * Every event kind is a plain value type satisfying MetricEventLike. The
 * Event variant is what travels through the buffer channel and what the
 * aggregation map stores; merge() and render() dispatch with std::visit.
 *
 * Merge rules:
 *   Increment, GaugeDelta   sum of deltas
 *   Gauge, Total            latest value wins
 *   Absolute                latest value set wins
 *   Timing                  samples accumulate (count, sum, min, max, samples)
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// Event Kinds
// ─────────────────────────────────────────────

/// Counter delta, positive or negative.
struct Increment {
    static constexpr MetricKind kind = MetricKind::Increment;

    MetricName name;
    int64_t value{0};

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const Increment& other) noexcept { value += other.value; }
    void render(std::string_view prefix, std::vector<std::string>& lines) const;
};

/// Point-in-time reading; zero is a valid value.
struct Gauge {
    static constexpr MetricKind kind = MetricKind::Gauge;

    MetricName name;
    int64_t value{0};

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const Gauge& other) noexcept { value = other.value; }
    void render(std::string_view prefix, std::vector<std::string>& lines) const;
};

/// Relative gauge adjustment, rendered with an explicit sign.
struct GaugeDelta {
    static constexpr MetricKind kind = MetricKind::GaugeDelta;

    MetricName name;
    int64_t value{0};

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const GaugeDelta& other) noexcept { value += other.value; }
    void render(std::string_view prefix, std::vector<std::string>& lines) const;
};

/// Absolute-valued metric, not averaged by the collector.
struct Absolute {
    static constexpr MetricKind kind = MetricKind::Absolute;

    MetricName name;
    std::vector<int64_t> values;

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const Absolute& other) { values = other.values; }
    void render(std::string_view prefix, std::vector<std::string>& lines) const;
};

/// Continuously increasing running total (e.g. reads since boot).
struct Total {
    static constexpr MetricKind kind = MetricKind::Total;

    MetricName name;
    int64_t value{0};

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const Total& other) noexcept { value = other.value; }
    void render(std::string_view prefix, std::vector<std::string>& lines) const;
};

/**
 * @brief Distribution of duration samples collected in one flush window.
 *
 * Keeps every sample so the percentile is exact for the window.
 */
struct Timing {
    static constexpr MetricKind kind = MetricKind::Timing;

    MetricName name;
    uint64_t count{0};
    Duration sum{0};
    Duration min{0};
    Duration max{0};
    std::vector<Duration> samples;

    /// A Timing holding exactly one sample.
    static Timing sample(MetricName name, Duration duration);

    [[nodiscard]] const MetricName& key() const noexcept { return name; }
    void merge(const Timing& other);
    void render(std::string_view prefix, std::vector<std::string>& lines) const;

    [[nodiscard]] Duration average() const noexcept;

    /// Nearest-rank percentile, @p percent in (0, 100]. Zero when empty.
    [[nodiscard]] Duration percentile(double percent) const;
};

static_assert(MetricEventLike<Increment>);
static_assert(MetricEventLike<Gauge>);
static_assert(MetricEventLike<GaugeDelta>);
static_assert(MetricEventLike<Absolute>);
static_assert(MetricEventLike<Total>);
static_assert(MetricEventLike<Timing>);

// ─────────────────────────────────────────────
// Event Variant
// ─────────────────────────────────────────────

/// Alternative order must match MetricKind.
using Event = std::variant<Increment, Gauge, GaugeDelta, Absolute, Total, Timing>;

[[nodiscard]] const MetricKey& key_of(const Event& event) noexcept;

[[nodiscard]] MetricKind kind_of(const Event& event) noexcept;

/**
 * @brief Merge @p incoming into @p existing in place.
 *
 * Fails with ErrorCode::KindMismatch when the kinds differ, leaving
 * @p existing untouched.
 */
Result<void> merge(Event& existing, const Event& incoming);

/// StatsD lines for the event, each prefixed with @p prefix.
[[nodiscard]] std::vector<std::string> render(const Event& event, std::string_view prefix = {});

/// Rendered lines joined by '\n'.
[[nodiscard]] std::string to_string(const Event& event, std::string_view prefix = {});

/// Milliseconds with up to three decimals ("12", "12.5", "0.042").
[[nodiscard]] std::string format_millis(Duration duration);

/**
 * @brief Parse one StatsD line ("name:value|type") into an Event.
 *
 * Types: c (Increment), g (Gauge, or GaugeDelta when the value carries an
 * explicit sign), a (Absolute), t (Total), ms (Timing, fractional ms allowed).
 * Sample rates ("|@0.1") are rejected since the buffer never estimates.
 */
Result<Event> parse_line(std::string_view line);

}  // namespace buffered_statsd
