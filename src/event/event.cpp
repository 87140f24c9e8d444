/**
 * @file event.cpp
 * @brief Event merge dispatch and StatsD line rendering.
 * @author Dimitris Kafetzis
 */

#include "event/event.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <system_error>
#include <type_traits>

namespace buffered_statsd {

namespace {

/// Upper bound for a parsed timing in ms (~285 years); fits Duration in microseconds.
constexpr double MAX_TIMING_MILLIS = 9.0e15;
static_assert(MAX_TIMING_MILLIS * 1000.0
              < static_cast<double>(std::numeric_limits<Duration::rep>::max()));

std::string line(std::string_view prefix, std::string_view name,
                 std::string_view value, std::string_view type) {
    std::string out;
    out.reserve(prefix.size() + name.size() + value.size() + type.size() + 2);
    out.append(prefix).append(name).append(1, ':').append(value).append(1, '|').append(type);
    return out;
}

/// Clamps at the Duration limits instead of overflowing.
Duration saturating_add(Duration a, Duration b) noexcept {
    constexpr auto hi = Duration::max();
    constexpr auto lo = Duration::min();
    if (b.count() > 0 && a > hi - b) return hi;
    if (b.count() < 0 && a < lo - b) return lo;
    return a + b;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────

std::string format_millis(Duration duration) {
    auto us = duration.count();
    std::string sign = us < 0 ? "-" : "";
    // Magnitude in unsigned arithmetic: well defined for the most negative rep too.
    auto abs_us = static_cast<uint64_t>(us);
    if (us < 0) abs_us = 0 - abs_us;

    auto whole = std::to_string(abs_us / 1000);
    auto frac = abs_us % 1000;
    if (frac == 0) return sign + whole;

    std::string frac_str = std::to_string(frac);
    frac_str.insert(0, 3 - frac_str.size(), '0');  // frac < 1000: at most 3 digits
    while (!frac_str.empty() && frac_str.back() == '0') frac_str.pop_back();
    return sign + whole + "." + frac_str;
}

void Increment::render(std::string_view prefix, std::vector<std::string>& lines) const {
    lines.push_back(line(prefix, name, std::to_string(value), "c"));
}

void Gauge::render(std::string_view prefix, std::vector<std::string>& lines) const {
    // A leading '-' means "decrement" to a StatsD server; reset to zero first.
    if (value < 0) {
        lines.push_back(line(prefix, name, "0", "g"));
    }
    lines.push_back(line(prefix, name, std::to_string(value), "g"));
}

void GaugeDelta::render(std::string_view prefix, std::vector<std::string>& lines) const {
    auto signed_value = (value >= 0 ? "+" : "") + std::to_string(value);
    lines.push_back(line(prefix, name, signed_value, "g"));
}

void Absolute::render(std::string_view prefix, std::vector<std::string>& lines) const {
    for (auto v : values) {
        lines.push_back(line(prefix, name, std::to_string(v), "a"));
    }
}

void Total::render(std::string_view prefix, std::vector<std::string>& lines) const {
    lines.push_back(line(prefix, name, std::to_string(value), "t"));
}

void Timing::render(std::string_view prefix, std::vector<std::string>& lines) const {
    if (count == 0) return;
    lines.push_back(line(prefix, name + ".count", std::to_string(count), "c"));
    lines.push_back(line(prefix, name + ".avg", format_millis(average()), "ms"));
    lines.push_back(line(prefix, name + ".min", format_millis(min), "ms"));
    lines.push_back(line(prefix, name + ".max", format_millis(max), "ms"));
    lines.push_back(line(prefix, name + ".p90", format_millis(percentile(90.0)), "ms"));
}

// ─────────────────────────────────────────────
// Timing
// ─────────────────────────────────────────────

Timing Timing::sample(MetricName name, Duration duration) {
    Timing t;
    t.name = std::move(name);
    t.count = 1;
    t.sum = duration;
    t.min = duration;
    t.max = duration;
    t.samples.push_back(duration);
    return t;
}

void Timing::merge(const Timing& other) {
    if (other.count == 0) return;
    if (count == 0) {
        min = other.min;
        max = other.max;
    } else {
        min = std::min(min, other.min);
        max = std::max(max, other.max);
    }
    count += other.count;
    sum = saturating_add(sum, other.sum);
    samples.insert(samples.end(), other.samples.begin(), other.samples.end());
}

Duration Timing::average() const noexcept {
    if (count == 0) return Duration{0};
    return Duration{sum.count() / static_cast<Duration::rep>(count)};
}

Duration Timing::percentile(double percent) const {
    if (samples.empty()) return Duration{0};
    percent = std::clamp(percent, 0.0, 100.0);

    auto rank = static_cast<size_t>(std::ceil(percent / 100.0 * static_cast<double>(samples.size())));
    auto index = rank == 0 ? 0 : rank - 1;

    auto sorted = samples;
    std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(index), sorted.end());
    return sorted[index];
}

// ─────────────────────────────────────────────
// Variant Dispatch
// ─────────────────────────────────────────────

const MetricKey& key_of(const Event& event) noexcept {
    return std::visit([](const auto& e) -> const MetricKey& { return e.key(); }, event);
}

MetricKind kind_of(const Event& event) noexcept {
    return static_cast<MetricKind>(event.index());
}

Result<void> merge(Event& existing, const Event& incoming) {
    if (existing.index() != incoming.index()) {
        return Error{"Cannot merge " + std::string(to_string(kind_of(incoming)))
                     + " into " + std::string(to_string(kind_of(existing)))
                     + " for key '" + key_of(existing) + "'",
                     ErrorCode::KindMismatch};
    }
    if (key_of(existing) != key_of(incoming)) {
        return Error{"Cannot merge key '" + key_of(incoming) + "' into '"
                     + key_of(existing) + "'"};
    }

    std::visit([&incoming](auto& target) {
        using T = std::decay_t<decltype(target)>;
        target.merge(std::get<T>(incoming));
    }, existing);
    return ok();
}

std::vector<std::string> render(const Event& event, std::string_view prefix) {
    std::vector<std::string> lines;
    std::visit([&](const auto& e) { e.render(prefix, lines); }, event);
    return lines;
}

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

Result<Event> parse_line(std::string_view text) {
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) text.remove_suffix(1);

    auto colon = text.find(':');
    auto pipe = text.find('|', colon == std::string_view::npos ? 0 : colon);
    if (colon == std::string_view::npos || colon == 0 || pipe == std::string_view::npos) {
        return Error{"Malformed StatsD line: '" + std::string(text) + "'"};
    }

    auto name = std::string(text.substr(0, colon));
    auto value = text.substr(colon + 1, pipe - colon - 1);
    auto type = text.substr(pipe + 1);
    if (type.find('|') != std::string_view::npos) {
        return Error{"Sample rates and tags are not supported: '" + std::string(text) + "'"};
    }
    if (value.empty()) {
        return Error{"Missing value in '" + std::string(text) + "'"};
    }

    if (type == "ms") {
        double millis = 0.0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), millis);
        if (ec != std::errc{} || ptr != value.data() + value.size()
            || !std::isfinite(millis) || millis < 0.0) {
            return Error{"Invalid timing value in '" + std::string(text) + "'"};
        }
        if (millis > MAX_TIMING_MILLIS) {
            return Error{"Timing value out of range in '" + std::string(text) + "'"};
        }
        return Event{Timing::sample(std::move(name),
                                    Duration(static_cast<Duration::rep>(std::llround(millis * 1000.0))))};
    }

    bool explicit_sign = value.front() == '+' || value.front() == '-';
    auto digits = value.front() == '+' ? value.substr(1) : value;
    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return Error{"Invalid integer value in '" + std::string(text) + "'"};
    }

    if (type == "c") return Event{Increment{.name = std::move(name), .value = number}};
    if (type == "g") {
        if (explicit_sign) return Event{GaugeDelta{.name = std::move(name), .value = number}};
        return Event{Gauge{.name = std::move(name), .value = number}};
    }
    if (type == "a") return Event{Absolute{.name = std::move(name), .values = {number}}};
    if (type == "t") return Event{Total{.name = std::move(name), .value = number}};

    return Error{"Unknown metric type '" + std::string(type) + "'"};
}

std::string to_string(const Event& event, std::string_view prefix) {
    std::string out;
    for (const auto& l : render(event, prefix)) {
        if (!out.empty()) out += '\n';
        out += l;
    }
    return out;
}

}  // namespace buffered_statsd
