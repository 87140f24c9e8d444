/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for BufferedStatsd interfaces.
 * @author Dimitris Kafetzis
 *
 * Event variants are merged on the processing-loop hot path for every
 * submitted metric, so they are constrained at compile time and dispatched
 * through std::visit rather than through a virtual base class.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// MetricEventLike
// ─────────────────────────────────────────────

/**
 * @concept MetricEventLike
 * @brief Constrains the alternatives of the Event variant.
 *
 * Each alternative exposes its identity key, merges a newer event of the
 * same type into itself in place, and renders itself as StatsD lines.
 */
template <typename T>
concept MetricEventLike = requires(T event,
                                   const T& other,
                                   std::string_view prefix,
                                   std::vector<std::string>& lines) {
    { T::kind } -> std::convertible_to<MetricKind>;
    { std::as_const(event).key() } -> std::convertible_to<std::string_view>;
    { event.merge(other) } -> std::same_as<void>;
    { std::as_const(event).render(prefix, lines) } -> std::same_as<void>;
};

}  // namespace buffered_statsd
