#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <expected>
#include <string_view>

namespace cairn::io {

// Parses "N2:0.79, O2:0.21" into ordered species/fraction pairs.
// Fractions must be finite and non-negative, species must not repeat and the
// total must be positive. Values are kept as written (not normalized).
[[nodiscard]] auto parse_composition(std::string_view text) -> std::expected<Composition, core::ConfigurationError>;

// Inverse of parse_composition
[[nodiscard]] auto format_composition(const Composition& composition) -> std::string;

} // namespace cairn::io
