#include "cairn/io/composition_parser.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <set>

namespace cairn::io {

namespace {

auto trim(std::string_view text) -> std::string_view {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

auto parse_number(std::string_view text) -> std::optional<double> {
  double value = 0.0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

auto parse_composition(std::string_view text) -> std::expected<Composition, core::ConfigurationError> {
  Composition composition;
  std::set<std::string, std::less<>> seen;
  double total = 0.0;

  std::size_t start = 0;
  while (start <= text.size()) {
    const auto comma = text.find(',', start);
    const auto entry = trim(text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
    start = comma == std::string_view::npos ? text.size() + 1 : comma + 1;

    if (entry.empty()) {
      continue;
    }

    const auto colon = entry.find(':');
    if (colon == std::string_view::npos) {
      return std::unexpected(
          core::ConfigurationError(std::format("composition entry '{}' is not of the form SPECIES:VALUE", entry)));
    }

    const auto species = trim(entry.substr(0, colon));
    const auto value_text = trim(entry.substr(colon + 1));
    if (species.empty()) {
      return std::unexpected(core::ConfigurationError(std::format("composition entry '{}' has no species", entry)));
    }

    auto value = parse_number(value_text);
    if (!value || !std::isfinite(*value) || *value < 0.0) {
      return std::unexpected(core::ConfigurationError(
          std::format("invalid fraction '{}' for species '{}' in composition", value_text, species)));
    }
    if (!seen.emplace(species).second) {
      return std::unexpected(
          core::ConfigurationError(std::format("species '{}' appears twice in composition", species)));
    }

    composition.push_back({std::string(species), *value});
    total += *value;
  }

  if (composition.empty()) {
    return std::unexpected(core::ConfigurationError("composition is empty"));
  }
  if (!(total > 0.0)) {
    return std::unexpected(core::ConfigurationError("composition fractions sum to zero"));
  }
  return composition;
}

auto format_composition(const Composition& composition) -> std::string {
  std::string text;
  for (std::size_t i = 0; i < composition.size(); ++i) {
    if (i > 0) {
      text.append(", ");
    }
    text.append(std::format("{}:{}", composition[i].species, composition[i].value));
  }
  return text;
}

} // namespace cairn::io
