#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace pitwall {

// Dry-weather slick compounds only.
enum class Compound : int {
  Soft = 0,
  Medium = 1,
  Hard = 2,
};

const char* to_string(Compound c);

// Case-insensitive, surrounding whitespace ignored. nullopt for anything else.
std::optional<Compound> compound_from_string(std::string_view s);

} // namespace pitwall
