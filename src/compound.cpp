#include <pitwall/compound.hpp>
#include <pitwall/csv.hpp>

namespace pitwall {

const char* to_string(Compound c) {
  switch (c) {
    case Compound::Soft:   return "SOFT";
    case Compound::Medium: return "MEDIUM";
    case Compound::Hard:   return "HARD";
  }
  return "UNKNOWN";
}

std::optional<Compound> compound_from_string(std::string_view s) {
  const std::string u = upper(trim(std::string(s)));
  if (u == "SOFT")   return Compound::Soft;
  if (u == "MEDIUM") return Compound::Medium;
  if (u == "HARD")   return Compound::Hard;
  return std::nullopt;
}

} // namespace pitwall
