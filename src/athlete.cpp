#include <upace/athlete.hpp>
#include <algorithm>
#include <cctype>

namespace upace {

static std::vector<AthleteProfile> make_catalog_builtin() {
  return {
    {"default", {70.0, 2.0, FitnessLevel::Trained, std::nullopt, std::nullopt, std::nullopt}},
    {"light",   {58.0, 1.5, FitnessLevel::Elite, std::nullopt, std::nullopt, std::nullopt}},
    {"heavy",   {88.0, 3.0, FitnessLevel::Recreational, std::nullopt, std::nullopt, std::nullopt}},
  };
}

const std::vector<AthleteProfile>& athlete_catalog() {
  static const std::vector<AthleteProfile> cat = make_catalog_builtin();
  return cat;
}

std::optional<AthleteProfile> athlete_by_key(const std::string& key) {
  return athlete_by_key_in(athlete_catalog(), key);
}

std::optional<AthleteProfile> athlete_by_key_in(const std::vector<AthleteProfile>& cat,
                                                const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const AthleteProfile& a){ return a.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<FitnessLevel> parse_fitness_level(const std::string& s) {
  const auto l = lower(s);
  if (l == "recreational") return FitnessLevel::Recreational;
  if (l == "trained" || l.empty()) return FitnessLevel::Trained;
  if (l == "elite") return FitnessLevel::Elite;
  return std::nullopt;
}

const char* to_string(FitnessLevel f) {
  switch (f) {
    case FitnessLevel::Recreational: return "recreational";
    case FitnessLevel::Trained:      return "trained";
    case FitnessLevel::Elite:        return "elite";
  }
  return "trained";
}

} // namespace upace
