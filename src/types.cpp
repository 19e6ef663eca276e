#include <upace/types.hpp>

namespace upace {

const char* to_string(Confidence c) {
  switch (c) {
    case Confidence::High:   return "high";
    case Confidence::Medium: return "medium";
    case Confidence::Low:    return "low";
  }
  return "low";
}

const char* to_string(BonkRisk r) {
  switch (r) {
    case BonkRisk::None:     return "none";
    case BonkRisk::Low:      return "low";
    case BonkRisk::Moderate: return "moderate";
    case BonkRisk::High:     return "high";
    case BonkRisk::Critical: return "critical";
  }
  return "none";
}

} // namespace upace
