#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <upace/csv_io.hpp>
#include <upace/fatigue.hpp>
#include <upace/planner.hpp>
#include <upace/race_summary.hpp>
#include <upace/split_analysis.hpp>

using namespace upace;

namespace {

void usage(const char* argv0) {
  std::fprintf(stderr,
    "usage: %s --track FILE --segments FILE [--activity FILE] [--nutrition FILE]\n"
    "          [--athletes FILE] [--athlete KEY] [--fatigue PCT_PER_10MI]\n"
    "          [--tier aggressive|balanced|conservative] [--actual FILE]\n", argv0);
}

std::optional<StrategyTier> parse_tier(const std::string& s) {
  if (s == "aggressive")   return StrategyTier::Aggressive;
  if (s == "balanced")     return StrategyTier::Balanced;
  if (s == "conservative") return StrategyTier::Conservative;
  return std::nullopt;
}

void print_plan(const RacePlan& plan, const AthleteProfile& athlete) {
  std::printf("athlete=%s  weight=%.1fkg  fitness=%s  fatigue=%.2f%%/10mi\n\n",
              athlete.key.c_str(), athlete.metrics.body_weight_kg,
              to_string(athlete.metrics.fitness), plan.fatigue_factor);

  std::printf("%-3s %-20s %7s %7s %6s %6s %-7s %8s %9s %-9s\n",
              "#", "checkpoint", "dist", "cum", "grade", "pace", "conf", "split", "arrive", "bonk");
  for (std::size_t i = 0; i < plan.segments.size(); ++i) {
    const auto& sp = plan.segments[i];
    const auto& arr = plan.summary.arrivals[i];
    std::printf("%-3zu %-20.20s %7.2f %7.2f %5.1f%% %6s %-7s %8s %9s %-9s\n",
                i + 1, sp.segment.checkpoint_name.c_str(),
                sp.segment.segment_distance, sp.segment.cumulative_distance,
                sp.derivation.elevation_details.avg_gradient,
                format_pace(sp.pace).c_str(), to_string(sp.derivation.confidence),
                format_duration(sp.minutes_with_fatigue).c_str(),
                format_duration(arr.arrival_minutes).c_str(),
                sp.energy ? to_string(sp.energy->bonk_risk) : "-");
  }

  std::printf("\nstrategies and targets\n");
  for (std::size_t i = 0; i < plan.segments.size(); ++i) {
    const auto& sp = plan.segments[i];
    std::printf("  %s: %s\n", sp.segment.checkpoint_name.c_str(), sp.derivation.reasoning.c_str());
    for (const auto& s : sp.strategies) {
      std::printf("    %-12s %6s/mi  conf=%-6s", to_string(s.tier),
                  format_pace(s.pace).c_str(), to_string(s.confidence));
      if (s.suggested_hr) {
        std::printf("  hr=%.0f-%.0f (%s)", s.suggested_hr->min_bpm, s.suggested_hr->max_bpm,
                    s.suggested_hr->zone_name.c_str());
      }
      if (s.suggested_power) {
        std::printf("  power=%.0f-%.0fW (%s)", s.suggested_power->min_watts,
                    s.suggested_power->max_watts, s.suggested_power->zone_name.c_str());
      }
      std::printf("\n");
    }
  }

  bool has_energy = false;
  for (const auto& sp : plan.segments) has_energy = has_energy || sp.energy.has_value();
  if (has_energy) {
    std::printf("\nenergy balance\n");
    std::printf("  %-20s %8s %8s %8s %9s %9s\n", "checkpoint", "burned", "eaten", "deficit", "glycogen", "to bonk");
    for (const auto& sp : plan.segments) {
      if (!sp.energy) continue;
      const auto& e = *sp.energy;
      char ttb[32] = "-";
      if (e.time_to_bonk_minutes) std::snprintf(ttb, sizeof(ttb), "%s", format_duration(*e.time_to_bonk_minutes).c_str());
      std::printf("  %-20.20s %8.0f %8.0f %8.0f %8.0f%% %9s\n",
                  sp.segment.checkpoint_name.c_str(), e.segment_calories_burned,
                  e.segment_calories_consumed, e.segment_deficit,
                  e.estimated_glycogen_percent, ttb);
      for (const auto& w : e.segment_warnings) std::printf("    ! %s\n", w.c_str());
      for (const auto& t : e.general_tips)     std::printf("    - %s\n", t.c_str());
    }
  }

  const auto& ecc = plan.eccentric;
  std::printf("\ndescent load %s (score %.0f, %.0f m down)\n", to_string(ecc.level),
              ecc.total_score, ecc.total_loss_m);
  std::printf("  %s. %s\n", load_message(ecc.level), training_advice(ecc.level));
  for (const auto& sp : plan.segments) {
    if (!(sp.eccentric.gradient < 0.0)) continue;
    std::printf("  %-20.20s %5.1f%% %-9s score %3.0f  %s\n", sp.segment.checkpoint_name.c_str(),
                sp.eccentric.gradient, to_string(sp.eccentric.strategy.category),
                sp.eccentric.score, sp.eccentric.strategy.advice);
    for (const auto& w : sp.eccentric.warnings) std::printf("    ! %s\n", w.c_str());
  }
  for (const auto& r : ecc.recommendations) std::printf("  - %s\n", r.c_str());

  const auto& sum = plan.summary;
  std::printf("\nrunning %s (no fatigue %s) + stops %s = finish %s\n",
              format_duration(plan.total_minutes_with_fatigue).c_str(),
              format_duration(plan.total_minutes_without_fatigue).c_str(),
              format_duration(sum.checkpoint_minutes).c_str(),
              format_duration(sum.total_minutes).c_str());
  std::printf("avg pace %s/mi  running %.1f%% of race time\n",
              format_pace(average_pace(sum)).c_str(), running_time_percentage(sum));

  const double finish_miles = plan.segments.empty() ? 0.0
                            : plan.segments.back().segment.cumulative_distance;
  const double fade = (fatigue_multiplier(finish_miles, plan.fatigue_factor) - 1.0) * 100.0;
  std::printf("pace at finish +%.1f%% (%s)\n", fade, fatigue_description(fade));
}

void print_analytics(const RaceAnalytics& ra) {
  std::printf("\nactual vs plan\n");
  std::printf("  %-20s %9s %9s %7s %7s %8s\n", "checkpoint", "planned", "actual", "var", "gap", "effort");
  for (const auto& s : ra.splits) {
    std::printf("  %-20.20s %9s %9s %6.1f%% %7s %8s\n", s.checkpoint_name.c_str(),
                format_duration(s.planned_time).c_str(), format_duration(s.actual_time).c_str(),
                s.pace_variance, s.avg_gap ? format_pace(*s.avg_gap).c_str() : "-",
                s.effort ? to_string(*s.effort) : "-");
  }
  std::printf("  efficiency %d (%c)  consistency %s  negative split %s  fade %.1f%%/h\n",
              ra.efficiency_score, ra.efficiency_grade, to_string(ra.pacing_consistency),
              ra.negative_split ? "yes" : "no", ra.fade_rate_per_hour);
  for (const auto& in : ra.insights) {
    std::printf("  [%s/%s] %s: %s (%s)\n", to_string(in.category), to_string(in.priority),
                in.message.c_str(), in.recommendation.c_str(), in.details.c_str());
  }
}

} // namespace

int main(int argc, char** argv) {
  InputPaths paths;
  PlanOptions opt;
  std::string actual_path;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto next = [&]() -> const char* { return (i + 1 < argc) ? argv[++i] : nullptr; };
    const char* v = nullptr;
    if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
    if (a == "--track" && (v = next()))          paths.track = v;
    else if (a == "--segments" && (v = next()))  paths.segments = v;
    else if (a == "--activity" && (v = next()))  paths.activity = v;
    else if (a == "--nutrition" && (v = next())) paths.nutrition = v;
    else if (a == "--athletes" && (v = next()))  paths.athletes = v;
    else if (a == "--athlete" && (v = next()))   paths.athlete_key = v;
    else if (a == "--actual" && (v = next()))    actual_path = v;
    else if (a == "--fatigue" && (v = next())) {
      char* end = nullptr;
      const double f = std::strtod(v, &end);
      if (end == v || *end != '\0' || !(f >= 0.0)) {
        std::fprintf(stderr, "invalid fatigue factor: %s\n", v);
        return 2;
      }
      opt.fatigue_factor = f;
    }
    else if (a == "--tier" && (v = next())) {
      auto t = parse_tier(v);
      if (!t) { std::fprintf(stderr, "unknown tier: %s\n", v); return 2; }
      opt.tier = *t;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  std::string err;
  auto in = load_plan_inputs(paths, err);
  if (!in) {
    std::fprintf(stderr, "error: %s\n", err.c_str());
    usage(argv[0]);
    return 1;
  }

  auto plan = build_race_plan(in->track, in->segments, in->activity, &in->athlete.metrics, opt);
  if (!plan) {
    std::fprintf(stderr, "error: segment cumulative distances decrease when sorted by order\n");
    return 1;
  }
  print_plan(*plan, in->athlete);

  if (!actual_path.empty()) {
    auto actual = load_activity_csv(actual_path);
    if (!actual) {
      std::fprintf(stderr, "error: cannot open actual activity file: %s\n", actual_path.c_str());
      return 1;
    }
    std::vector<Segment> planned;
    for (const auto& sp : plan->segments) planned.push_back(sp.segment);
    SplitOptions so;
    if (in->athlete.metrics.max_hr) so.max_heart_rate = *in->athlete.metrics.max_hr;
    if (auto ra = calculate_race_analytics(planned, *actual, so)) {
      print_analytics(*ra);
    } else {
      std::printf("\nno overlapping data between plan and actual activity\n");
    }
  }
  return 0;
}
