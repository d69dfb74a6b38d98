#include <cstring>
#include <string>

#include "phaseflow/logging.hpp"
#include "phaseflow/phaseflow.hpp"

int main(int argc, char** argv) {
  if (argc > 1 && std::strcmp(argv[1], "-v") == 0) {
    phaseflow::log::SetLevel(phaseflow::log::Level::kDebug);
  }

  for (const auto& preset : phaseflow::Presets()) {
    phaseflow::PhasePortrait portrait(preset.matrix);

    phaseflow::log::Info("== ", preset.name, " ==");
    phaseflow::log::Info(phaseflow::FormatSystem(portrait.matrix()));
    phaseflow::log::Info(phaseflow::FormatAnalysis(portrait.analysis()));
    phaseflow::log::Info("tr = ", portrait.analysis().trace, " det = ", portrait.analysis().determinant,
                         " disc = ", portrait.analysis().discriminant);

    for (const auto& line : portrait.eigenlines()) {
      phaseflow::log::Info("eigenline (", line.from.x, ", ", line.from.y, ") -> (", line.to.x, ", ", line.to.y, ")");
    }

    for (const phaseflow::Point p0 : {phaseflow::Point{1.0, 0.0}, phaseflow::Point{-2.0, 1.5}}) {
      const auto& traj = portrait.add_trajectory(p0);
      phaseflow::log::Info("trajectory ", traj.id, " through (", p0.x, ", ", p0.y, "): ", traj.points.size(),
                           " samples, from (", traj.points.front().x, ", ", traj.points.front().y, ") to (",
                           traj.points.back().x, ", ", traj.points.back().y, "), hue ", traj.color.hue);
      for (const auto& arrow : phaseflow::arrow_anchors(traj.points)) {
        phaseflow::log::Debug("  arrow at (", arrow.at.x, ", ", arrow.at.y, ") angle ", arrow.angle);
      }
    }

    const auto field = portrait.direction_field();
    double max_len = 0.0;
    for (const auto& s : field) {
      max_len = s.length > max_len ? s.length : max_len;
    }
    phaseflow::log::Info("direction field: ", field.size(), " samples, max |f| = ", max_len);
  }

  // Single-direction run with status reporting.
  phaseflow::IntegratorOptions opt;
  const auto res = phaseflow::integrate(*phaseflow::FindPreset("Saddle"), phaseflow::Point{1.0, 0.1}, opt);
  if (res.status == phaseflow::IntegratorStatus::NaNDetected) {
    phaseflow::log::Error("saddle run produced non-finite samples");
    return 1;
  }
  phaseflow::log::Info("saddle forward run: status=", phaseflow::ToString(res.status),
                       " accepted=", res.stats.accepted_steps, " rhs_evals=", res.stats.rhs_evals);

  return 0;
}
