#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <fmt/core.h>

#include <specdeform/core/config.hpp>
#include <specdeform/core/input.hpp>
#include <specdeform/core/log.hpp>
#include <specdeform/core/timer.hpp>
#include <specdeform/data/complex_coordinate.hpp>
#include <specdeform/ops/eigenmodes.hpp>
#include <specdeform/ops/model_problem.hpp>

using namespace specdeform;

namespace {

constexpr double kYStart = 0.0;
constexpr double kYEnd = 1.0;
constexpr int kRefinement = 8;
constexpr double kConvergenceTol = 1e-8;
constexpr int kModesToReport = 5;

struct RunSummary {
  std::string name;
  bool deformed = false;
  Eigen::Index n_valid = 0;
  std::vector<core::Scalar> lowest;
};

RunSummary run_deformation(const data::DeformationParams &params, int n_modes,
                           const core::RuntimeConfig &config) {
  const auto coordinate = data::make_complex_coordinate(kYStart, kYEnd, params);
  const core::Logger logger(coordinate.name(), config.log_level);
  logger.debug(fmt::format("label {}", coordinate.profile().label()));

  const auto coarse = ops::solve_dirichlet_laplacian(coordinate, n_modes, config);
  const auto fine =
      ops::solve_dirichlet_laplacian(coordinate, n_modes + kRefinement, config);

  core::EigenMatrix eigen_matrix =
      ops::sort_by_eigenvalue(coarse.eigenvalues, coarse.eigenvectors);
  const Eigen::VectorXcd sorted_values = eigen_matrix.row(n_modes).transpose();

  const core::ValidityMask mask =
      ops::convergence_mask(sorted_values, fine.eigenvalues, kConvergenceTol);
  Eigen::VectorXd growth_rate = sorted_values.imag();
  Eigen::VectorXd magnitude = sorted_values.cwiseAbs();

  const Eigen::Index screened =
      ops::screen_eigenmodes(eigen_matrix, mask, growth_rate, magnitude);
  logger.info(fmt::format("screened {} of {} modes", screened, n_modes));

  eigen_matrix = ops::sort_by_eigenvalue(eigen_matrix);

  RunSummary summary;
  summary.name = coordinate.name();
  summary.deformed = data::is_deformed(coordinate);
  summary.n_valid = ops::count_valid_modes(eigen_matrix);
  const Eigen::Index n_report =
      std::min<Eigen::Index>(kModesToReport, summary.n_valid);
  for (Eigen::Index k = 0; k < n_report; ++k) {
    summary.lowest.push_back(eigen_matrix(n_modes, k));
  }
  return summary;
}

} // namespace

int main(int argc, char **argv) {
  try {
    const core::RuntimeConfig config = core::RuntimeConfig::from_env();
    const core::Logger logger("main_spectrum", config.log_level);

    const int n_modes = core::input_value<int>(argc, argv, 32);
    if (n_modes < 4) {
      logger.error("Invalid argument");
      return 1;
    }

    logger.show_params(std::pair{"n_modes", n_modes},
                       std::pair{"y_range", fmt::format("[{}, {}]", kYStart, kYEnd)},
                       std::pair{"threads", config.resolved_thread_count()});

    const std::vector<data::DeformationParams> sweep = {
        {0.0, 0.0, 0.0},
        {0.0, 0.1, 0.0},
        {0.3, 0.1, 0.05},
        {0.5, 0.2, -0.1},
    };

    core::Timer timer("main_spectrum", config.log_level);
    timer.start();
    core::ProgressBar progress("deformation sweep", static_cast<int>(sweep.size()),
                               stderr, config.log_level);
    progress.start();

    std::vector<RunSummary> summaries;
    summaries.reserve(sweep.size());
    for (size_t i = 0; i < sweep.size(); ++i) {
      summaries.push_back(run_deformation(sweep[i], n_modes, config));
      progress.update(static_cast<int>(i + 1));
    }
    timer.end();

    const double length = kYEnd - kYStart;
    for (const auto &summary : summaries) {
      fmt::print("{} deformed={} valid={}\n", summary.name, summary.deformed,
                 summary.n_valid);
      for (size_t k = 0; k < summary.lowest.size(); ++k) {
        const double exact =
            ops::dirichlet_laplacian_eigenvalue(static_cast<int>(k) + 1, length);
        fmt::print("  k={} lambda={:.10f}{:+.3e}i exact={:.10f}\n", k + 1,
                   summary.lowest[k].real(), summary.lowest[k].imag(), exact);
      }
    }
  } catch (const std::exception &e) {
    core::Logger("main_spectrum").critical(e.what());
    return 1;
  }

  return 0;
}
