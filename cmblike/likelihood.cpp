#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "cmblike/likelihood.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errorsz1d = "{}: {} {} (!= {})"sv;

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using spdlog::debug;
using spdlog::critical;

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double compute_lnL(const vector& data, const matrix& cov)
{
  static constexpr std::string_view fname = "compute_lnL"sv;
  debug("{}: {}", fname, errbegins);
  if (0 == data.n_elem) [[unlikely]] {
    critical("{}: empty data vector", fname); exit(1);
  }
  if (!cov.is_square()) [[unlikely]] {
    critical("{}: covariance is {} x {} (must be square)",
      fname, cov.n_rows, cov.n_cols); exit(1);
  }
  if (cov.n_rows != data.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "covariance dimension =", cov.n_rows,
      data.n_elem); exit(1);
  }

  matrix L;
  if (!arma::chol(L, cov, "lower")) {
    throw not_positive_definite(std::string(fname) +
      ": covariance matrix not positive definite");
  }

  // det(C) = det(L)^2
  const double lndet = 2.0 * arma::accu(arma::log(L.diag()));

  vector x;
  const bool status = arma::solve(x, arma::trimatl(L), data,
    arma::solve_opts::no_approx);
  if (!status || !std::isfinite(lndet)) {
    throw not_positive_definite(std::string(fname) +
      ": singular Cholesky factor");
  }

  const double result = arma::dot(x, x) + lndet;
  debug("{}: chi2 = {:.6e}, ln(det C) = {:.6e}", fname, arma::dot(x, x), lndet);
  debug("{}: {}", fname, errends);
  return result;
}

}  // namespace cmblike
