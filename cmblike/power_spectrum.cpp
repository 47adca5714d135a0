#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "cmblike/power_spectrum.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errdomain =
  "{}: domain error, spectral index n = {} gives {} = {} at l = {}"sv;

using vector = arma::Col<double>;
using spdlog::debug;
using spdlog::critical;

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

bool is_spectral_index_valid(const double n, const int lmax)
{
  if (!std::isfinite(n)) {
    return false;
  }
  for (int l=2; l<lmax; l++) {
    if (!(2.0*l + 5.0 - n > 0.0) || !(2.0*l + n - 1.0 >= 0.0)) {
      return false;
    }
  }
  return true;
}

void check_spectral_index(const double n, const int lmax)
{
  static constexpr std::string_view fname = "check_spectral_index"sv;
  if (!std::isfinite(n)) [[unlikely]] {
    critical("{}: domain error, spectral index n = {} (not finite)", fname, n);
    exit(1);
  }
  for (int l=2; l<lmax; l++) {
    const double den = 2.0*l + 5.0 - n;
    const double num = 2.0*l + n - 1.0;
    if (!(den > 0.0)) [[unlikely]] {
      critical(errdomain, fname, n, "denominator (2l + 5 - n)", den, l);
      exit(1);
    }
    if (!(num >= 0.0)) [[unlikely]] {
      critical(errdomain, fname, n, "numerator (2l + n - 1)", num, l);
      exit(1);
    }
  }
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

vector compute_cl_model(const double Q, const double n, const int lmax)
{
  static constexpr std::string_view fname = "compute_cl_model"sv;
  debug("{}: {}", fname, errbegins);
  if (lmax < 2) [[unlikely]] {
    critical("{}: lmax = {} not supported (min = 2)", fname, lmax); exit(1);
  }
  if (!std::isfinite(Q) || !(Q > 0.0)) [[unlikely]] {
    critical("{}: domain error, amplitude Q = {} (must be > 0)", fname, Q);
    exit(1);
  }
  check_spectral_index(n, lmax);

  vector cl(lmax + 1, arma::fill::zeros);
  cl(2) = 4.0 * M_PI / 5.0 * Q * Q;
  for (int l=2; l<lmax; l++) {
    cl(l+1) = cl(l) * (2.0*l + n - 1.0) / (2.0*l + 5.0 - n);
  }
  debug("{}: Q = {:.4e}, n = {:.4e}, C_2 = {:.4e}, C_lmax = {:.4e}",
    fname, Q, n, cl(2), cl(lmax));
  debug("{}: {}", fname, errends);
  return cl;
}

}  // namespace cmblike
