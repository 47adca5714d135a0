#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "cmblike/legendre.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errorsz1d = "{}: {} {} (!= {})"sv;

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using cube = arma::Cube<double>;
using spdlog::debug;
using spdlog::critical;

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix compute_cos_theta(const vector& x, const vector& y, const vector& z)
{
  static constexpr std::string_view fname = "compute_cos_theta"sv;
  debug("{}: {}", fname, errbegins);
  if (0 == x.n_elem) [[unlikely]] {
    critical("{}: empty pixel set", fname); exit(1);
  }
  if (y.n_elem != x.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "size of y =", y.n_elem, x.n_elem); exit(1);
  }
  if (z.n_elem != x.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "size of z =", z.n_elem, x.n_elem); exit(1);
  }

  const vector norm2 = x % x + y % y + z % z;
  const double maxdev = arma::max(arma::abs(norm2 - 1.0));
  if (maxdev > 1.0e-6) {
    spdlog::warn("{}: pixel vectors are not unit norm (max |r^2 - 1| = {:.3e})",
      fname, maxdev);
  }

  const matrix pos = arma::join_rows(arma::join_rows(x, y), z); // N x 3
  matrix costheta = pos * pos.t();

  // round-off can push |cos(theta)| slightly past one
  costheta = arma::clamp(costheta, -1.0, 1.0);
  costheta = arma::symmatl(costheta);
  debug("{}: {}", fname, errends);
  return costheta;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

cube compute_legendre_tensor(const matrix& costheta, const int lmax)
{
  static constexpr std::string_view fname = "compute_legendre_tensor"sv;
  debug("{}: {}", fname, errbegins);
  if (lmax < 0) [[unlikely]] {
    critical("{}: lmax = {} not supported (min = 0)", fname, lmax); exit(1);
  }
  if (!costheta.is_square()) [[unlikely]] {
    critical("{}: cos(theta) matrix is {} x {} (must be square)",
      fname, costheta.n_rows, costheta.n_cols); exit(1);
  }
  const arma::uword N = costheta.n_rows;

  cube pl(N, N, lmax + 1);
  pl.slice(0).ones();
  if (lmax > 0) {
    pl.slice(1) = costheta;
  }
  for (int l=1; l<lmax; l++) {
    // P_{l+1} = ((2l+1) z P_l - l P_{l-1})/(l+1)
    const double Pl_this_coeff = static_cast<double>(2*l + 1);
    const double Pl_last_coeff = static_cast<double>(l);
    const double Pl_next_coeff = static_cast<double>(l + 1);
    pl.slice(l+1) = (Pl_this_coeff * costheta % pl.slice(l)
                     - Pl_last_coeff * pl.slice(l-1)) / Pl_next_coeff;
  }
  debug("{}: {} x {} x {} tensor computed", fname, N, N, lmax + 1);
  debug("{}: {}", fname, errends);
  return pl;
}

cube compute_legendre_tensor(
    const int lmax,
    const vector& x,
    const vector& y,
    const vector& z
  )
{
  return compute_legendre_tensor(compute_cos_theta(x, y, z), lmax);
}

}  // namespace cmblike
