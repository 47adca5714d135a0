#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "cmblike/covariance.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errorsz1d = "{}: {} {} (!= {})"sv;
static constexpr std::string_view errorszcl =
  "{}: size of {} = {} incompatible with size of {} = {}"sv;

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
// NOISE
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix compute_noise_cov(const vector& rms)
{
  static constexpr std::string_view fname = "compute_noise_cov"sv;
  debug("{}: {}", fname, errbegins);
  for (arma::uword i=0; i<rms.n_elem; i++) {
    if (!std::isfinite(rms(i)) || rms(i) < 0.0) [[unlikely]] {
      critical("{}: rms({}) = {} invalid (must be finite and >= 0)",
        fname, i, rms(i)); exit(1);
    }
  }
  matrix N = arma::diagmat(arma::square(rms));
  debug("{}: {}", fname, errends);
  return N;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// MONOPOLE AND DIPOLE TEMPLATES
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix compute_foreground_cov(
    const vector& x,
    const vector& y,
    const vector& z,
    const double amplitude
  )
{
  static constexpr std::string_view fname = "compute_foreground_cov"sv;
  debug("{}: {}", fname, errbegins);
  if (y.n_elem != x.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "size of y =", y.n_elem, x.n_elem); exit(1);
  }
  if (z.n_elem != x.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "size of z =", z.n_elem, x.n_elem); exit(1);
  }
  if (!std::isfinite(amplitude) || amplitude < 0.0) [[unlikely]] {
    critical("{}: amplitude = {} invalid (must be finite and >= 0)",
      fname, amplitude); exit(1);
  }
  matrix F(x.n_elem, x.n_elem, arma::fill::ones); // monopole
  F += x * x.t() + y * y.t() + z * z.t();         // dipole
  F *= amplitude;
  debug("{}: {}", fname, errends);
  return F;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// SIGNAL
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix compute_signal_cov(
    const vector& cl,
    const vector& beam,
    const vector& pixwin,
    const cube& pl
  )
{
  static constexpr std::string_view fname = "compute_signal_cov"sv;
  debug("{}: {}", fname, errbegins);
  if (0 == cl.n_elem) [[unlikely]] {
    critical("{}: empty C_ell", fname); exit(1);
  }
  if (beam.n_elem != cl.n_elem) [[unlikely]] {
    critical(errorszcl, fname, "beam", beam.n_elem, "C_ell", cl.n_elem);
    exit(1);
  }
  if (pixwin.n_elem != cl.n_elem) [[unlikely]] {
    critical(errorszcl, fname, "pixwin", pixwin.n_elem, "C_ell", cl.n_elem);
    exit(1);
  }
  if (pl.n_slices != cl.n_elem) [[unlikely]] {
    critical(errorszcl, fname, "Legendre tensor (slices)", pl.n_slices,
      "C_ell", cl.n_elem);
    exit(1);
  }
  if (pl.n_rows != pl.n_cols) [[unlikely]] {
    critical("{}: Legendre tensor slices are {} x {} (must be square)",
      fname, pl.n_rows, pl.n_cols); exit(1);
  }

  // (2l+1) beam_l^2 pixwin_l^2 C_l: everything independent of (i,j)
  const vector ell = arma::regspace<vector>(0, cl.n_elem - 1);
  const vector weight = (2.0*ell + 1.0) % arma::square(beam)
                      % arma::square(pixwin) % cl;

  matrix S(pl.n_rows, pl.n_cols, arma::fill::zeros);
  for (arma::uword l=0; l<pl.n_slices; l++) {
    if (weight(l) != 0.0) {
      S += weight(l) * pl.slice(l);
    }
  }
  S /= (4.0 * M_PI);
  debug("{}: {}", fname, errends);
  return S;
}

}  // namespace cmblike
