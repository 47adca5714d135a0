#include <string>
#include <vector>
#include <cmath>
#include <limits>
#include <memory>
#include <type_traits>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

// cmblike
#include "cmblike/structs.hpp"

#ifndef __CMBLIKE_GENERIC_INTERFACE_HPP
#define __CMBLIKE_GENERIC_INTERFACE_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Global Functions
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> read_table(const std::string file_name);

// https://en.cppreference.com/w/cpp/types/numeric_limits/epsilon
template<class T>
typename std::enable_if<!std::numeric_limits<T>::is_integer, bool>::type
almost_equal(T x, T y, int ulp = 100)
{
  // the machine epsilon has to be scaled to the magnitude of the values used
  // and multiplied by the desired precision in ULPs (units in the last place)
  return std::fabs(x-y) <= std::numeric_limits<T>::epsilon() * std::fabs(x+y) * ulp
      // unless the result is subnormal
      || std::fabs(x-y) < std::numeric_limits<T>::min();
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// INIT FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void initial_setup();

// Expand {band}, {nside} and {lmax} in a file name template
std::string expand_file_template(
    const std::string& file_template,
    const int band,
    const int nside,
    const int lmax
  );

Config load_config(const std::string& params_filename);

// Columns: x y z temperature rms (one row per pixel)
SkyMap load_sky_map(const std::string& filename);

// Beam or pixel window: one row per multipole starting at l = 0, either
// (value) or (l, value). Rows past lmax are dropped.
arma::Col<double> load_window_function(
    const std::string& filename,
    const int lmax,
    std::string_view what
  );

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// COMPUTE FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Col<double> compute_grid_axis(
    const double min,
    const double max,
    const int numpoint
  );

// -2 ln(L) at one (Q, n). Returns +infinity if the total covariance
// S(Q,n) + noise_fg_cov is not positive definite.
double compute_lnL_point(
    const arma::Col<double>& data,
    const arma::Mat<double>& noise_fg_cov,
    const arma::Cube<double>& pl,
    const arma::Col<double>& beam,
    const arma::Col<double>& pixwin,
    const double Q,
    const double n
  );

// Element (i,j) holds -2 ln(L) at (q(i), n(j)). If point_logger is set,
// every grid point is written to it.
arma::Mat<double> compute_lnL_grid(
    const SkyMap& map,
    const arma::Col<double>& beam,
    const arma::Col<double>& pixwin,
    const arma::Col<double>& q,
    const arma::Col<double>& n,
    const int lmax,
    const double foreground_amplitude,
    std::shared_ptr<spdlog::logger> point_logger = nullptr
  );

arma::Mat<double> compute_lnL_grid(
    const Config& config,
    const SkyMap& map,
    const arma::Col<double>& beam,
    const arma::Col<double>& pixwin
  );

PosteriorSummary compute_posterior(
    const arma::Mat<double>& lnL,
    const arma::Col<double>& q,
    const arma::Col<double>& n
  );

void save_lnL_grid(const arma::Mat<double>& lnL, const std::string& filename);

}  // namespace cmblike
#endif // HEADER GUARD
