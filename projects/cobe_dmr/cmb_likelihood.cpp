#include <string>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

// cmblike
#include "cmblike/generic_interface.hpp"
#include "cmblike/structs.hpp"

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using spdlog::info;

// Usage: cmb_likelihood [params.ini]
// Log levels are read from SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).
int main(int argc, char* argv[])
{
  static constexpr std::string_view fname = "cmb_likelihood"sv;
  cmblike::initial_setup();

  const std::string params_file = (argc > 1) ? argv[1] : "params.ini";
  const cmblike::Config config = cmblike::load_config(params_file);

  // all inputs are validated before the grid sweep starts
  const cmblike::SkyMap map = cmblike::load_sky_map(config.cmbfile);
  const vector beam = cmblike::load_window_function(config.beamfile,
    config.lmax, "beam"sv);
  const vector pixwin = cmblike::load_window_function(config.pixwinfile,
    config.lmax, "pixel window"sv);
  info("{}: {} GHz map with {} pixels, lmax = {}", fname, config.band,
    map.npix(), config.lmax);

  const matrix lnL = cmblike::compute_lnL_grid(config, map, beam, pixwin);
  cmblike::save_lnL_grid(lnL, config.resultfile);
  info("{}: -2lnL grid ({} x {}) saved to {}", fname, lnL.n_rows, lnL.n_cols,
    config.resultfile);

  const vector q = cmblike::compute_grid_axis(config.q_min, config.q_max,
    config.q_numpoint);
  const vector n = cmblike::compute_grid_axis(config.n_min, config.n_max,
    config.n_numpoint);
  const cmblike::PosteriorSummary res = cmblike::compute_posterior(lnL, q, n);

  const arma::uword nrejected = lnL.n_elem - arma::find_finite(lnL).n_elem;
  if (nrejected > 0) {
    spdlog::warn("{}: {} grid points with covariance not positive definite",
      fname, nrejected);
  }
  info("{}: best fit Q = {:.3f}, n = {:.3f} (-2lnL = {:.6e})",
    fname, res.q_best, res.n_best, res.lnL_min);
  info("{}: marginal Q = {:.3f} +/- {:.3f}", fname, res.q_mean, res.q_std);
  info("{}: marginal n = {:.3f} +/- {:.3f}", fname, res.n_mean, res.n_std);
  return 0;
}
