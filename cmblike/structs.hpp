#include <string>
#include <armadillo>

#ifndef __CMBLIKE_STRUCTS_HPP
#define __CMBLIKE_STRUCTS_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Struct Config (run parameters, see load_config)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
struct Config
{
  bool debug_mode = false;
  int nside = 16;
  int lmax = 47;
  int band = 53; // GHz

  double q_min = 1.0;
  double q_max = 50.0;
  int q_numpoint = 40;
  double n_min = -1.0;
  double n_max = 3.0;
  int n_numpoint = 40;

  double foreground_amplitude = 1.0e3;

  // file names after template expansion
  std::string cmbfile;
  std::string beamfile;
  std::string pixwinfile;
  std::string resultfile;
  std::string debugfile;
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Struct SkyMap
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
struct SkyMap
{ // unit vectors, temperature and noise rms of each (unmasked) pixel
  arma::Col<double> x;
  arma::Col<double> y;
  arma::Col<double> z;
  arma::Col<double> temperature;
  arma::Col<double> rms;

  arma::uword npix() const {
    return this->temperature.n_elem;
  }
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Struct PosteriorSummary
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
struct PosteriorSummary
{
  arma::Mat<double> posterior;  // normalized to unit sum over the grid
  arma::Col<double> q_marginal; // sum over n
  arma::Col<double> n_marginal; // sum over Q
  arma::uword q_index = 0;
  arma::uword n_index = 0;
  double q_best = 0.0;
  double n_best = 0.0;
  double lnL_min = 0.0;
  double q_mean = 0.0;
  double q_std = 0.0;
  double n_mean = 0.0;
  double n_std = 0.0;
};

}  // namespace cmblike
#endif // HEADER GUARD
