#include <armadillo>

#ifndef __CMBLIKE_COVARIANCE_HPP
#define __CMBLIKE_COVARIANCE_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// PIXEL COVARIANCE MATRICES
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// Prior variance assigned to the monopole and each dipole template. It must
// dominate the signal and noise covariance (in units of the map squared).
constexpr double default_foreground_amplitude = 1.0e3;

// N_ii = rms_i^2, N_ij = 0
arma::Mat<double> compute_noise_cov(const arma::Col<double>& rms);

// F = amplitude * (1 1^T + x x^T + y y^T + z z^T) (rank <= 4)
arma::Mat<double> compute_foreground_cov(
    const arma::Col<double>& x,
    const arma::Col<double>& y,
    const arma::Col<double>& z,
    const double amplitude = default_foreground_amplitude
  );

/*! S_ij = 1/(4 pi) sum_l (2l+1) beam_l^2 pixwin_l^2 C_l P_l(cos(theta_ij))
 *
 *  \param cl     model power spectrum, l = 0...lmax
 *  \param beam   instrument beam transfer function, l = 0...lmax
 *  \param pixwin pixel window function, l = 0...lmax
 *  \param pl     Legendre tensor (N x N x (lmax+1)), see compute_legendre_tensor
 */
arma::Mat<double> compute_signal_cov(
    const arma::Col<double>& cl,
    const arma::Col<double>& beam,
    const arma::Col<double>& pixwin,
    const arma::Cube<double>& pl
  );

}  // namespace cmblike
#endif // HEADER GUARD
