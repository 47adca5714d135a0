#include <armadillo>

#ifndef __CMBLIKE_LEGENDRE_HPP
#define __CMBLIKE_LEGENDRE_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// PIXEL GEOMETRY
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// cos(theta_ij) = r_i . r_j for every pair of pixels (N x N, unit diagonal).
// Entries are clamped into [-1,1] and the matrix is exactly symmetric.
arma::Mat<double> compute_cos_theta(
    const arma::Col<double>& x,
    const arma::Col<double>& y,
    const arma::Col<double>& z
  );

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// LEGENDRE TENSOR
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// slice(l) = P_l(cos(theta_ij)), l = 0...lmax, using the recurrence
// (l+1) P_{l+1}(z) = (2l+1) z P_l(z) - l P_{l-1}(z) on whole matrices
arma::Cube<double> compute_legendre_tensor(
    const arma::Mat<double>& costheta,
    const int lmax
  );

arma::Cube<double> compute_legendre_tensor(
    const int lmax,
    const arma::Col<double>& x,
    const arma::Col<double>& y,
    const arma::Col<double>& z
  );

}  // namespace cmblike
#endif // HEADER GUARD
