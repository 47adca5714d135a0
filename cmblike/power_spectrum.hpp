#include <armadillo>

#ifndef __CMBLIKE_POWER_SPECTRUM_HPP
#define __CMBLIKE_POWER_SPECTRUM_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// QUADRUPOLE NORMALIZED SACHS-WOLFE SPECTRUM
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// True if C_{l+1} = C_l (2l + n - 1)/(2l + 5 - n) stays finite and
// non-negative for every l in [2, lmax-1].
bool is_spectral_index_valid(const double n, const int lmax);

// Exits (domain error) unless is_spectral_index_valid(n, lmax).
void check_spectral_index(const double n, const int lmax);

// C_0 = C_1 = 0, C_2 = (4 pi/5) Q^2, then the recursion above up to lmax.
arma::Col<double> compute_cl_model(
    const double Q,
    const double n,
    const int lmax
  );

}  // namespace cmblike
#endif // HEADER GUARD
