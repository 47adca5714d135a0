#include <stdexcept>
#include <string>
#include <armadillo>

#ifndef __CMBLIKE_LIKELIHOOD_HPP
#define __CMBLIKE_LIKELIHOOD_HPP

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class not_positive_definite
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
class not_positive_definite : public std::runtime_error
{ // Cholesky factorization of the total covariance failed
  public:
    explicit not_positive_definite(const std::string& what) :
      std::runtime_error(what) {
    }
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// GAUSSIAN LIKELIHOOD
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

/*! -2 ln(L) = d^T C^{-1} d + ln(det C), up to an additive constant.
 *
 *  C = L L^T (lower Cholesky), ln(det C) = 2 sum_i ln(L_ii) and
 *  d^T C^{-1} d = x^T x with L x = d solved by forward substitution.
 *
 *  \throws not_positive_definite if the factorization fails
 */
double compute_lnL(const arma::Col<double>& data, const arma::Mat<double>& cov);

}  // namespace cmblike
#endif // HEADER GUARD
