#include <cmath>
#include <gtest/gtest.h>
#include <armadillo>

#include "cmblike/covariance.hpp"
#include "cmblike/legendre.hpp"
#include "cmblike/likelihood.hpp"
#include "cmblike/power_spectrum.hpp"

namespace
{

TEST(LikelihoodTest, DiagonalClosedForm)
{
  const arma::Col<double> v = {1.0, 2.0, 4.0, 0.5};
  const arma::Col<double> d = {1.0, -1.0, 2.0, 0.3};
  const double expected = arma::accu(arma::square(d) / v)
                        + arma::accu(arma::log(v));
  EXPECT_NEAR(cmblike::compute_lnL(d, arma::diagmat(v)), expected, 1e-12);
}

TEST(LikelihoodTest, DenseMatchesDirectInverse)
{
  const arma::Mat<double> A = {{ 1.0, 0.2, -0.3, 0.0},
                               { 0.4, 1.5,  0.1, 0.2},
                               {-0.2, 0.3,  0.9, 0.5},
                               { 0.1, 0.0,  0.6, 1.2}};
  const arma::Mat<double> C = A * A.t() + arma::eye(4, 4);
  const arma::Col<double> d = {0.5, -1.2, 2.0, 0.7};
  const double expected = arma::as_scalar(d.t() * arma::inv(C) * d)
                        + std::log(arma::det(C));
  EXPECT_NEAR(cmblike::compute_lnL(d, C), expected, 1e-10);
}

TEST(LikelihoodTest, DeterminantIsNotHalved)
{
  // zero data: only ln(det C) = ln(2^3) survives
  const arma::Col<double> d(3, arma::fill::zeros);
  const arma::Mat<double> C = 2.0 * arma::eye(3, 3);
  EXPECT_NEAR(cmblike::compute_lnL(d, C), 3.0 * std::log(2.0), 1e-14);
}

TEST(LikelihoodTest, NegativeEigenvalueThrows)
{
  const arma::Col<double> d = {1.0, 1.0, 1.0};
  const arma::Mat<double> C = {{2.0, 0.0, 0.0},
                               {0.0, -1.0, 0.0},
                               {0.0, 0.0, 3.0}};
  EXPECT_THROW(cmblike::compute_lnL(d, C), cmblike::not_positive_definite);
}

TEST(LikelihoodTest, IndefiniteDenseThrows)
{
  const arma::Col<double> d = {1.0, 2.0};
  const arma::Mat<double> C = {{1.0, 2.0},
                               {2.0, 1.0}}; // eigenvalues 3 and -1
  EXPECT_THROW(cmblike::compute_lnL(d, C), cmblike::not_positive_definite);
}

// N = 4 pixels at the vertices of a regular tetrahedron
TEST(LikelihoodTest, TetrahedronEndToEnd)
{
  const double s = 1.0/std::sqrt(3.0);
  const arma::Col<double> x = {s,  s, -s, -s};
  const arma::Col<double> y = {s, -s,  s, -s};
  const arma::Col<double> z = {s, -s, -s,  s};
  const int lmax = 4;

  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(lmax, x, y, z);
  const arma::Col<double> cl = cmblike::compute_cl_model(20.0, 1.0, lmax);
  const arma::Col<double> ones(lmax + 1, arma::fill::ones);
  const arma::Mat<double> S = cmblike::compute_signal_cov(cl, ones, ones, pl);

  const double eps = 1.0e-6;
  const arma::Mat<double> C = S + eps * arma::eye(4, 4);
  const arma::Col<double> d(4, arma::fill::zeros);
  const double lnL = cmblike::compute_lnL(d, C);
  EXPECT_NEAR(lnL, std::log(arma::det(C)), 1e-9);

  // S = a I + b (J - I): eigenvalues a - b (x3) and a + 3b
  double a = 0.0, b = 0.0;
  const double p_off[] = {1.0, -1.0/3.0, -1.0/3.0, 11.0/27.0, 1.0/81.0};
  for (int l=0; l<=lmax; l++) {
    a += (2.0*l + 1.0) * cl(l) / (4.0 * M_PI);
    b += (2.0*l + 1.0) * cl(l) * p_off[l] / (4.0 * M_PI);
  }
  const double expected = 3.0 * std::log(a - b + eps) + std::log(a + 3.0*b + eps);
  EXPECT_NEAR(lnL, expected, 1e-9);
}

class LikelihoodDeathTest : public ::testing::Test
{
  protected:
    void SetUp() override {
      GTEST_FLAG_SET(death_test_style, "threadsafe");
    }
};

TEST_F(LikelihoodDeathTest, DataCovarianceMismatch)
{
  const arma::Col<double> d = {1.0, 2.0};
  const arma::Mat<double> C = arma::eye(3, 3);
  EXPECT_EXIT(cmblike::compute_lnL(d, C), ::testing::ExitedWithCode(1), "");
}

TEST_F(LikelihoodDeathTest, NonSquareCovariance)
{
  const arma::Col<double> d = {1.0, 2.0};
  const arma::Mat<double> C(2, 3, arma::fill::ones);
  EXPECT_EXIT(cmblike::compute_lnL(d, C), ::testing::ExitedWithCode(1), "");
}

} // namespace
