#include <cmath>
#include <gtest/gtest.h>
#include <armadillo>

#include "cmblike/covariance.hpp"
#include "cmblike/legendre.hpp"
#include "cmblike/power_spectrum.hpp"

namespace
{

void fibonacci_sphere(const int npix, arma::Col<double>& x,
                      arma::Col<double>& y, arma::Col<double>& z)
{
  x.set_size(npix); y.set_size(npix); z.set_size(npix);
  const double golden = M_PI * (3.0 - std::sqrt(5.0));
  for (int i=0; i<npix; i++) {
    z(i) = 1.0 - (2.0*i + 1.0)/npix;
    const double r = std::sqrt(1.0 - z(i)*z(i));
    x(i) = r * std::cos(golden * i);
    y(i) = r * std::sin(golden * i);
  }
}

// ---------------------------------------------------------------------------
// noise
// ---------------------------------------------------------------------------

TEST(NoiseCovTest, DiagonalOfVariances)
{
  const arma::Col<double> rms = {1.0, 2.0, 3.0};
  const arma::Mat<double> N = cmblike::compute_noise_cov(rms);
  const arma::Mat<double> expected = {{1.0, 0.0, 0.0},
                                      {0.0, 4.0, 0.0},
                                      {0.0, 0.0, 9.0}};
  ASSERT_EQ(N.n_rows, 3u);
  ASSERT_EQ(N.n_cols, 3u);
  EXPECT_TRUE(arma::approx_equal(N, expected, "absdiff", 0.0));
  EXPECT_TRUE(N.is_symmetric());
}

TEST(NoiseCovTest, NoiselessPixelAccepted)
{
  const arma::Col<double> rms = {0.0, 0.5};
  const arma::Mat<double> N = cmblike::compute_noise_cov(rms);
  EXPECT_EQ(N(0,0), 0.0);
  EXPECT_EQ(N(1,1), 0.25);
  EXPECT_EQ(N(0,1), 0.0);
  EXPECT_EQ(N(1,0), 0.0);
}

// ---------------------------------------------------------------------------
// foreground
// ---------------------------------------------------------------------------

TEST(ForegroundCovTest, SymmetricAndLowRank)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(20, x, y, z);
  const arma::Mat<double> F = cmblike::compute_foreground_cov(x, y, z);
  EXPECT_TRUE(F.is_symmetric());
  EXPECT_LE(arma::rank(F), 4u);
  // unit vectors: 1000 * (1 + |r|^2) on the diagonal
  for (arma::uword i=0; i<F.n_rows; i++) {
    EXPECT_NEAR(F(i,i), 2.0e3, 1e-9);
  }
}

TEST(ForegroundCovTest, DipoleScalesQuadratically)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(8, x, y, z);
  const double k = 2.5;
  const double amplitude = 7.0;
  arma::Mat<double> monopole(8, 8);
  monopole.fill(amplitude);
  const arma::Mat<double> F1 =
    cmblike::compute_foreground_cov(x, y, z, amplitude) - monopole;
  const arma::Mat<double> Fk =
    cmblike::compute_foreground_cov(k*x, k*y, k*z, amplitude) - monopole;
  EXPECT_TRUE(arma::approx_equal(Fk, k*k*F1, "absdiff", 1e-12));
}

TEST(ForegroundCovTest, ProjectsTemplates)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(8, x, y, z);
  const arma::Mat<double> F = cmblike::compute_foreground_cov(x, y, z, 1.0);
  const arma::Mat<double> T = arma::join_rows(
    arma::join_rows(arma::ones<arma::Col<double>>(8), x),
    arma::join_rows(y, z));
  EXPECT_TRUE(arma::approx_equal(F, T * T.t(), "absdiff", 1e-12));
}

// ---------------------------------------------------------------------------
// signal
// ---------------------------------------------------------------------------

TEST(SignalCovTest, SingleMultipole)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(10, x, y, z);
  const int lmax = 6;
  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(lmax, x, y, z);
  arma::Col<double> cl(lmax + 1, arma::fill::zeros);
  cl(2) = 3.7;
  const arma::Col<double> ones(lmax + 1, arma::fill::ones);
  const arma::Mat<double> S = cmblike::compute_signal_cov(cl, ones, ones, pl);
  const arma::Mat<double> expected = 5.0 * 3.7 * pl.slice(2) / (4.0 * M_PI);
  EXPECT_TRUE(arma::approx_equal(S, expected, "absdiff", 1e-13));
}

TEST(SignalCovTest, BeamAndPixelWindowWeights)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(10, x, y, z);
  const int lmax = 8;
  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(lmax, x, y, z);
  const arma::Col<double> cl = cmblike::compute_cl_model(20.0, 1.2, lmax);
  arma::Col<double> beam(lmax + 1), pixwin(lmax + 1);
  for (int l=0; l<=lmax; l++) {
    beam(l) = std::exp(-0.01 * l * (l + 1));
    pixwin(l) = 1.0 - 0.02 * l;
  }
  const arma::Mat<double> S = cmblike::compute_signal_cov(cl, beam, pixwin, pl);

  arma::Mat<double> expected(10, 10, arma::fill::zeros);
  for (int l=0; l<=lmax; l++) {
    expected += (2.0*l + 1.0) * beam(l) * beam(l) * pixwin(l) * pixwin(l)
              * cl(l) * pl.slice(l);
  }
  expected /= 4.0 * M_PI;
  const double scale = arma::abs(expected).max();
  EXPECT_TRUE(arma::approx_equal(S, expected, "absdiff", 1e-12 * scale));
  EXPECT_TRUE(S.is_symmetric());
}

TEST(SignalCovTest, PositiveSemiDefinite)
{
  arma::Col<double> x, y, z;
  fibonacci_sphere(12, x, y, z);
  const int lmax = 10;
  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(lmax, x, y, z);
  const arma::Col<double> cl = cmblike::compute_cl_model(18.0, 1.0, lmax);
  const arma::Col<double> ones(lmax + 1, arma::fill::ones);
  const arma::Mat<double> S = cmblike::compute_signal_cov(cl, ones, ones, pl);
  const arma::Col<double> eigval = arma::eig_sym(S);
  EXPECT_GT(eigval.min(), -1e-9 * eigval.max());
}

// ---------------------------------------------------------------------------
// usage errors
// ---------------------------------------------------------------------------

class CovarianceDeathTest : public ::testing::Test
{
  protected:
    void SetUp() override {
      GTEST_FLAG_SET(death_test_style, "threadsafe");
    }
};

TEST_F(CovarianceDeathTest, NegativeRms)
{
  const arma::Col<double> rms = {1.0, -2.0};
  EXPECT_EXIT(cmblike::compute_noise_cov(rms),
    ::testing::ExitedWithCode(1), "");
}

TEST_F(CovarianceDeathTest, NonFiniteRms)
{
  const arma::Col<double> rms = {1.0, arma::datum::nan};
  EXPECT_EXIT(cmblike::compute_noise_cov(rms),
    ::testing::ExitedWithCode(1), "");
}

TEST_F(CovarianceDeathTest, ForegroundCoordinateMismatch)
{
  const arma::Col<double> x = {1.0, 0.0};
  const arma::Col<double> y = {0.0, 1.0};
  const arma::Col<double> z = {0.0};
  EXPECT_EXIT(cmblike::compute_foreground_cov(x, y, z),
    ::testing::ExitedWithCode(1), "");
}

TEST_F(CovarianceDeathTest, BeamLengthMismatch)
{
  const arma::Col<double> x = {1.0, 0.0, 0.0};
  const arma::Col<double> y = {0.0, 1.0, 0.0};
  const arma::Col<double> z = {0.0, 0.0, 1.0};
  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(4, x, y, z);
  const arma::Col<double> cl(5, arma::fill::ones);
  const arma::Col<double> beam(4, arma::fill::ones);
  const arma::Col<double> pixwin(5, arma::fill::ones);
  EXPECT_EXIT(cmblike::compute_signal_cov(cl, beam, pixwin, pl),
    ::testing::ExitedWithCode(1), "");
}

TEST_F(CovarianceDeathTest, LegendreSlicesMismatch)
{
  const arma::Col<double> x = {1.0, 0.0, 0.0};
  const arma::Col<double> y = {0.0, 1.0, 0.0};
  const arma::Col<double> z = {0.0, 0.0, 1.0};
  const arma::Cube<double> pl = cmblike::compute_legendre_tensor(3, x, y, z);
  const arma::Col<double> ones(5, arma::fill::ones);
  EXPECT_EXIT(cmblike::compute_signal_cov(ones, ones, ones, pl),
    ::testing::ExitedWithCode(1), "");
}

} // namespace
