#include <string>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB AND PYBIND WRAPPER (CARMA)
#include <carma.h>
#include <armadillo>

// Python Binding
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/pytypes.h>
namespace py = pybind11;

// cmblike
#include "cmblike/covariance.hpp"
#include "cmblike/generic_interface.hpp"
#include "cmblike/legendre.hpp"
#include "cmblike/likelihood.hpp"
#include "cmblike/power_spectrum.hpp"
#include "cmblike/structs.hpp"

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using cube = arma::Cube<double>;

// ----------------------------------------------------------------------------
// ----------------------------------------------------------------------------
// ----------------------------------------------------------------------------

namespace
{

matrix py_get_lnL_grid(
    const vector& x,
    const vector& y,
    const vector& z,
    const vector& temperature,
    const vector& rms,
    const vector& beam,
    const vector& pixwin,
    const vector& q,
    const vector& n,
    const int lmax,
    const double foreground_amplitude
  )
{
  cmblike::SkyMap map;
  map.x = x;
  map.y = y;
  map.z = z;
  map.temperature = temperature;
  map.rms = rms;
  return cmblike::compute_lnL_grid(map, beam, pixwin, q, n, lmax,
    foreground_amplitude);
}

py::tuple py_run_grid(const std::string& params_filename)
{
  const cmblike::Config config = cmblike::load_config(params_filename);
  const cmblike::SkyMap map = cmblike::load_sky_map(config.cmbfile);
  const vector beam = cmblike::load_window_function(config.beamfile,
    config.lmax, "beam"sv);
  const vector pixwin = cmblike::load_window_function(config.pixwinfile,
    config.lmax, "pixel window"sv);
  const vector q = cmblike::compute_grid_axis(config.q_min, config.q_max,
    config.q_numpoint);
  const vector n = cmblike::compute_grid_axis(config.n_min, config.n_max,
    config.n_numpoint);
  matrix lnL = cmblike::compute_lnL_grid(config, map, beam, pixwin);
  return py::make_tuple(carma::col_to_arr(q),
                        carma::col_to_arr(n),
                        carma::mat_to_arr(lnL));
}

py::dict py_get_posterior(const matrix& lnL, const vector& q, const vector& n)
{
  cmblike::PosteriorSummary res = cmblike::compute_posterior(lnL, q, n);
  py::dict d;
  d["posterior"] = carma::mat_to_arr(res.posterior);
  d["q_marginal"] = carma::col_to_arr(res.q_marginal);
  d["n_marginal"] = carma::col_to_arr(res.n_marginal);
  d["q_index"] = res.q_index;
  d["n_index"] = res.n_index;
  d["q_best"] = res.q_best;
  d["n_best"] = res.n_best;
  d["lnL_min"] = res.lnL_min;
  d["q_mean"] = res.q_mean;
  d["q_std"] = res.q_std;
  d["n_mean"] = res.n_mean;
  d["n_std"] = res.n_std;
  return d;
}

} // namespace

// ----------------------------------------------------------------------------
// ---------------------------- PYTHON WRAPPER --------------------------------
// ----------------------------------------------------------------------------

PYBIND11_MODULE(cmblike_interface, m)
{
  m.doc() = "Gaussian pixel space likelihood of low resolution CMB maps";

  py::register_exception<cmblike::not_positive_definite>(m,
    "NotPositiveDefiniteError", PyExc_RuntimeError);

  // --------------------------------------------------------------------
  // --------------------------------------------------------------------
  // INIT FUNCTIONS
  // --------------------------------------------------------------------
  // --------------------------------------------------------------------

  m.def("initial_setup",
    &cmblike::initial_setup,
    "Read log levels from the SPDLOG_LEVEL environment variable"
  );

  m.def("read_table",
    &cmblike::read_table,
    "Read a whitespace separated table (# starts a comment line)",
    py::arg("file_name")
  );

  // --------------------------------------------------------------------
  // --------------------------------------------------------------------
  // COVARIANCE MATRICES
  // --------------------------------------------------------------------
  // --------------------------------------------------------------------

  m.def("get_noise_cov",
    &cmblike::compute_noise_cov,
    "Diagonal noise covariance from the pixel standard deviations",
    py::arg("rms")
  );

  m.def("get_foreground_cov",
    &cmblike::compute_foreground_cov,
    "Monopole and dipole template covariance",
    py::arg("x"),
    py::arg("y"),
    py::arg("z"),
    py::arg("amplitude") = cmblike::default_foreground_amplitude
  );

  m.def("get_C_ell_model",
    &cmblike::compute_cl_model,
    "Quadrupole normalized Sachs-Wolfe power spectrum, l = 0...lmax",
    py::arg("Q"),
    py::arg("n"),
    py::arg("lmax")
  );

  m.def("get_cos_theta",
    &cmblike::compute_cos_theta,
    "Cosine of the angle between every pair of pixels",
    py::arg("x"),
    py::arg("y"),
    py::arg("z")
  );

  m.def("get_legendre_mat",
    py::overload_cast<const int, const vector&, const vector&, const vector&>(
      &cmblike::compute_legendre_tensor),
    "Legendre polynomials P_l(cos(theta_ij)), shape (N, N, lmax + 1)",
    py::arg("lmax"),
    py::arg("x"),
    py::arg("y"),
    py::arg("z")
  );

  m.def("get_signal_cov",
    &cmblike::compute_signal_cov,
    "Signal covariance from C_ell, beam, pixel window and Legendre tensor",
    py::arg("C_ell"),
    py::arg("beam"),
    py::arg("pixwin"),
    py::arg("p_ell_ij")
  );

  // --------------------------------------------------------------------
  // --------------------------------------------------------------------
  // LIKELIHOOD
  // --------------------------------------------------------------------
  // --------------------------------------------------------------------

  m.def("get_lnL",
    &cmblike::compute_lnL,
    "-2 ln(L) = d^T C^-1 d + ln(det C) (raises NotPositiveDefiniteError)",
    py::arg("data"),
    py::arg("cov")
  );

  m.def("get_lnL_grid",
    &py_get_lnL_grid,
    "-2 ln(L) on the (Q, n) grid (inf where the covariance is not positive "
    "definite)",
    py::arg("x"),
    py::arg("y"),
    py::arg("z"),
    py::arg("temperature"),
    py::arg("rms"),
    py::arg("beam"),
    py::arg("pixwin"),
    py::arg("q"),
    py::arg("n"),
    py::arg("lmax"),
    py::arg("foreground_amplitude") = cmblike::default_foreground_amplitude
  );

  m.def("run_grid",
    &py_run_grid,
    "Load params file and inputs, return (q, n, lnL)",
    py::arg("params_file")
  );

  m.def("get_posterior",
    &py_get_posterior,
    "Normalized posterior, marginals and best fit from a -2 ln(L) grid",
    py::arg("lnL"),
    py::arg("q"),
    py::arg("n")
  );
}
