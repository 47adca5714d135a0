#include <string>
#include <vector>
#include <algorithm>
#include <fstream>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>

// ARMADILLO LIB
#include <armadillo>

// boost library
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

// cmblike
#include "cmblike/generic_interface.hpp"
#include "cmblike/covariance.hpp"
#include "cmblike/legendre.hpp"
#include "cmblike/likelihood.hpp"
#include "cmblike/power_spectrum.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view erriiwz = "incompatible input vector with size = "sv;
static constexpr std::string_view errorsz1d = "{}: {} {} (!= {})"sv;
static constexpr std::string_view errorns2 = "{}: {} = {} not supported"sv;
static constexpr std::string_view errorshape =
  "{}: file {} has {} {} (expected {})"sv;

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using cube = arma::Cube<double>;
using spdlog::info;
using spdlog::debug;
using spdlog::critical;

namespace cmblike
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> read_table(const std::string file_name)
{
  static constexpr std::string_view fname = "read_table"sv;
  std::ifstream input_file(file_name);
  if (!input_file.is_open()) {
    critical("{}: file {} cannot be opened", fname, file_name);
    exit(1);
  }

  // --------------------------------------------------------
  // Read the entire file into memory
  // --------------------------------------------------------

  std::string tmp;

  input_file.seekg(0,std::ios::end);

  tmp.resize(static_cast<size_t>(input_file.tellg()));

  input_file.seekg(0,std::ios::beg);

  input_file.read(&tmp[0],tmp.size());

  input_file.close();

  // --------------------------------------------------------
  // Second: Split file into lines
  // --------------------------------------------------------

  std::vector<std::string> lines;
  lines.reserve(5000);

  boost::split(lines, tmp, boost::is_any_of("\r\n"), boost::token_compress_on);

  for (auto& line : lines) {
    boost::trim_if(line, boost::is_any_of("\t "));
  }

  // Erase comment/blank lines
  auto check = [](const std::string& mystr) -> bool
  {
    return mystr.empty() || boost::starts_with(mystr, "#");
  };
  lines.erase(std::remove_if(lines.begin(), lines.end(), check), lines.end());

  if (lines.empty())
  {
    critical("{}: file {} is empty", fname, file_name);
    exit(1);
  }

  // --------------------------------------------------------
  // Third: Split line into words
  // --------------------------------------------------------

  auto to_double = [&file_name](const std::string& word, const size_t line)
  {
    try {
      size_t pos = 0;
      const double value = std::stod(word, &pos);
      if (pos != word.size()) {
        throw std::invalid_argument(word);
      }
      return value;
    }
    catch (const std::logic_error&) { // invalid_argument or out_of_range
      critical("{}: file {} entry <{}> (row {}) is not a number",
        "read_table", file_name, word, line);
      exit(1);
    }
  };

  arma::Mat<double> result;
  size_t ncols = 0;

  { // first line
    std::vector<std::string> words;
    words.reserve(100);

    boost::split(
      words,lines[0],
      boost::is_any_of(" \t"),
      boost::token_compress_on
    );

    ncols = words.size();

    result.set_size(lines.size(), ncols);

    for (size_t j=0; j<ncols; j++)
      result(0,j) = to_double(words[j], 0);
  }

  #pragma omp parallel for
  for (size_t i=1; i<lines.size(); i++)
  {
    std::vector<std::string> words;

    boost::split(
      words,
      lines[i],
      boost::is_any_of(" \t"),
      boost::token_compress_on
    );

    if (words.size() != ncols)
    {
      critical("{}: file {} is not well formatted"
               " (regular table required, row {} has {} columns, expected {})",
               fname, file_name, i, words.size(), ncols);
      exit(1);
    }

    for (size_t j=0; j<ncols; j++)
      result(i,j) = to_double(words[j], i);
  };

  return result;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// INIT FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void initial_setup()
{
  static constexpr std::string_view fname = "initial_setup"sv;
  spdlog::cfg::load_env_levels();
  debug("{}: {}", fname, errbegins);
  debug("{}: {}", fname, errends);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

std::string expand_file_template(
    const std::string& file_template,
    const int band,
    const int nside,
    const int lmax
  )
{
  static constexpr std::string_view fname = "expand_file_template"sv;
  try {
    return fmt::format(fmt::runtime(file_template),
                       fmt::arg("band", band),
                       fmt::arg("nside", nside),
                       fmt::arg("lmax", lmax));
  }
  catch (const fmt::format_error& e) {
    critical("{}: invalid file name template <{}> ({})",
      fname, file_template, e.what());
    exit(1);
  }
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

Config load_config(const std::string& params_filename)
{
  static constexpr std::string_view fname = "load_config"sv;
  debug("{}: {}", fname, errbegins);

  Config config;
  std::string cmbfile, beamfile, pixwinfile, resultfile, debugfile;
  try {
    boost::property_tree::ptree pt;
    boost::property_tree::ini_parser::read_ini(params_filename, pt);

    config.debug_mode = pt.get<bool>("run.debug_mode");
    config.nside = pt.get<int>("run.nside");
    config.lmax = pt.get<int>("run.lmax");
    config.band = pt.get<int>("run.band");

    config.q_min = pt.get<double>("grid.q_min");
    config.q_max = pt.get<double>("grid.q_max");
    config.q_numpoint = pt.get<int>("grid.q_numpoint");
    config.n_min = pt.get<double>("grid.n_min");
    config.n_max = pt.get<double>("grid.n_max");
    config.n_numpoint = pt.get<int>("grid.n_numpoint");

    config.foreground_amplitude = pt.get<double>(
      "model.foreground_amplitude", default_foreground_amplitude);

    cmbfile = pt.get<std::string>("files.cmbfile");
    beamfile = pt.get<std::string>("files.beamfile");
    pixwinfile = pt.get<std::string>("files.pixwinfile");
    resultfile = pt.get<std::string>("files.resultfile");
    debugfile = pt.get<std::string>("files.debugfile",
      "cmb_likelihood_debug.dat");
  }
  catch (const boost::property_tree::ptree_error& e) {
    critical("{}: params file {}: {}", fname, params_filename, e.what());
    exit(1);
  }

  if (config.nside < 1) [[unlikely]] {
    critical(errorns2, fname, "nside", config.nside); exit(1);
  }
  if (config.lmax < 2) [[unlikely]] {
    critical(errorns2, fname, "lmax", config.lmax); exit(1);
  }
  if (config.band < 1) [[unlikely]] {
    critical(errorns2, fname, "band", config.band); exit(1);
  }
  if (!(config.q_min > 0.0) || !std::isfinite(config.q_max)) [[unlikely]] {
    critical("{}: Q range [{}, {}] invalid (Q must be > 0)",
      fname, config.q_min, config.q_max); exit(1);
  }
  if (!(config.q_max >= config.q_min)) [[unlikely]] {
    critical("{}: q_max = {} < q_min = {}", fname, config.q_max, config.q_min);
    exit(1);
  }
  if (!(config.n_max >= config.n_min)) [[unlikely]] {
    critical("{}: n_max = {} < n_min = {}", fname, config.n_max, config.n_min);
    exit(1);
  }
  if (config.q_numpoint < 1) [[unlikely]] {
    critical(errorns2, fname, "q_numpoint", config.q_numpoint); exit(1);
  }
  if (config.n_numpoint < 1) [[unlikely]] {
    critical(errorns2, fname, "n_numpoint", config.n_numpoint); exit(1);
  }
  if (!std::isfinite(config.foreground_amplitude) ||
      config.foreground_amplitude < 0.0) [[unlikely]] {
    critical(errorns2, fname, "foreground_amplitude",
      config.foreground_amplitude); exit(1);
  }
  // the valid spectral indices form an interval: checking the ends suffices
  check_spectral_index(config.n_min, config.lmax);
  check_spectral_index(config.n_max, config.lmax);

  const int band = config.band, nside = config.nside, lmax = config.lmax;
  config.cmbfile = expand_file_template(cmbfile, band, nside, lmax);
  config.beamfile = expand_file_template(beamfile, band, nside, lmax);
  config.pixwinfile = expand_file_template(pixwinfile, band, nside, lmax);
  config.resultfile = expand_file_template(resultfile, band, nside, lmax);
  config.debugfile = expand_file_template(debugfile, band, nside, lmax);

  debug("{}: band = {} GHz, nside = {}, lmax = {}", fname, band, nside, lmax);
  debug("{}: Q in [{}, {}] ({} points), n in [{}, {}] ({} points)", fname,
    config.q_min, config.q_max, config.q_numpoint,
    config.n_min, config.n_max, config.n_numpoint);
  debug("{}: {}", fname, errends);
  return config;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

SkyMap load_sky_map(const std::string& filename)
{
  static constexpr std::string_view fname = "load_sky_map"sv;
  debug("{}: {}", fname, errbegins);
  const matrix table = read_table(filename);
  if (table.n_cols != 5) [[unlikely]] {
    critical(errorshape, fname, filename, table.n_cols, "columns",
      "5: x y z temperature rms"); exit(1);
  }
  SkyMap map;
  map.x = table.col(0);
  map.y = table.col(1);
  map.z = table.col(2);
  map.temperature = table.col(3);
  map.rms = table.col(4);
  debug("{}: {} pixels read from {}", fname, map.npix(), filename);
  debug("{}: {}", fname, errends);
  return map;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

vector load_window_function(
    const std::string& filename,
    const int lmax,
    std::string_view what
  )
{
  static constexpr std::string_view fname = "load_window_function"sv;
  debug("{}: {}", fname, errbegins);
  if (lmax < 0) [[unlikely]] {
    critical(errorns2, fname, "lmax", lmax); exit(1);
  }
  const matrix table = read_table(filename);
  if (table.n_cols != 1 && table.n_cols != 2) [[unlikely]] {
    critical(errorshape, fname, filename, table.n_cols, "columns",
      "1: value or 2: l value"); exit(1);
  }
  const arma::uword nell = static_cast<arma::uword>(lmax) + 1;
  if (table.n_rows < nell) [[unlikely]] {
    critical(errorshape, fname, filename, table.n_rows, "rows",
      fmt::format("at least lmax + 1 = {}", nell)); exit(1);
  }
  if (2 == table.n_cols) {
    for (arma::uword l=0; l<nell; l++) {
      if (!almost_equal(table(l,0), static_cast<double>(l))) [[unlikely]] {
        critical("{}: file {} row {} has multipole {} (expected {})",
          fname, filename, l, table(l,0), l); exit(1);
      }
    }
  }
  if (table.n_rows > nell) {
    debug("{}: {} truncated from {} to {} multipoles",
      fname, what, table.n_rows, nell);
  }
  vector window = table.col(table.n_cols - 1).head(nell);
  debug("{}: {} read from {}", fname, what, filename);
  debug("{}: {}", fname, errends);
  return window;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// COMPUTE FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

vector compute_grid_axis(const double min, const double max, const int numpoint)
{
  static constexpr std::string_view fname = "compute_grid_axis"sv;
  if (numpoint < 1) [[unlikely]] {
    critical(errorns2, fname, "numpoint", numpoint); exit(1);
  }
  if (1 == numpoint) {
    return vector{min};
  }
  return arma::linspace<vector>(min, max, static_cast<arma::uword>(numpoint));
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double compute_lnL_point(
    const vector& data,
    const matrix& noise_fg_cov,
    const cube& pl,
    const vector& beam,
    const vector& pixwin,
    const double Q,
    const double n
  )
{
  static constexpr std::string_view fname = "compute_lnL_point"sv;
  const vector cl = compute_cl_model(Q, n, static_cast<int>(pl.n_slices) - 1);

  matrix cov = compute_signal_cov(cl, beam, pixwin, pl);
  if (arma::size(cov) != arma::size(noise_fg_cov)) [[unlikely]] {
    critical("{}: signal covariance {} x {} incompatible with noise "
      "+ foreground covariance {} x {}", fname, cov.n_rows, cov.n_cols,
      noise_fg_cov.n_rows, noise_fg_cov.n_cols); exit(1);
  }
  cov += noise_fg_cov;

  try {
    return compute_lnL(data, cov);
  }
  catch (const not_positive_definite& e) {
    spdlog::warn("{}: Q = {:.4e}, n = {:.4e} rejected ({})", fname, Q, n,
      e.what());
    return std::numeric_limits<double>::infinity();
  }
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix compute_lnL_grid(
    const SkyMap& map,
    const vector& beam,
    const vector& pixwin,
    const vector& q,
    const vector& n,
    const int lmax,
    const double foreground_amplitude,
    std::shared_ptr<spdlog::logger> point_logger
  )
{
  static constexpr std::string_view fname = "compute_lnL_grid"sv;
  debug("{}: {}", fname, errbegins);
  const arma::uword npix = map.npix();
  if (map.rms.n_elem != npix) [[unlikely]] {
    critical(errorsz1d, fname, "size of rms =", map.rms.n_elem, npix); exit(1);
  }
  if (map.x.n_elem != npix) [[unlikely]] {
    critical(errorsz1d, fname, "size of x =", map.x.n_elem, npix); exit(1);
  }
  if (lmax < 2) [[unlikely]] {
    critical(errorns2, fname, "lmax", lmax); exit(1);
  }
  if (beam.n_elem != static_cast<arma::uword>(lmax + 1)) [[unlikely]] {
    critical("{}: beam {} {} (!= lmax + 1 = {})", fname, erriiwz,
      beam.n_elem, lmax + 1); exit(1);
  }
  if (pixwin.n_elem != static_cast<arma::uword>(lmax + 1)) [[unlikely]] {
    critical("{}: pixwin {} {} (!= lmax + 1 = {})", fname, erriiwz,
      pixwin.n_elem, lmax + 1); exit(1);
  }
  if (0 == q.n_elem || 0 == n.n_elem) [[unlikely]] {
    critical("{}: empty grid ({} x {})", fname, q.n_elem, n.n_elem); exit(1);
  }
  if (!(q.min() > 0.0) || !q.is_finite()) [[unlikely]] {
    critical("{}: domain error, amplitude Q = {} (must be > 0)",
      fname, q.min()); exit(1);
  }
  check_spectral_index(n.min(), lmax);
  check_spectral_index(n.max(), lmax);

  // fixed for every grid point (read only inside the parallel loop)
  const cube pl = compute_legendre_tensor(lmax, map.x, map.y, map.z);
  const matrix noise_fg_cov = compute_noise_cov(map.rms) +
    compute_foreground_cov(map.x, map.y, map.z, foreground_amplitude);

  const int nq = static_cast<int>(q.n_elem);
  const int nn = static_cast<int>(n.n_elem);
  matrix lnL(nq, nn, arma::fill::zeros);

  #pragma omp parallel for collapse(2) schedule(dynamic)
  for (int i=0; i<nq; i++) {
    for (int j=0; j<nn; j++) {
      lnL(i,j) = compute_lnL_point(map.temperature, noise_fg_cov, pl,
        beam, pixwin, q(i), n(j));
      if (point_logger) {
        point_logger->info("{:d} {:d} {:.6e} {:.6e} {:.10e}",
          i, j, q(i), n(j), lnL(i,j));
      }
    }
  }
  if (point_logger) {
    point_logger->flush();
  }
  debug("{}: {}", fname, errends);
  return lnL;
}

matrix compute_lnL_grid(
    const Config& config,
    const SkyMap& map,
    const vector& beam,
    const vector& pixwin
  )
{
  static constexpr std::string_view fname = "compute_lnL_grid"sv;
  const vector q = compute_grid_axis(config.q_min, config.q_max,
    config.q_numpoint);
  const vector n = compute_grid_axis(config.n_min, config.n_max,
    config.n_numpoint);
  for (arma::uword i=0; i<q.n_elem; i++) {
    debug("{}: Q({:d}) = {:.4e}", fname, i, q(i));
  }
  for (arma::uword j=0; j<n.n_elem; j++) {
    debug("{}: n({:d}) = {:.4e}", fname, j, n(j));
  }

  std::shared_ptr<spdlog::logger> point_logger;
  if (config.debug_mode) {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.debugfile, true);
      point_logger = std::make_shared<spdlog::logger>("cmblike_grid", sink);
      point_logger->set_pattern("%v");
      point_logger->set_level(spdlog::level::info);
      point_logger->info("# i j Q n -2lnL");
    }
    catch (const spdlog::spdlog_ex& e) {
      critical("{}: cannot open debug file {} ({})",
        fname, config.debugfile, e.what()); exit(1);
    }
  }

  const auto start = std::chrono::steady_clock::now();
  matrix lnL = compute_lnL_grid(map, beam, pixwin, q, n, config.lmax,
    config.foreground_amplitude, point_logger);
  const std::chrono::duration<double> elapsed =
    std::chrono::steady_clock::now() - start;

  if (config.debug_mode) {
    info("{}: {} grid points evaluated in {:.2f} s ({:.3f} s per point)",
      fname, lnL.n_elem, elapsed.count(), elapsed.count()/lnL.n_elem);
    info("{}: per point values written to {}", fname, config.debugfile);
  }
  return lnL;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

PosteriorSummary compute_posterior(
    const matrix& lnL,
    const vector& q,
    const vector& n
  )
{
  static constexpr std::string_view fname = "compute_posterior"sv;
  debug("{}: {}", fname, errbegins);
  if (lnL.n_rows != q.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "grid rows =", lnL.n_rows, q.n_elem); exit(1);
  }
  if (lnL.n_cols != n.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "grid columns =", lnL.n_cols, n.n_elem); exit(1);
  }
  const arma::uvec finite = arma::find_finite(lnL);
  if (0 == finite.n_elem) [[unlikely]] {
    critical("{}: no grid point with a finite likelihood", fname); exit(1);
  }

  PosteriorSummary res;
  const vector values = lnL.elem(finite);
  const arma::uword imin = finite(values.index_min());
  const arma::uvec sub = arma::ind2sub(arma::size(lnL), imin);
  res.q_index = sub(0);
  res.n_index = sub(1);
  res.q_best = q(res.q_index);
  res.n_best = n(res.n_index);
  res.lnL_min = lnL(imin);

  res.posterior.zeros(lnL.n_rows, lnL.n_cols);
  res.posterior.elem(finite) = arma::exp(-0.5 * (values - res.lnL_min));
  res.posterior /= arma::accu(res.posterior);

  res.q_marginal = arma::sum(res.posterior, 1);
  res.n_marginal = arma::sum(res.posterior, 0).t();

  res.q_mean = arma::dot(q, res.q_marginal);
  res.q_std = std::sqrt(arma::dot(arma::square(q - res.q_mean), res.q_marginal));
  res.n_mean = arma::dot(n, res.n_marginal);
  res.n_std = std::sqrt(arma::dot(arma::square(n - res.n_mean), res.n_marginal));

  debug("{}: best fit Q = {:.4e}, n = {:.4e} (-2lnL = {:.6e})",
    fname, res.q_best, res.n_best, res.lnL_min);
  debug("{}: {}", fname, errends);
  return res;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void save_lnL_grid(const matrix& lnL, const std::string& filename)
{
  static constexpr std::string_view fname = "save_lnL_grid"sv;
  if (!lnL.save(filename, arma::raw_ascii)) [[unlikely]] {
    critical("{}: file {} cannot be written", fname, filename); exit(1);
  }
  debug("{}: {} x {} grid written to {}", fname, lnL.n_rows, lnL.n_cols,
    filename);
}

}  // namespace cmblike
