#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <armadillo>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <glog/logging.h>

#include "../cf/predictor.h"
#include "../data/normalizer.h"
#include "../decomposition/cur.h"
#include "../decomposition/truncated_svd.h"
#include "../eval/evaluator.h"
#include "../eval/method.h"
#include "../eval/report.h"
#include "../io/matrix.h"
#include "../io/test_entries.h"
#include "../util/sparse.h"

namespace po = boost::program_options;

struct Dataset {
  arma::sp_fmat trainNormalized;
  arma::sp_fmat trainOriginal;
  arma::sp_fmat testNormalized;
  arma::sp_fmat testOriginal;
  mrec::Entries entries;

  // Load a normalized matrix or derive it from its original
  static arma::sp_fmat normalized(const po::variables_map& vm,
                                  const std::string& option,
                                  const arma::sp_fmat& original) {
    if (vm.count(option)) {
      return mrec::io::Matrix::load(vm[option].as<std::string>());
    }

    LOG(INFO) << "No --" << option << " given, centering the original";
    return mrec::data::Normalizer::center(original).normalized;
  }

  static Dataset load(const po::variables_map& vm) {
    Dataset d;
    d.trainOriginal =
        mrec::io::Matrix::load(vm["train-original"].as<std::string>());
    d.testOriginal =
        mrec::io::Matrix::load(vm["test-original"].as<std::string>());
    d.trainNormalized =
        Dataset::normalized(vm, "train-normalized", d.trainOriginal);
    d.testNormalized = Dataset::normalized(vm, "test-normalized", d.testOriginal);
    d.entries = mrec::io::TestEntries::load(vm["test-entries"].as<std::string>());

    return d;
  }
};

int run(const po::variables_map& vm) {
  const std::vector<mrec::eval::Method> methods = mrec::eval::parseMethods(
      vm["methods"].as<std::vector<std::string>>());
  const std::vector<float> energies = vm["energy"].as<std::vector<float>>();
  const int k = vm["neighbours"].as<int>();
  const int concepts = vm["concepts"].as<int>();
  const int samples =
      vm.count("samples") ? vm["samples"].as<int>() : 4 * concepts;
  const int seed = vm["seed"].as<int>();
  const int blockRows = vm["block-rows"].as<int>();

  if (blockRows < 0) {
    throw std::invalid_argument("--block-rows must not be negative");
  }

  const Dataset data = Dataset::load(vm);
  mrec::eval::Report report;

  for (const mrec::eval::Method method : methods) {
    if (method == mrec::eval::Method::CF ||
        method == mrec::eval::Method::CF_BASELINE) {
      // Predict exactly the ratings withheld in the test matrix
      const mrec::cf::Predictor predictor(
          k, method == mrec::eval::Method::CF_BASELINE, blockRows);
      const arma::fmat R = predictor.predict(
          data.trainNormalized, data.trainOriginal,
          mrec::util::sparse::locations(data.testOriginal));

      report.print(
          mrec::eval::Evaluator::score(R, data.testOriginal, data.entries));
    } else if (method == mrec::eval::Method::SVD) {
      for (float energy : energies) {
        const arma::fmat R = mrec::decomposition::TruncatedSvd::svd(
            data.trainNormalized, concepts, energy);

        report.print(
            mrec::eval::Evaluator::score(R, data.testNormalized, data.entries));
      }
    } else if (method == mrec::eval::Method::CUR) {
      for (float energy : energies) {
        mrec::decomposition::Cur cur(samples, concepts, energy,
                                     std::mt19937(seed));
        const arma::fmat R = cur.approximate(data.trainNormalized);

        report.print(
            mrec::eval::Evaluator::score(R, data.testNormalized, data.entries));
      }
    }
  }

  return 0;
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;

  po::options_description options("mrec-evaluate");
  // clang-format off
  options.add_options()
      ("help,h", "Print this help")
      ("train-original", po::value<std::string>()->required(),
       "Training ratings on their original scale")
      ("train-normalized", po::value<std::string>(),
       "Mean-centered training ratings, derived if missing")
      ("test-original", po::value<std::string>()->required(),
       "Withheld ratings on their original scale")
      ("test-normalized", po::value<std::string>(),
       "Mean-centered withheld ratings, derived if missing")
      ("test-entries", po::value<std::string>()->required(),
       "File with one 1-based row,col pair per line")
      ("methods", po::value<std::vector<std::string>>()->multitoken()
           ->default_value({"cf", "cf-baseline", "svd", "cur"},
                           "cf cf-baseline svd cur"),
       "Strategies to evaluate: cf, cf-baseline, svd, cur")
      ("neighbours,k", po::value<int>()->default_value(150),
       "Size of the neighbourhood")
      ("concepts,c", po::value<int>()->default_value(40),
       "Number of singular values to compute")
      ("energy,e", po::value<std::vector<float>>()->multitoken()
           ->default_value({1.0f, 0.9f}, "1 0.9"),
       "Fractions of energy to retain")
      ("samples,s", po::value<int>(),
       "Number of columns and rows to sample for CUR, 4 * concepts if unset")
      ("seed", po::value<int>()->default_value(0),
       "Random seed for CUR")
      ("block-rows", po::value<int>()->default_value(0),
       "Compute similarities in blocks of this many rows, 0 for all at once");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);

    if (vm.count("help")) {
      std::cout << options << std::endl;
      return 0;
    }

    po::notify(vm);

    return run(vm);
  } catch (const po::error& e) {
    LOG(ERROR) << e.what();
    std::cerr << options << std::endl;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
  }

  return 1;
}
