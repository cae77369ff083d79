#include <cmath>
#include <set>
#include <stdexcept>

#include <gtest/gtest.h>

#include "../mrec/cf/baseline.h"
#include "../mrec/cf/predictor.h"
#include "../mrec/cf/similarity.h"
#include "../mrec/eval/evaluator.h"

using namespace mrec::cf;

class CollaborativeFilteringTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // clang-format off
    const arma::fmat dense = {{5, 3, 0},
                              {4, 3, 2},
                              {1, 0, 5},
                              {5, 4, 1}};
    const arma::fmat wide = {{1, 0, 2, 0, 1},
                             {0, 0, 0, 0, 0},
                             {2, 0, 4, 0, 2},
                             {0, 3, 0, 1, 0},
                             {-1, 0, 0, 0, 1},
                             {1, 1, 1, 1, 1}};
    // clang-format on
    R = arma::sp_fmat(dense);
    W = arma::sp_fmat(wide);
  }

  arma::sp_fmat R;
  arma::sp_fmat W;
};

TEST_F(CollaborativeFilteringTest, CosineIsSymmetricWithSentinelDiagonal) {
  const arma::fmat sim = Similarity::cosine(W);

  ASSERT_EQ(6u, sim.n_rows);
  ASSERT_EQ(6u, sim.n_cols);
  for (arma::uword i = 0; i < sim.n_rows; i++) {
    EXPECT_EQ(Similarity::SELF, sim(i, i));
    for (arma::uword j = 0; j < sim.n_cols; j++) {
      EXPECT_EQ(sim(i, j), sim(j, i));
      EXPECT_FALSE(std::isnan(sim(i, j)));
    }
  }
}

TEST_F(CollaborativeFilteringTest, CosineValues) {
  const arma::fmat sim = Similarity::cosine(W);

  // Rows 0 and 2 are parallel, 0 and 3 orthogonal
  EXPECT_NEAR(1.0, sim(0, 2), 1e-6);
  EXPECT_NEAR(0.0, sim(0, 3), 1e-6);
  EXPECT_NEAR(0.0, sim(0, 4), 1e-6);
  EXPECT_NEAR(4.0 / std::sqrt(6.0 * 5.0), sim(0, 5), 1e-6);
  EXPECT_NEAR(4.0 / std::sqrt(10.0 * 5.0), sim(3, 5), 1e-6);

  // The empty row is similar to nothing
  for (arma::uword j = 0; j < sim.n_cols; j++) {
    if (j != 1) {
      EXPECT_EQ(0.0, sim(1, j));
    }
  }
}

TEST_F(CollaborativeFilteringTest, NeighbourhoodsExcludeSelf) {
  const arma::fmat sim = Similarity::cosine(W);

  for (int k = 1; k < 6; k++) {
    const Neighbourhood nb = Similarity::nearest(sim, k);

    ASSERT_EQ(6u, nb.indices.n_rows);
    ASSERT_EQ(static_cast<arma::uword>(k), nb.indices.n_cols);
    for (arma::uword i = 0; i < 6; i++) {
      std::set<arma::uword> distinct;
      for (int x = 0; x < k; x++) {
        EXPECT_NE(i, nb.indices(i, x));
        EXPECT_EQ(sim(i, nb.indices(i, x)), nb.similarities(i, x));
        if (x > 0) {
          EXPECT_GE(nb.similarities(i, x - 1), nb.similarities(i, x));
        }
        distinct.insert(nb.indices(i, x));
      }
      EXPECT_EQ(static_cast<size_t>(k), distinct.size());
    }
  }
}

TEST_F(CollaborativeFilteringTest, TiesGoToLowerIndex) {
  const Neighbourhood nb = Similarity::nearest(Similarity::cosine(W), 3);

  // Row 1 is similar to nothing, so its neighbours are the first other rows
  EXPECT_EQ(0u, nb.indices(1, 0));
  EXPECT_EQ(2u, nb.indices(1, 1));
  EXPECT_EQ(3u, nb.indices(1, 2));

  // Row 0: row 2 is parallel, then row 5
  EXPECT_EQ(2u, nb.indices(0, 0));
  EXPECT_EQ(5u, nb.indices(0, 1));
}

TEST_F(CollaborativeFilteringTest, RejectsInvalidNeighbourhoodSize) {
  const arma::fmat sim = Similarity::cosine(W);

  EXPECT_THROW(Similarity::nearest(sim, 0), std::invalid_argument);
  EXPECT_THROW(Similarity::nearest(sim, 6), std::invalid_argument);
  EXPECT_THROW(Similarity::nearestBlocked(W, 6, 2), std::invalid_argument);
}

TEST_F(CollaborativeFilteringTest, BlockedMatchesFull) {
  const Neighbourhood full = Similarity::nearest(Similarity::cosine(W), 3);

  const arma::uword blocks[] = {1, 2, 4, 6, 10};
  for (arma::uword block : blocks) {
    const Neighbourhood nb = Similarity::nearestBlocked(W, 3, block);

    EXPECT_TRUE(arma::all(arma::vectorise(nb.indices == full.indices)));
    EXPECT_TRUE(arma::approx_equal(nb.similarities, full.similarities,
                                   "absdiff", 1e-6));
  }
}

TEST_F(CollaborativeFilteringTest, BaselineMeansCountRatedEntriesOnly) {
  const Baseline b = Baseline::compute(R);

  EXPECT_FLOAT_EQ(3.3, b.mean);
  EXPECT_FLOAT_EQ(4, b.userMeans(0));
  EXPECT_FLOAT_EQ(3, b.userMeans(1));
  EXPECT_FLOAT_EQ(3, b.userMeans(2));
  EXPECT_FLOAT_EQ(10.0f / 3, b.userMeans(3));
  EXPECT_FLOAT_EQ(3.75, b.itemMeans(0));
  EXPECT_FLOAT_EQ(10.0f / 3, b.itemMeans(1));
  EXPECT_FLOAT_EQ(8.0f / 3, b.itemMeans(2));
}

TEST_F(CollaborativeFilteringTest, PredictsWeightedAverage) {
  const mrec::Entries entries = {mrec::Entry(0, 2)};
  const Predictor predictor(2, false);

  const arma::fmat P = predictor.predict(R, R, entries);

  // The two neighbours of user 0 are user 3 and user 1
  const double s3 = 37.0 / std::sqrt(34.0 * 42.0);
  const double s1 = 29.0 / std::sqrt(34.0 * 29.0);
  EXPECT_NEAR((s3 * 1 + s1 * 2) / (s3 + s1), P(0, 2), 1e-5);

  // Everything else is left alone
  EXPECT_FLOAT_EQ(5, P(0, 0));
  EXPECT_FLOAT_EQ(3, P(1, 1));
  EXPECT_FLOAT_EQ(0, P(2, 1));
}

TEST_F(CollaborativeFilteringTest, PredictsDeviationFromUserMean) {
  const mrec::Entries entries = {mrec::Entry(0, 2), mrec::Entry(2, 1)};
  const Predictor predictor(2, true);

  const arma::fmat P = predictor.predict(R, R, entries);

  const double s3 = 37.0 / std::sqrt(34.0 * 42.0);
  const double s1 = 29.0 / std::sqrt(34.0 * 29.0);
  const double expected =
      4.0 + (s3 * (1 - 10.0 / 3) + s1 * (2 - 3.0)) / (s3 + s1);
  EXPECT_NEAR(expected, P(0, 2), 1e-5);
  EXPECT_FALSE(std::isnan(P(2, 1)));
}

TEST_F(CollaborativeFilteringTest, BaselineWithZeroMeansIsPlain) {
  const mrec::Entries entries = {mrec::Entry(0, 2), mrec::Entry(2, 1),
                                 mrec::Entry(3, 0)};
  const Predictor plain(2, false);

  const Neighbourhood nb = plain.neighbourhood(R);
  const arma::fmat zeroMeans = Predictor::predictWith(
      nb, R, entries, arma::fvec(R.n_rows, arma::fill::zeros));

  EXPECT_TRUE(arma::approx_equal(zeroMeans, plain.predict(R, R, entries),
                                 "absdiff", 0.0));
}

TEST_F(CollaborativeFilteringTest, RejectsEntriesOutsideMatrix) {
  const Predictor predictor(2, false);

  EXPECT_THROW(predictor.predict(R, R, {mrec::Entry(4, 0)}),
               std::out_of_range);
  EXPECT_THROW(predictor.predict(R, R, {mrec::Entry(0, 3)}),
               std::out_of_range);
}

TEST(CollaborativeFilteringScenarioTest, OrthogonalUsersPredictZero) {
  const arma::sp_fmat R(arma::fmat(arma::diagmat(arma::fvec({5, 3, 4, 2}))));
  const mrec::Entries entries = {mrec::Entry(0, 0), mrec::Entry(1, 1)};

  const arma::fmat plain = Predictor(2, false).predict(R, R, entries);
  const arma::fmat baseline = Predictor(2, true).predict(R, R, entries);

  EXPECT_EQ(0.0, plain(0, 0));
  EXPECT_EQ(0.0, plain(1, 1));
  EXPECT_EQ(0.0, baseline(0, 0));
  EXPECT_EQ(0.0, baseline(1, 1));
  EXPECT_EQ(4.0, plain(2, 2));

  const mrec::eval::Score score =
      mrec::eval::Evaluator::score(plain, R, entries);
  EXPECT_NEAR(std::sqrt(17.0), score.rmse, 1e-6);
}
