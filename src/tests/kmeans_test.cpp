/*
 * kmeans_test.cpp
 *
 *  Created on: Oct 15, 2026
 *      Author: rproc contributors
 */

#include <vector>
#include <string>
#include <memory>
#include <atomic>
#include <cmath>
#include <algorithm>
#include <stdexcept>

#include <gtest/gtest.h>

#include "rproc/kmeans.hpp"

using namespace rproc::cluster;

namespace {

	const float ND = -9999;

	std::shared_ptr<Band<float> > makeBand(int cols, int rows, const std::vector<float>& values) {
		GridProps props;
		props.setSize(cols, rows);
		props.setNoData(ND);
		std::shared_ptr<Band<float> > band(new Band<float>(props));
		for(int r = 0; r < rows; ++r) {
			for(int c = 0; c < cols; ++c)
				band->set(c, r, values[r * cols + c]);
		}
		return band;
	}

	/**
	 * Returns the scripted indices in order, cycling when exhausted, and the
	 * midpoint of any uniform range.
	 */
	class ScriptedRandom : public RandomSource {
	public:
		std::vector<size_t> script;
		size_t pos;
		int calls;

		ScriptedRandom(const std::vector<size_t>& script) :
			script(script), pos(0), calls(0) {}

		size_t index(size_t n) {
			++calls;
			size_t v = script[pos++ % script.size()];
			return v % n;
		}

		double uniform(double min, double max) {
			return (min + max) / 2.0;
		}
	};

	/**
	 * A source that counts cell reads.
	 */
	class CountingSource : public GridSource<float> {
	private:
		GridProps m_props;

	public:
		mutable std::atomic<int> reads;

		CountingSource(int cols, int rows) :
			reads(0) {
			m_props.setSize(cols, rows);
			m_props.setNoData(ND);
		}

		const GridProps& props() const {
			return m_props;
		}

		float get(int, int) const {
			++reads;
			return 1;
		}

		GridStats stats() const {
			++reads;
			return GridStats();
		}
	};

	/**
	 * The 3x3, two-band example: band 0 holds 1..9, band 1 ten times that.
	 */
	BandList diagonalExample() {
		std::vector<float> b0, b1;
		for(int i = 1; i <= 9; ++i) {
			b0.push_back((float) i);
			b1.push_back((float) i * 10);
		}
		return BandList({makeBand(3, 3, b0), makeBand(3, 3, b1)});
	}

	ClassStats classStats(size_t count, double sum, double min, double max) {
		ClassStats s(1);
		s.count = count;
		s.sum[0] = sum;
		s.min[0] = min;
		s.max[0] = max;
		return s;
	}

}

TEST(KMeansTest, HandComputedExample) {
	KMeansConfig config;
	config.classes = 2;
	config.maxIterations = 10;
	config.classChange = 2.0;
	config.minClassSize = 1;
	config.init = InitMode::Diagonal;
	config.threads = 2;

	BandList bands = diagonalExample();
	Band<int> labels;
	KMeans kmeans(config);
	const KMeansResult& result = kmeans.run(bands, labels);

	EXPECT_EQ(KMeansState::Converged, result.state);
	EXPECT_EQ(KMeansState::Converged, kmeans.state());
	EXPECT_EQ(3, result.iterations);
	EXPECT_EQ(9u, result.validCells);

	std::vector<int> expected = {1, 1, 1, 1, 2, 2, 2, 2, 2};
	for(int r = 0; r < 3; ++r) {
		for(int c = 0; c < 3; ++c)
			EXPECT_EQ(expected[r * 3 + c], labels.get(c, r)) << "at " << c << ", " << r;
	}

	EXPECT_EQ(std::vector<size_t>({4, 5}), result.classCounts);
	ASSERT_EQ(2u, result.centroids.size());
	EXPECT_DOUBLE_EQ(2.5, result.centroids[0][0]);
	EXPECT_DOUBLE_EQ(25, result.centroids[0][1]);
	EXPECT_DOUBLE_EQ(7, result.centroids[1][0]);
	EXPECT_DOUBLE_EQ(70, result.centroids[1][1]);

	double dist = std::sqrt(4.5 * 4.5 + 45 * 45);
	EXPECT_NEAR(dist, result.distances[0][1], 1e-9);
	EXPECT_NEAR(dist, result.distances[1][0], 1e-9);
	EXPECT_DOUBLE_EQ(0, result.distances[0][0]);

	ASSERT_EQ(3u, result.history.size());
	EXPECT_EQ(9u, result.history[0].changed);
	EXPECT_DOUBLE_EQ(100, result.history[0].percentChanged);
	EXPECT_EQ(1u, result.history[1].changed);
	EXPECT_NEAR(100.0 / 9.0, result.history[1].percentChanged, 1e-9);
	EXPECT_EQ(0u, result.history[2].changed);
	EXPECT_DOUBLE_EQ(0, result.history[2].percentChanged);
	EXPECT_EQ(std::vector<size_t>({3, 6}), result.history[0].classCounts);
	EXPECT_EQ(std::vector<size_t>({4, 5}), result.history[1].classCounts);
	EXPECT_EQ(std::vector<size_t>({4, 5}), result.history[2].classCounts);

	std::vector<std::string> meta = labels.props().metadata();
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "num_classes=2"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "iterations=3"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "state=converged"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "init=diagonal"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "class_1_count=4"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "class_1_centroid=2.5,25"));
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "class_2_centroid=7,70"));
}

TEST(KMeansTest, DiagonalCentroids) {
	BandList bands = diagonalExample();
	std::vector<std::vector<double> > centroids = KMeans::diagonalCentroids(bands, 4);
	ASSERT_EQ(4u, centroids.size());
	EXPECT_DOUBLE_EQ(1, centroids[0][0]);
	EXPECT_DOUBLE_EQ(3, centroids[1][0]);
	EXPECT_DOUBLE_EQ(7, centroids[3][0]);
	EXPECT_DOUBLE_EQ(70, centroids[3][1]);
}

TEST(KMeansTest, NodataNotRepresentableInBand) {
	// -9999.9 has no exact float representation.
	GridProps props;
	props.setSize(3, 3);
	props.setNoData(-9999.9);
	std::shared_ptr<Band<float> > band(new Band<float>(props));
	for(int i = 1; i < 9; ++i)
		band->set(i % 3, i / 3, (float) (i + 1));
	BandList bands({band});

	std::vector<std::vector<double> > centroids = KMeans::diagonalCentroids(bands, 2);
	ASSERT_EQ(2u, centroids.size());
	EXPECT_DOUBLE_EQ(2, centroids[0][0]);
	EXPECT_DOUBLE_EQ(5.5, centroids[1][0]);

	KMeansConfig config;
	config.classes = 2;
	config.minClassSize = 1;
	Band<int> labels;
	KMeans kmeans(config);
	const KMeansResult& result = kmeans.run(bands, labels);

	EXPECT_EQ(8u, result.validCells);
	EXPECT_EQ(0, labels.get(0, 0));
	for(const IterationRecord& rec : result.history) {
		ASSERT_EQ(2u, rec.classCounts.size());
		EXPECT_GT(rec.classCounts[0], 0u);
		EXPECT_GT(rec.classCounts[1], 0u);
		EXPECT_EQ(8u, rec.classCounts[0] + rec.classCounts[1]);
	}
	EXPECT_GE(result.centroids[0][0], 2);
}

TEST(KMeansTest, NodataCellsAreNotClassified) {
	std::vector<float> b0 = {1, 2, ND, 4, 5, 6, 7, 8, 9, 10, 11, 12};
	std::vector<float> b1 = {1, 2, 3, 4, ND, 6, 7, 8, 9, 10, 11, ND};
	BandList bands({makeBand(4, 3, b0), makeBand(4, 3, b1)});

	KMeansConfig config;
	config.classes = 3;
	config.minClassSize = 1;
	config.labelNodata = -1;
	config.threads = 3;

	Band<int> labels;
	KMeans kmeans(config);
	const KMeansResult& result = kmeans.run(bands, labels);

	EXPECT_EQ(9u, result.validCells);
	size_t sum = 0;
	for(size_t n : result.classCounts)
		sum += n;
	EXPECT_EQ(result.validCells, sum);
	ASSERT_FALSE(result.history.empty());
	for(const IterationRecord& rec : result.history) {
		ASSERT_EQ(3u, rec.classCounts.size());
		sum = 0;
		for(size_t n : rec.classCounts)
			sum += n;
		EXPECT_EQ(result.validCells, sum) << "iteration " << rec.iteration;
	}

	EXPECT_DOUBLE_EQ(-1, labels.props().nodata());
	EXPECT_EQ(-1, labels.get(2, 0));
	EXPECT_EQ(-1, labels.get(0, 1));
	EXPECT_EQ(-1, labels.get(3, 2));
	for(int r = 0; r < 3; ++r) {
		for(int c = 0; c < 4; ++c) {
			int label = labels.get(c, r);
			EXPECT_TRUE(label == -1 || (label >= 1 && label <= 3));
		}
	}
}

TEST(KMeansTest, ExhaustsBudget) {
	KMeansConfig config;
	config.classes = 2;
	config.maxIterations = 2;
	config.classChange = 0;
	config.minClassSize = 1;

	BandList bands = diagonalExample();
	Band<int> labels;
	KMeans kmeans(config);
	const KMeansResult& result = kmeans.run(bands, labels);

	EXPECT_EQ(KMeansState::Exhausted, result.state);
	EXPECT_EQ(2, result.iterations);
	EXPECT_EQ(2u, result.history.size());
}

TEST(KMeansTest, ThreadCountDoesNotMatter) {
	// Values are multiples of 1/16 so that the sums don't depend on the merge order.
	MTRandom random(17);
	auto value = [&random](double min, double max) {
		return (float) (std::floor(random.uniform(min, max) * 16) / 16);
	};
	std::vector<float> b0, b1, b2;
	for(int i = 0; i < 40 * 30; ++i) {
		b0.push_back(value(0, 50));
		b1.push_back(random.index(20) ? value(10, 20) : ND);
		b2.push_back(value(-5, 5));
	}
	BandList bands({makeBand(40, 30, b0), makeBand(40, 30, b1), makeBand(40, 30, b2)});

	KMeansConfig config;
	config.classes = 5;
	config.minClassSize = 10;

	config.threads = 1;
	config.random.reset(new MTRandom(5));
	Band<int> labels1;
	KMeans k1(config);
	KMeansResult r1 = k1.run(bands, labels1);

	config.threads = 6;
	config.random.reset(new MTRandom(5));
	Band<int> labels6;
	KMeans k6(config);
	KMeansResult r6 = k6.run(bands, labels6);

	EXPECT_EQ(r1.iterations, r6.iterations);
	EXPECT_EQ(r1.classCounts, r6.classCounts);
	for(int r = 0; r < 30; ++r) {
		for(int c = 0; c < 40; ++c)
			ASSERT_EQ(labels1.get(c, r), labels6.get(c, r));
	}
}

TEST(KMeansTest, NoValidCells) {
	std::vector<float> nd(9, ND);
	BandList bands({makeBand(3, 3, nd), makeBand(3, 3, nd)});
	KMeansConfig config;
	config.minClassSize = 1;
	Band<int> labels;
	KMeans kmeans(config);
	EXPECT_THROW(kmeans.run(bands, labels), std::runtime_error);
}

TEST(KMeansConfigTest, InvalidConfigurationReadsNoCells) {
	std::shared_ptr<CountingSource> a(new CountingSource(4, 4));
	std::shared_ptr<CountingSource> b(new CountingSource(4, 4));
	BandList bands({a, b});

	KMeansConfig good;
	good.classes = 2;
	good.minClassSize = 1;
	EXPECT_NO_THROW(good.check(bands));

	std::vector<KMeansConfig> bad(9, good);
	bad[0].classes = 1;
	bad[1].classes = 17;
	bad[2].minClassSize = 9;				// 16 / 2 = 8
	bad[3].maxIterations = 1;
	bad[4].maxIterations = 251;
	bad[5].classChange = 25.5;
	bad[6].classChange = -1;
	bad[7].labelNodata = 2;
	bad[8].threads = -1;

	for(size_t i = 0; i < bad.size(); ++i) {
		Band<int> labels;
		KMeans kmeans(bad[i]);
		EXPECT_THROW(kmeans.run(bands, labels), std::invalid_argument) << "config " << i;
	}
	EXPECT_EQ(0, a->reads.load());
	EXPECT_EQ(0, b->reads.load());
}

TEST(KMeansConfigTest, InvalidBands) {
	KMeansConfig config;
	config.minClassSize = 1;

	EXPECT_THROW(config.check(BandList()), std::invalid_argument);

	std::shared_ptr<CountingSource> a(new CountingSource(4, 4));
	EXPECT_THROW(config.check(BandList({a})), std::invalid_argument);

	std::shared_ptr<CountingSource> b(new CountingSource(4, 5));
	EXPECT_THROW(config.check(BandList({a, b})), std::invalid_argument);

	EXPECT_THROW(config.check(BandList({a, nullptr})), std::invalid_argument);
	EXPECT_EQ(0, a->reads.load());
}

TEST(ConvergencePolicyTest, StopsOnThresholdOrBudget) {
	ConvergencePolicy policy(3, 5.0);
	EXPECT_EQ(KMeansState::Iterating, policy.update(1, 100, 100));
	EXPECT_EQ(KMeansState::Iterating, policy.update(2, 5, 100));
	EXPECT_EQ(KMeansState::Exhausted, policy.update(3, 10, 100));
	EXPECT_EQ(std::vector<double>({100, 5, 10}), policy.history());

	ConvergencePolicy policy2(10, 5.0);
	EXPECT_EQ(KMeansState::Converged, policy2.update(1, 4, 100));

	EXPECT_THROW(ConvergencePolicy::percentChanged(1, 0), std::runtime_error);
}

TEST(UpdateCentroidsTest, MeansOfLargeClasses) {
	std::vector<std::vector<double> > centroids = {{0}, {0}};
	std::vector<ClassStats> stats = {classStats(4, 10, 1, 4), classStats(2, 9, 4, 5)};
	ScriptedRandom random({0});
	EXPECT_EQ(0, KMeans::updateCentroids(centroids, stats, 2, random));
	EXPECT_DOUBLE_EQ(2.5, centroids[0][0]);
	EXPECT_DOUBLE_EQ(4.5, centroids[1][0]);
	EXPECT_EQ(0, random.calls);
}

TEST(UpdateCentroidsTest, DonorEscalationAndExhaustion) {
	// Class 0 is empty and class 2 is small. Class 1 has 5 members; its threshold
	// starts at 4 and rises to 6 after it donates once.
	std::vector<std::vector<double> > centroids = {{100}, {100}, {200}};
	std::vector<ClassStats> stats = {classStats(0, 0, 0, 0), classStats(5, 15, 2, 4), classStats(1, 8, 8, 8)};
	ScriptedRandom random({2, 1, 1});

	EXPECT_EQ(1, KMeans::updateCentroids(centroids, stats, 2, random));

	// Class 0 rejects donor 2 and takes the middle of donor 1's range.
	EXPECT_DOUBLE_EQ(3, centroids[0][0]);
	EXPECT_DOUBLE_EQ(3, centroids[1][0]);
	// Class 2 finds no donor in 10 * k attempts and is unchanged.
	EXPECT_DOUBLE_EQ(200, centroids[2][0]);
	EXPECT_EQ(2 + 30, random.calls);
}

TEST(InitTest, RandomCentroidsSkipInvalidCells) {
	std::vector<float> b0 = {ND, 2, 3, 4, 5, 6, 7, 8, 9};
	std::vector<float> b1 = {10, 20, 30, 40, 50, 60, 70, 80, 90};
	BandList bands({makeBand(3, 3, b0), makeBand(3, 3, b1)});

	// Draws are (row, col) pairs.
	ScriptedRandom random({0, 0, 1, 1, 2, 0});
	std::vector<std::vector<double> > centroids = KMeans::randomCentroids(bands, 2, random);
	ASSERT_EQ(2u, centroids.size());
	EXPECT_EQ(std::vector<double>({5, 50}), centroids[0]);
	EXPECT_EQ(std::vector<double>({7, 70}), centroids[1]);
}

TEST(InitTest, RandomCentroidsFailWithoutValidCells) {
	std::vector<float> nd(4, ND);
	BandList bands({makeBand(2, 2, nd), makeBand(2, 2, nd)});
	ScriptedRandom random({0, 1, 1, 0});
	EXPECT_THROW(KMeans::randomCentroids(bands, 2, random), std::runtime_error);
	EXPECT_EQ(2 * 100 * 2, random.calls);
}

TEST(KMeansTest, RandomInitRun) {
	KMeansConfig config;
	config.classes = 2;
	config.minClassSize = 1;
	config.init = InitMode::Random;
	config.random.reset(new ScriptedRandom({0, 0, 2, 2}));

	BandList bands = diagonalExample();
	Band<int> labels;
	KMeans kmeans(config);
	const KMeansResult& result = kmeans.run(bands, labels);

	// Seeds at 1 and 9 tie at 5, which goes to the lower class.
	EXPECT_EQ(KMeansState::Converged, result.state);
	EXPECT_EQ(std::vector<size_t>({5, 4}), result.classCounts);
	EXPECT_EQ(1, labels.get(0, 0));
	EXPECT_EQ(2, labels.get(2, 2));

	std::vector<std::string> meta = kmeans.metadata();
	EXPECT_NE(meta.end(), std::find(meta.begin(), meta.end(), "init=random"));
}
