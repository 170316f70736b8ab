/*
 * kmeans.hpp
 *
 *  Created on: Oct 12, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_KMEANS_HPP_
#define INCLUDE_RPROC_KMEANS_HPP_

#include <vector>
#include <string>
#include <memory>

#include "rproc/rproc.hpp"
#include "rproc/util.hpp"
#include "rproc/grid.hpp"

namespace rproc {
namespace cluster {

using namespace rproc::grid;
using namespace rproc::util;

/**
 * \brief The method used to choose the starting centroids.
 */
enum class InitMode {
	Diagonal,	///<! Evenly spaced along the diagonal between the band minima and maxima.
	Random		///<! The values of randomly chosen valid cells.
};

/**
 * \brief The state of a clustering run.
 */
enum class KMeansState {
	Initializing,
	Iterating,
	Converged,	///<! The class change fell below the threshold.
	Exhausted	///<! The iteration budget was used up.
};

R_DLL_EXPORT std::string initModeName(InitMode mode);

R_DLL_EXPORT std::string stateName(KMeansState state);

typedef std::vector<std::shared_ptr<const GridSource<float> > > BandList;

/**
 * \brief Configuration for a clustering run.
 */
class R_DLL_EXPORT KMeansConfig {
public:
	int classes;						///<! The number of classes, k.
	int maxIterations;					///<! The iteration budget, in [2, 250].
	double classChange;					///<! The percentage of changed cells below which the run stops, in [0, 25].
	int minClassSize;					///<! Classes smaller than this are re-seeded from a donor.
	InitMode init;						///<! The centroid initialization mode.
	int threads;						///<! The number of workers. Zero for the hardware parallelism.
	int labelNodata;					///<! The nodata value of the label band. Not in [1, k].
	std::shared_ptr<RandomSource> random;	///<! The random source. If null, a seeded Mersenne Twister is used.

	KMeansConfig();

	/**
	 * \brief Validate the configuration against the input bands. Only the
	 * band properties are read.
	 *
	 * \param bands The input bands.
	 * \throw std::invalid_argument If any setting or band is unusable.
	 */
	void check(const BandList& bands) const;
};

/**
 * \brief Decides after each iteration whether the run should stop, and
 * records the percentage of changed cells.
 */
class R_DLL_EXPORT ConvergencePolicy {
private:
	int m_maxIterations;
	double m_classChange;
	std::vector<double> m_history;

public:

	ConvergencePolicy(int maxIterations, double classChange);

	/**
	 * \brief Return the percentage of valid cells that changed class.
	 *
	 * \param changed The number of changed cells.
	 * \param valid The number of valid cells. Must be larger than zero.
	 */
	static double percentChanged(size_t changed, size_t valid);

	/**
	 * \brief Record the result of an iteration and return the new state:
	 * Converged if the change is below the threshold, Exhausted if the
	 * budget is used up, otherwise Iterating.
	 *
	 * \param iteration The 1-based iteration number.
	 * \param changed The number of cells that changed class.
	 * \param valid The number of valid cells.
	 */
	KMeansState update(int iteration, size_t changed, size_t valid);

	const std::vector<double>& history() const;
};

/**
 * \brief Per-class, per-band sums and extrema of the member cells.
 */
class R_DLL_EXPORT ClassStats {
public:
	std::vector<double> sum;
	std::vector<double> min;
	std::vector<double> max;
	size_t count;

	ClassStats(int bands = 0);

	void add(const std::vector<float>& values);

	void merge(const ClassStats& other);

	double mean(int band) const;
};

/**
 * \brief The outcome of the assignment step for one row.
 */
class R_DLL_EXPORT RowAssignment {
public:
	std::vector<int> classes;		///<! Zero-based class per column; -1 for invalid cells.
	std::vector<ClassStats> stats;	///<! Per-class statistics of the row.
};

/**
 * \brief One entry of the iteration history.
 */
class R_DLL_EXPORT IterationRecord {
public:
	int iteration;
	size_t changed;
	double percentChanged;
	std::vector<size_t> classCounts;		///<! Cells assigned to each class in this iteration.
};

/**
 * \brief The summary of a finished run.
 */
class R_DLL_EXPORT KMeansResult {
public:
	KMeansState state;
	int iterations;
	size_t validCells;
	std::vector<size_t> classCounts;					///<! Cells per class; index 0 is class 1.
	std::vector<std::vector<double> > centroids;		///<! One vector of band values per class.
	std::vector<std::vector<double> > distances;		///<! Symmetric matrix of centroid distances.
	std::vector<IterationRecord> history;

	KMeansResult() :
		state(KMeansState::Initializing),
		iterations(0),
		validCells(0) {}
};

/**
 * \brief Lloyd's k-means clustering of the cells of co-registered bands.
 *
 * Each iteration assigns every valid cell to the nearest centroid by squared
 * Euclidean distance (ties go to the lower class), with the rows spread over
 * the workers in stripes, then moves each centroid to the mean of its members.
 * A class with fewer than minClassSize members takes values drawn uniformly
 * from the range of a larger donor class.
 *
 * A cell is valid if no band reports nodata there. Invalid cells are never
 * classified and are left as nodata in the label band.
 */
class R_DLL_EXPORT KMeans {
private:
	KMeansConfig m_config;
	KMeansState m_state;
	KMeansResult m_result;

public:

	KMeans(const KMeansConfig& config);

	KMeansState state() const;

	const KMeansConfig& config() const;

	/**
	 * \brief Cluster the bands.
	 *
	 * \param bands The input bands; at least two, with the same extent.
	 * \param labels Receives the class labels, 1-based. Re-initialized with the
	 *               extent of the bands and filled with the label nodata value.
	 * \param monitor If not null, receives a status update per iteration.
	 * \return The result.
	 */
	const KMeansResult& run(const BandList& bands, Band<int>& labels, Monitor* monitor = nullptr);

	const KMeansResult& result() const;

	/**
	 * \brief Return KEY=VALUE entries describing the configuration and result.
	 */
	std::vector<std::string> metadata() const;

	/**
	 * \brief Return k centroids evenly spaced from the band minima toward the maxima.
	 */
	static std::vector<std::vector<double> > diagonalCentroids(const BandList& bands, int classes);

	/**
	 * \brief Return k centroids taken from randomly chosen valid cells, which
	 * need not be distinct.
	 *
	 * \throw std::runtime_error If no valid cell is found in 100 * k draws.
	 */
	static std::vector<std::vector<double> > randomCentroids(const BandList& bands, int classes, RandomSource& random);

	/**
	 * \brief Assign the cells of one row to the nearest centroids.
	 */
	static void assignRow(const BandList& bands, const std::vector<std::vector<double> >& centroids,
			int row, RowAssignment& out);

	/**
	 * \brief Move each centroid to the mean of its members, or re-seed it from a donor
	 * if the class is smaller than minClassSize.
	 *
	 * A donor is chosen at random, up to 10 * k attempts, and must have more members than its
	 * threshold, which starts at twice minClassSize and grows by minClassSize each time the class
	 * donates. If no donor is found, the centroid is left unchanged.
	 *
	 * \return The number of re-seeded classes.
	 */
	static int updateCentroids(std::vector<std::vector<double> >& centroids, const std::vector<ClassStats>& stats,
			int minClassSize, RandomSource& random);

	/**
	 * \brief Return the matrix of Euclidean distances between centroids.
	 */
	static std::vector<std::vector<double> > distances(const std::vector<std::vector<double> >& centroids);

};

} // cluster
} // rproc

#endif /* INCLUDE_RPROC_KMEANS_HPP_ */
