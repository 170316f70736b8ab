/*
 * kmeans.cpp
 *
 *  Created on: Oct 12, 2026
 *      Author: rproc contributors
 */

#include <cmath>
#include <limits>

#include "rproc/kmeans.hpp"
#include "rproc/dispatch.hpp"

using namespace rproc::cluster;
using namespace rproc::dispatch;

namespace {

	/**
	 * Read the values of every band at the cell. Returns false if any band has nodata there.
	 */
	bool readCell(const BandList& bands, int col, int row, std::vector<float>& values) {
		for(size_t b = 0; b < bands.size(); ++b) {
			float v = bands[b]->get(col, row);
			if(v == (float) bands[b]->props().nodata())
				return false;
			values[b] = v;
		}
		return true;
	}

} // anon

std::string rproc::cluster::initModeName(InitMode mode) {
	switch(mode) {
	case InitMode::Diagonal: return "diagonal";
	case InitMode::Random: return "random";
	default:
		r_argerr("Unknown init mode: " << (int) mode);
	}
}

std::string rproc::cluster::stateName(KMeansState state) {
	switch(state) {
	case KMeansState::Initializing: return "initializing";
	case KMeansState::Iterating: return "iterating";
	case KMeansState::Converged: return "converged";
	case KMeansState::Exhausted: return "exhausted";
	default:
		r_argerr("Unknown state: " << (int) state);
	}
}

KMeansConfig::KMeansConfig() :
	classes(2),
	maxIterations(10),
	classChange(2.0),
	minClassSize(10),
	init(InitMode::Diagonal),
	threads(0),
	labelNodata(0) {
}

void KMeansConfig::check(const BandList& bands) const {
	if(bands.empty())
		r_argerr("No input bands were given.");
	if(bands.size() < 2)
		r_argerr("At least two bands are required for clustering; " << bands.size() << " given.");
	for(size_t i = 0; i < bands.size(); ++i) {
		if(!bands[i])
			r_argerr("Band " << i << " is null.");
	}
	const GridProps& props = bands.front()->props();
	for(size_t i = 1; i < bands.size(); ++i) {
		if(!props.sameExtent(bands[i]->props()))
			r_argerr("Band " << i << " does not have the same extent as band 0: "
					<< bands[i]->props().cols() << "x" << bands[i]->props().rows()
					<< " vs. " << props.cols() << "x" << props.rows() << ".");
	}
	size_t cells = props.size();
	if(classes < 2 || (size_t) classes > cells)
		r_argerr("The number of classes must be between 2 and the number of cells (" << cells << "); " << classes << " given.");
	if(maxIterations < 2 || maxIterations > 250)
		r_argerr("The maximum number of iterations must be between 2 and 250; " << maxIterations << " given.");
	if(!(classChange >= 0 && classChange <= 25))
		r_argerr("The class change threshold must be between 0 and 25%; " << classChange << " given.");
	if(minClassSize < 0 || (size_t) minClassSize > cells / classes)
		r_argerr("The minimum class size must be between 0 and " << (cells / classes) << "; " << minClassSize << " given.");
	if(labelNodata >= 1 && labelNodata <= classes)
		r_argerr("The label nodata value (" << labelNodata << ") must not be a class id.");
	if(threads < 0)
		r_argerr("The number of threads must not be negative.");
}


ConvergencePolicy::ConvergencePolicy(int maxIterations, double classChange) :
	m_maxIterations(maxIterations),
	m_classChange(classChange) {
}

double ConvergencePolicy::percentChanged(size_t changed, size_t valid) {
	if(valid == 0)
		r_runerr("There are no valid cells.");
	return 100.0 * (double) changed / (double) valid;
}

KMeansState ConvergencePolicy::update(int iteration, size_t changed, size_t valid) {
	double pct = percentChanged(changed, valid);
	m_history.push_back(pct);
	if(pct < m_classChange)
		return KMeansState::Converged;
	if(iteration >= m_maxIterations)
		return KMeansState::Exhausted;
	return KMeansState::Iterating;
}

const std::vector<double>& ConvergencePolicy::history() const {
	return m_history;
}


ClassStats::ClassStats(int bands) :
	sum(bands, 0.0),
	min(bands, std::numeric_limits<double>::infinity()),
	max(bands, -std::numeric_limits<double>::infinity()),
	count(0) {
}

void ClassStats::add(const std::vector<float>& values) {
	for(size_t b = 0; b < sum.size(); ++b) {
		double v = values[b];
		sum[b] += v;
		if(v < min[b]) min[b] = v;
		if(v > max[b]) max[b] = v;
	}
	++count;
}

void ClassStats::merge(const ClassStats& other) {
	for(size_t b = 0; b < sum.size(); ++b) {
		sum[b] += other.sum[b];
		if(other.min[b] < min[b]) min[b] = other.min[b];
		if(other.max[b] > max[b]) max[b] = other.max[b];
	}
	count += other.count;
}

double ClassStats::mean(int band) const {
	if(!count)
		r_runerr("The class has no members.");
	return sum[band] / count;
}


KMeans::KMeans(const KMeansConfig& config) :
	m_config(config),
	m_state(KMeansState::Initializing) {
}

KMeansState KMeans::state() const {
	return m_state;
}

const KMeansConfig& KMeans::config() const {
	return m_config;
}

const KMeansResult& KMeans::result() const {
	return m_result;
}

std::vector<std::vector<double> > KMeans::diagonalCentroids(const BandList& bands, int classes) {
	std::vector<std::vector<double> > centroids(classes, std::vector<double>(bands.size()));
	for(size_t b = 0; b < bands.size(); ++b) {
		GridStats stats = bands[b]->stats();
		double step = (stats.max - stats.min) / classes;
		for(int a = 0; a < classes; ++a)
			centroids[a][b] = stats.min + step * a;
	}
	return centroids;
}

std::vector<std::vector<double> > KMeans::randomCentroids(const BandList& bands, int classes, RandomSource& random) {
	const GridProps& props = bands.front()->props();
	std::vector<std::vector<double> > centroids;
	std::vector<float> values(bands.size());
	int draws = 0;
	while((int) centroids.size() < classes) {
		if(draws >= 100 * classes)
			r_runerr("Failed to find a valid cell for random initialization in " << draws << " draws.");
		++draws;
		int row = (int) random.index(props.rows());
		int col = (int) random.index(props.cols());
		if(readCell(bands, col, row, values))
			centroids.emplace_back(values.begin(), values.end());
	}
	return centroids;
}

void KMeans::assignRow(const BandList& bands, const std::vector<std::vector<double> >& centroids,
		int row, RowAssignment& out) {

	int cols = bands.front()->props().cols();
	int nbands = (int) bands.size();
	int k = (int) centroids.size();

	out.classes.assign(cols, -1);
	out.stats.assign(k, ClassStats(nbands));

	std::vector<float> values(nbands);
	for(int col = 0; col < cols; ++col) {
		if(!readCell(bands, col, row, values))
			continue;
		int cls = 0;
		double minDist = std::numeric_limits<double>::max();
		for(int a = 0; a < k; ++a) {
			double dist = 0;
			for(int b = 0; b < nbands; ++b)
				dist += rproc::sq(values[b] - centroids[a][b]);
			if(dist < minDist) {
				minDist = dist;
				cls = a;
			}
		}
		out.classes[col] = cls;
		out.stats[cls].add(values);
	}
}

int KMeans::updateCentroids(std::vector<std::vector<double> >& centroids, const std::vector<ClassStats>& stats,
		int minClassSize, RandomSource& random) {

	int k = (int) centroids.size();
	int reseeded = 0;

	// Donation thresholds; raised each time a class donates.
	std::vector<size_t> thresholds(k, (size_t) minClassSize * 2);

	for(int a = 0; a < k; ++a) {
		std::vector<double>& centroid = centroids[a];
		if(stats[a].count >= (size_t) minClassSize) {
			if(stats[a].count) {
				for(size_t b = 0; b < centroid.size(); ++b)
					centroid[b] = stats[a].mean(b);
			}
		} else {
			bool found = false;
			for(int attempt = 0; !found && attempt < 10 * k; ++attempt) {
				int donor = (int) random.index(k);
				if(stats[donor].count > thresholds[donor]) {
					const ClassStats& ds = stats[donor];
					for(size_t b = 0; b < centroid.size(); ++b)
						centroid[b] = random.uniform(ds.min[b], ds.max[b]);
					thresholds[donor] += minClassSize;
					found = true;
				}
			}
			if(found) {
				++reseeded;
			} else {
				r_debug("No donor found for class " << (a + 1) << "; the centroid is unchanged.");
			}
		}
	}
	return reseeded;
}

std::vector<std::vector<double> > KMeans::distances(const std::vector<std::vector<double> >& centroids) {
	size_t k = centroids.size();
	std::vector<std::vector<double> > dist(k, std::vector<double>(k, 0.0));
	for(size_t a = 0; a < k; ++a) {
		for(size_t b = a + 1; b < k; ++b) {
			double d = 0;
			for(size_t i = 0; i < centroids[a].size(); ++i)
				d += rproc::sq(centroids[a][i] - centroids[b][i]);
			dist[a][b] = dist[b][a] = std::sqrt(d);
		}
	}
	return dist;
}

const KMeansResult& KMeans::run(const BandList& bands, Band<int>& labels, Monitor* monitor) {

	m_state = KMeansState::Initializing;
	m_result = KMeansResult();

	m_config.check(bands);

	std::shared_ptr<RandomSource> random = m_config.random;
	if(!random)
		random.reset(new MTRandom());

	const GridProps& props = bands.front()->props();
	int rows = props.rows();
	int k = m_config.classes;

	GridProps lprops(props);
	lprops.setNoData(m_config.labelNodata);
	lprops.setMetadata(std::vector<std::string>());
	labels.init(lprops);

	std::vector<std::vector<double> > centroids;
	if(m_config.init == InitMode::Random) {
		centroids = randomCentroids(bands, k, *random);
	} else {
		centroids = diagonalCentroids(bands, k);
	}

	ConvergencePolicy policy(m_config.maxIterations, m_config.classChange);
	std::vector<ClassStats> stats;
	size_t valid = 0;
	int iteration = 0;

	m_state = KMeansState::Iterating;

	while(m_state == KMeansState::Iterating) {

		++iteration;
		r_debug("Iteration " << iteration);
		if(monitor)
			monitor->status((float) (iteration - 1) / m_config.maxIterations, "Clustering: iteration " + std::to_string(iteration));

		stats.assign(k, ClassStats((int) bands.size()));
		size_t changed = 0;
		std::vector<int> buf;

		RowDispatcher<RowAssignment> dispatcher(rows, m_config.threads, Partition::Striped);
		dispatcher.run(
			[&bands, &centroids](int row, RowAssignment& out) {
				assignRow(bands, centroids, row, out);
			},
			[&](int row, RowAssignment& out) {
				for(int a = 0; a < k; ++a)
					stats[a].merge(out.stats[a]);
				labels.getRow(row, buf);
				for(size_t col = 0; col < buf.size(); ++col) {
					int cls = out.classes[col];
					if(cls >= 0 && buf[col] != cls + 1) {
						buf[col] = cls + 1;
						++changed;
					}
				}
				labels.setRow(row, buf);
			}
		);

		if(iteration == 1) {
			for(const ClassStats& s : stats)
				valid += s.count;
			r_debug("Valid cells: " << valid);
			if(!valid)
				r_runerr("There are no valid cells in the input.");
		}

		if(rproc::loglevel() >= R_LOG_DEBUG) {
			for(int a = 0; a < k; ++a)
				r_debug("  class " << (a + 1) << ": " << stats[a].count);
		}

		int reseeded = updateCentroids(centroids, stats, m_config.minClassSize, *random);
		if(reseeded)
			r_debug("Re-seeded " << reseeded << " small classes.");

		m_state = policy.update(iteration, changed, valid);

		IterationRecord rec;
		rec.iteration = iteration;
		rec.changed = changed;
		rec.percentChanged = policy.history().back();
		for(const ClassStats& s : stats)
			rec.classCounts.push_back(s.count);
		m_result.history.push_back(rec);

		r_debug("Changed cells: " << changed << " (" << rec.percentChanged << "%)");
	}

	if(monitor)
		monitor->status(1.0f, "Clustering: " + stateName(m_state));

	m_result.state = m_state;
	m_result.iterations = iteration;
	m_result.validCells = valid;
	for(const ClassStats& s : stats)
		m_result.classCounts.push_back(s.count);
	m_result.centroids = centroids;
	m_result.distances = distances(centroids);

	labels.setMetadata(metadata());

	return m_result;
}

std::vector<std::string> KMeans::metadata() const {
	std::vector<std::string> meta;
	meta.push_back("num_classes=" + std::to_string(m_config.classes));
	meta.push_back("max_iterations=" + std::to_string(m_config.maxIterations));
	meta.push_back("class_change=" + std::to_string(m_config.classChange));
	meta.push_back("min_class_size=" + std::to_string(m_config.minClassSize));
	meta.push_back("init=" + initModeName(m_config.init));
	meta.push_back("iterations=" + std::to_string(m_result.iterations));
	meta.push_back("state=" + stateName(m_result.state));
	if(!m_result.centroids.empty())
		meta.push_back("num_bands=" + std::to_string(m_result.centroids.front().size()));
	for(size_t a = 0; a < m_result.classCounts.size(); ++a)
		meta.push_back("class_" + std::to_string(a + 1) + "_count=" + std::to_string(m_result.classCounts[a]));
	for(size_t a = 0; a < m_result.centroids.size(); ++a) {
		const std::vector<double>& c = m_result.centroids[a];
		meta.push_back("class_" + std::to_string(a + 1) + "_centroid=" + join(c.begin(), c.end(), ","));
	}
	return meta;
}
