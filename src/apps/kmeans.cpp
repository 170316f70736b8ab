/*
 * kmeans.cpp
 *
 *  Created on: Oct 12, 2026
 *      Author: rproc contributors
 */

#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <memory>

#include "rproc/kmeans.hpp"

using namespace rproc::cluster;

void usage() {
	std::cerr << "Usage: rproc_kmeans [options] <output raster> <input raster> <input raster> [<input raster> ...]\n"
			<< " Clusters the cells of two or more co-registered single-band rasters.\n"
			<< " The first band of each input is used.\n"
			<< " -k  <classes>    The number of classes. Required.\n"
			<< " -i  <iterations> The maximum number of iterations, 2-250. Default 10.\n"
			<< " -c  <percent>    Stop when fewer than this percentage of cells change class, 0-25. Default 2.0.\n"
			<< " -m  <size>       The minimum class size. Default 10.\n"
			<< " -r               Initialize the centroids from random cells. Default is the diagonal.\n"
			<< " -s  <seed>       The random seed.\n"
			<< " -t  <threads>    The number of threads. Default is the number of cores.\n"
			<< " -d  <driver>     The output driver. Default is guessed from the output extension.\n"
			<< " -v               Verbose output.\n";
}

/**
 * Print the cluster sizes, centroids and centroid distances.
 */
void report(const KMeansResult& result, const std::vector<std::string>& infiles) {
	std::cout << "K-means clustering: " << stateName(result.state) << " after " << result.iterations << " iterations.\n";
	std::cout << "Valid cells: " << result.validCells << "\n\n";

	std::cout << "Iteration\tChanged\t% Changed\tClass cells\n";
	for(const IterationRecord& rec : result.history) {
		std::cout << rec.iteration << "\t" << rec.changed << "\t" << std::fixed << std::setprecision(3) << rec.percentChanged
				<< "\t" << join(rec.classCounts.begin(), rec.classCounts.end(), ",") << "\n";
	}

	std::cout << "\nClass\tCells";
	for(const std::string& file : infiles)
		std::cout << "\t" << file;
	std::cout << "\n";
	for(size_t a = 0; a < result.centroids.size(); ++a) {
		std::cout << (a + 1) << "\t" << result.classCounts[a];
		for(double v : result.centroids[a])
			std::cout << "\t" << std::setprecision(4) << v;
		std::cout << "\n";
	}

	std::cout << "\nCentroid distances\n";
	size_t k = result.distances.size();
	for(size_t a = 1; a <= k; ++a)
		std::cout << "\t" << a;
	std::cout << "\n";
	for(size_t a = 0; a < k; ++a) {
		std::cout << (a + 1);
		for(size_t b = 0; b < k; ++b) {
			std::cout << "\t";
			if(b > a)
				std::cout << std::setprecision(4) << result.distances[a][b];
		}
		std::cout << "\n";
	}
}

int main(int argc, char** argv) {

	if(argc < 4) {
		usage();
		return 1;
	}

	KMeansConfig config;
	config.classes = 0;
	std::string outfile;
	std::string driver;
	std::vector<std::string> infiles;
	bool seeded = false;
	unsigned long long seed = 0;

	for(int i = 1; i < argc; ++i) {
		std::string v = argv[i];
		if(v == "-k" && i + 1 < argc) {
			config.classes = atoi(argv[++i]);
		} else if(v == "-i" && i + 1 < argc) {
			config.maxIterations = atoi(argv[++i]);
		} else if(v == "-c" && i + 1 < argc) {
			config.classChange = atof(argv[++i]);
		} else if(v == "-m" && i + 1 < argc) {
			config.minClassSize = atoi(argv[++i]);
		} else if(v == "-r") {
			config.init = InitMode::Random;
		} else if(v == "-s" && i + 1 < argc) {
			seed = std::strtoull(argv[++i], nullptr, 10);
			seeded = true;
		} else if(v == "-t" && i + 1 < argc) {
			config.threads = atoi(argv[++i]);
		} else if(v == "-d" && i + 1 < argc) {
			driver = argv[++i];
		} else if(v == "-v") {
			rproc::loglevel(R_LOG_DEBUG);
		} else if(outfile.empty()) {
			outfile = v;
		} else {
			infiles.push_back(v);
		}
	}

	if(outfile.empty() || infiles.size() < 2) {
		std::cerr << "An output file and at least two input files are required.\n";
		usage();
		return 1;
	}

	if(seeded) {
		config.random.reset(new MTRandom(seed));
	} else {
		config.random.reset(new MTRandom());
	}

	try {

		Stopwatch sw;
		sw.start();

		BandList bands;
		for(const std::string& file : infiles) {
			if(Band<float>::bands(file) > 1)
				r_warn("Only the first band of " << file << " is used.");
			bands.emplace_back(new Band<float>(file, 0));
		}

		KMeans kmeans(config);
		Band<int> labels;
		const KMeansResult& result = kmeans.run(bands, labels, rproc::getDefaultMonitor());

		labels.save(outfile, driver);

		report(result, infiles);

		std::cout << "Elapsed time: " << sw.time() << "\n";

	} catch(const std::exception& ex) {
		std::cerr << ex.what() << "\n";
		return 1;
	}

	return 0;
}
