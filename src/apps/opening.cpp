/*
 * opening.cpp
 *
 *  Created on: Oct 13, 2026
 *      Author: rproc contributors
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <memory>

#include "rproc/morph.hpp"

using namespace rproc::morph;
using namespace rproc::util;

void usage() {
	std::cerr << "Usage: rproc_opening [options] <input raster> <output raster>\n"
			<< " Applies a morphological opening (erosion, then dilation) to a raster band.\n"
			<< " -w  <width>      The filter width in columns. Odd, >= 3. Default 11.\n"
			<< " -h  <height>     The filter height in rows. Odd, >= 3. Default 11.\n"
			<< " -b  <band>       The band. Default 1.\n"
			<< " -x               Apply a closing (dilation, then erosion) instead.\n"
			<< " -t  <threads>    The number of threads. Default is the number of cores.\n"
			<< " -d  <driver>     The output driver. Default is guessed from the output extension.\n"
			<< " -v               Verbose output.\n";
}

int main(int argc, char** argv) {

	if(argc < 3) {
		usage();
		return 1;
	}

	std::string infile;
	std::string outfile;
	std::string driver;
	int width = 11;
	int height = 11;
	int band = 1;
	int threads = 0;
	bool closing = false;
	int state = 0;

	for(int i = 1; i < argc; ++i) {
		std::string v = argv[i];
		if(v == "-w" && i + 1 < argc) {
			width = atoi(argv[++i]);
		} else if(v == "-h" && i + 1 < argc) {
			height = atoi(argv[++i]);
		} else if(v == "-b" && i + 1 < argc) {
			band = atoi(argv[++i]);
		} else if(v == "-x") {
			closing = true;
		} else if(v == "-t" && i + 1 < argc) {
			threads = atoi(argv[++i]);
		} else if(v == "-d" && i + 1 < argc) {
			driver = argv[++i];
		} else if(v == "-v") {
			rproc::loglevel(R_LOG_DEBUG);
		} else if(state == 0) {
			infile = v;
			++state;
		} else if(state == 1) {
			outfile = v;
			++state;
		}
	}

	if(band < 1) {
		std::cerr << "Illegal band number: " << band << "\n";
		usage();
		return 1;
	}

	if(infile.empty() || outfile.empty()) {
		std::cerr << "Input and output filenames required.\n";
		usage();
		return 1;
	}

	try {

		Stopwatch sw;
		sw.start();

		int count = Band<float>::bands(infile);
		if(band > count) {
			std::cerr << "Illegal band number: " << band << ". The input has " << count << " band(s).\n";
			usage();
			return 1;
		}

		std::shared_ptr<Band<float> > input(new Band<float>(infile, band - 1));
		Band<float> output(input->props());

		ExtremumFilter filter(width, height, threads);
		Window window = closing
				? filter.close(input, output, rproc::getDefaultMonitor())
				: filter.open(input, output, rproc::getDefaultMonitor());

		output.setMetadata(window.metadata());
		output.save(outfile, driver);

		std::cout << (closing ? "Closing" : "Opening") << " with a " << window.width() << "x" << window.height()
				<< " window. Elapsed time: " << sw.time() << "\n";

	} catch(const std::exception& ex) {
		std::cerr << ex.what() << "\n";
		return 1;
	}

	return 0;
}
