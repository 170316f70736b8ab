/*
 * util.cpp
 *
 *  Created on: Oct 5, 2026
 *      Author: rproc contributors
 */

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>
#endif

#include <algorithm>
#include <iterator>
#include <filesystem>
#include <iomanip>
#include <random>

#include "rproc/util.hpp"

namespace fs = std::filesystem;

using namespace rproc::util;

namespace {

	const std::string defaultChars = "abcdefghijklmnaoqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ1234567890";

	std::string randomString(size_t len = 15) {
		std::mt19937_64 gen { std::random_device()() };
	    std::uniform_int_distribution<size_t> dist { 0, defaultChars.length()-1 };
	    std::string ret;
	    std::generate_n(std::back_inserter(ret), len, [&] {
	    	return defaultChars[dist(gen)];
	    });
	    return ret;
	}

} // anon

bool rproc::util::isfile(const std::string& path) {
	return fs::is_regular_file(path);
}

bool rproc::util::rem(const std::string& dir) {
	std::error_code ec;
	fs::remove_all(fs::path(dir), ec);
	if(ec) {
		r_warn("Failed to remove " << dir << ": " << ec.message());
		return false;
	}
	return true;
}

std::string rproc::util::extension(const std::string& path) {
	size_t pos = path.find_last_of('.');
	if(pos < std::string::npos)
		return path.substr(pos, std::string::npos);
	return "";
}

std::string rproc::util::gettmpdir() {
	return fs::temp_directory_path().string();
}

int rproc::util::pid() {
#ifdef _WIN32
	return GetCurrentProcessId();
#else
	return getpid();
#endif
}

std::string rproc::util::tmpfile(const std::string& prefix) {
	fs::path tdir(gettmpdir());
	int tries = 16;
	while(--tries) {
		std::stringstream ss;
		ss << prefix << '_' << pid() << '_' << randomString();
		std::string path = (tdir / ss.str()).string();
		if(!isfile(path))
			return path;
	}
	r_runerr("Failed to create non-extant filename.");
}

std::string rproc::util::lowercase(const std::string& str) {
	std::string out;
	std::transform(str.begin(), str.end(), std::back_inserter(out), ::tolower);
	return out;
}

MTRandom::MTRandom() :
	m_gen(std::random_device()()) {
}

MTRandom::MTRandom(uint64_t seed) :
	m_gen(seed) {
}

size_t MTRandom::index(size_t n) {
	if(n == 0)
		r_argerr("The index range must not be empty.");
	std::uniform_int_distribution<size_t> dist(0, n - 1);
	return dist(m_gen);
}

double MTRandom::uniform(double min, double max) {
	if(min == max)
		return min;
	if(max < min)
		std::swap(min, max);
	std::uniform_real_distribution<double> dist(min, max);
	return dist(m_gen);
}

void Stopwatch::start() {
	m_begin = std::chrono::steady_clock::now();
}

void Stopwatch::reset() {
	start();
}

std::string Stopwatch::time() {
	int t = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now()- m_begin).count();
	std::stringstream ss;
	ss << std::setfill('0');
	ss << std::setw(2) << (t / 3600) << ':';
	ss << std::setw(2) << ((t / 60) % 60) << ':';
	ss << std::setw(2) << (t % 60);
	return ss.str();
}
