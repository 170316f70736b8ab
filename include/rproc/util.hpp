/*
 * util.hpp
 *
 *  Created on: Oct 5, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_UTIL_HPP_
#define INCLUDE_RPROC_UTIL_HPP_

#include <string>
#include <sstream>
#include <vector>
#include <chrono>
#include <random>
#include <cstdint>

#include "rproc/rproc.hpp"

namespace rproc {
namespace util {

/**
 * The allowable types for a raster.
 */
enum class DataType {
	Float64 = 7,
	Float32 = 6,
	UInt32 = 5,
	UInt16 = 4,
	Byte = 3,
	Int32 = 2,
	Int16 = 1,
	None = 0
};

/**
 * Return true if it's a file and it exists.
 */
R_DLL_EXPORT bool isfile(const std::string& path);

/**
 * Remove the directory or file.
 */
R_DLL_EXPORT bool rem(const std::string& dir);

/**
 * Attempt to return the system temp dir.
 */
R_DLL_EXPORT std::string gettmpdir();

/**
 * Return the processid.
 */
R_DLL_EXPORT int pid();

/**
 * Create a temporary file name in the system temp dir. A random string is added to the end of the prefix.
 */
R_DLL_EXPORT std::string tmpfile(const std::string& prefix);

/**
 * \brief Return the file extension including separator (.) if there is one, else an empty string.
 *
 * \param A file path.
 * \return The file extension.
 */
R_DLL_EXPORT std::string extension(const std::string& path);

/**
 * Return a lower case version of a string.
 *
 * \param str A string.
 */
R_DLL_EXPORT std::string lowercase(const std::string& str);

/**
 * Split a string with the given delimiter
 *
 * \param An iterator to send chunks to.
 * \param str The source string.
 * \param delim The delimiter.
 */
template <class T>
R_DLL_EXPORT void split(T iter, const std::string& str, const std::string& delim = ",") {
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, *(delim.c_str()))) {
        *iter = item;
        ++iter;
    }
}

/**
 * Join the items represented by the iterator using the given delimiter.
 *
 * \param begin The start iterator.
 * \param end The end iterator.
 * \param delim The delimiter.
 * \return The joined string.
 */
template <class Iter>
R_DLL_EXPORT std::string join(Iter begin, Iter end, const std::string& delim = ",") {
	std::stringstream ss;
	if(begin == end)
		return ss.str();
	ss << *begin;
	++begin;
	while(begin != end) {
		ss << delim << *begin;
		++begin;
	}
	return ss.str();
}

/**
 * \brief A source of random numbers.
 *
 * Operations that need randomness take one of these so that
 * a caller can fix the sequence.
 */
class R_DLL_EXPORT RandomSource {
public:

	/**
	 * \brief Return an integer in the range [0, n).
	 *
	 * \param n The upper bound (exclusive). Must be larger than zero.
	 * \return A random index.
	 */
	virtual size_t index(size_t n) = 0;

	/**
	 * \brief Return a real number in the range [min, max].
	 *
	 * If min and max are equal, min is returned.
	 *
	 * \param min The lower bound.
	 * \param max The upper bound.
	 * \return A random value.
	 */
	virtual double uniform(double min, double max) = 0;

	virtual ~RandomSource() {}
};

/**
 * \brief A RandomSource backed by a 64-bit Mersenne Twister.
 */
class R_DLL_EXPORT MTRandom : public RandomSource {
private:
	std::mt19937_64 m_gen;

public:

	/**
	 * \brief Seed from std::random_device.
	 */
	MTRandom();

	/**
	 * \brief Seed with the given value. The sequence is reproducible.
	 *
	 * \param seed The seed.
	 */
	MTRandom(uint64_t seed);

	size_t index(size_t n);

	double uniform(double min, double max);

};

/**
 * \brief Does what it says on the tin: keeps time.
 */
class R_DLL_EXPORT Stopwatch {
private:
	std::chrono::steady_clock::time_point m_begin;

public:
	void reset();
	void start();
	std::string time();

};

} // util
} // rproc

#endif /* INCLUDE_RPROC_UTIL_HPP_ */
