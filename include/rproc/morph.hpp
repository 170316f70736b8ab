/*
 * morph.hpp
 *
 *  Created on: Oct 9, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_MORPH_HPP_
#define INCLUDE_RPROC_MORPH_HPP_

#include <vector>
#include <string>
#include <memory>

#include "rproc/rproc.hpp"
#include "rproc/grid.hpp"

namespace rproc {
namespace morph {

using namespace rproc::grid;

/**
 * \brief The comparison direction of a filter pass.
 */
enum class Extremum {
	Min,	///<! Erosion.
	Max		///<! Dilation.
};

/**
 * \brief The shape of a rectangular filter window.
 *
 * Both dimensions are odd and at least 3, so that the window has a center cell.
 */
class R_DLL_EXPORT Window {
private:
	int m_width;
	int m_height;

public:

	/**
	 * \brief Create a window. Dimensions less than 3 are raised to 3, even
	 * dimensions are incremented by one.
	 *
	 * \param width The width in columns.
	 * \param height The height in rows.
	 */
	Window(int width, int height);

	int width() const {
		return m_width;
	}

	int height() const {
		return m_height;
	}

	/**
	 * \brief The horizontal distance from the center to the edge of the window.
	 */
	int midX() const {
		return m_width / 2;
	}

	/**
	 * \brief The vertical distance from the center to the edge of the window.
	 */
	int midY() const {
		return m_height / 2;
	}

	/**
	 * \brief Return KEY=VALUE entries describing the applied window.
	 */
	std::vector<std::string> metadata() const;

};

/**
 * \brief Computes the minimum or maximum of the valid values in a moving window.
 *
 * Each pass reads a complete input band and writes a complete output band,
 * one row per task, with the rows divided among the workers in contiguous
 * blocks. Within a row, the extremum of each column slice of the window is
 * kept in a queue, so moving one column to the right costs one slice.
 *
 * Nodata cells are ignored in the window. A nodata center cell produces nodata.
 * Window cells outside the grid are ignored.
 */
class R_DLL_EXPORT ExtremumFilter {
private:
	Window m_window;
	int m_threads;

public:

	/**
	 * \brief Create a filter.
	 *
	 * \param width The window width. Adjusted to be odd and at least 3.
	 * \param height The window height. Adjusted to be odd and at least 3.
	 * \param threads The number of workers. If less than 1, the hardware parallelism is used.
	 */
	ExtremumFilter(int width, int height, int threads = 0);

	/**
	 * \brief The window that is actually applied.
	 */
	const Window& window() const;

	/**
	 * \brief Compute the filtered values for a single row.
	 *
	 * \param input The input band.
	 * \param row The row index.
	 * \param extremum The comparison direction.
	 * \param[out] out The output row; resized to the number of columns.
	 */
	void filterRow(const GridSource<float>& input, int row, Extremum extremum, std::vector<float>& out) const;

	/**
	 * \brief Run one pass over the input, writing every row of the output.
	 *
	 * \param input The input band.
	 * \param output The output band. Must have the same extent as the input.
	 * \param extremum The comparison direction.
	 * \param monitor If not null, receives progress updates.
	 */
	void pass(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output,
			Extremum extremum, Monitor* monitor = nullptr) const;

	/**
	 * \brief Minimum filter.
	 *
	 * \return The applied window.
	 */
	Window erode(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor = nullptr) const;

	/**
	 * \brief Maximum filter.
	 */
	Window dilate(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor = nullptr) const;

	/**
	 * \brief Erosion followed by dilation. Removes bright features smaller than the window.
	 */
	Window open(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor = nullptr) const;

	/**
	 * \brief Dilation followed by erosion. Removes dark features smaller than the window.
	 */
	Window close(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor = nullptr) const;

};

} // morph
} // rproc

#endif /* INCLUDE_RPROC_MORPH_HPP_ */
