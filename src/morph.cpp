/*
 * morph.cpp
 *
 *  Created on: Oct 9, 2026
 *      Author: rproc contributors
 */

#include <deque>
#include <limits>

#include "rproc/morph.hpp"
#include "rproc/dispatch.hpp"

using namespace rproc::morph;
using namespace rproc::dispatch;

namespace {

	/**
	 * Adjust a window dimension so that it is odd and at least 3.
	 */
	int fixSize(int size, const char* name) {
		int fixed = size;
		if(fixed < 3)
			fixed = 3;
		if(fixed % 2 == 0)
			++fixed;
		if(fixed != size)
			r_warn("Filter " << name << " must be an odd number >= 3. Using " << fixed << " instead of " << size << ".");
		return fixed;
	}

	inline bool better(float v, float e, Extremum extremum) {
		return extremum == Extremum::Min ? v < e : v > e;
	}

	/**
	 * Runs the second pass of a compound operation on the first pass's output.
	 */
	void twoPass(const ExtremumFilter& filter, const std::shared_ptr<const GridSource<float> >& input,
			GridSink<float>& output, Extremum first, Extremum second, rproc::Monitor* monitor) {
		if(!input)
			r_argerr("Input must not be null.");
		GridProps props(input->props());
		std::shared_ptr<Band<float> > tmp(new Band<float>(props));
		if(monitor)
			monitor->init(0, 0.5);
		filter.pass(input, *tmp, first, monitor);
		if(monitor)
			monitor->init(0.5, 1);
		filter.pass(tmp, output, second, monitor);
		if(monitor)
			monitor->init(0, 1);
	}

} // anon

Window::Window(int width, int height) :
	m_width(fixSize(width, "width")),
	m_height(fixSize(height, "height")) {
}

std::vector<std::string> Window::metadata() const {
	std::vector<std::string> meta;
	meta.push_back("filter_size_x=" + std::to_string(m_width));
	meta.push_back("filter_size_y=" + std::to_string(m_height));
	return meta;
}

ExtremumFilter::ExtremumFilter(int width, int height, int threads) :
	m_window(width, height),
	m_threads(threads) {
}

const Window& ExtremumFilter::window() const {
	return m_window;
}

void ExtremumFilter::filterRow(const GridSource<float>& input, int row, Extremum extremum, std::vector<float>& out) const {

	const GridProps& props = input.props();
	int cols = props.cols();
	int rows = props.rows();
	float nodata = (float) props.nodata();
	int mx = m_window.midX();
	int my = m_window.midY();

	// The value of an empty slice; never better than a real value.
	const float none = extremum == Extremum::Min ? std::numeric_limits<float>::infinity() : -std::numeric_limits<float>::infinity();

	// Vertical extent of the window, clipped to the grid.
	int row0 = rproc::max(0, row - my);
	int row1 = rproc::min(rows - 1, row + my);

	auto slice = [&](int col) {
		float e = none;
		if(col < 0 || col >= cols)
			return e;
		float v;
		for(int r = row0; r <= row1; ++r) {
			if((v = input.get(col, r)) != nodata && better(v, e, extremum))
				e = v;
		}
		return e;
	};

	out.assign(cols, nodata);
	std::deque<float> window;

	for(int col = 0; col < cols; ++col) {
		if(col > 0) {
			window.pop_front();
			window.push_back(slice(col + mx));
		} else {
			for(int c = col - mx; c <= col + mx; ++c)
				window.push_back(slice(c));
		}
		if(input.get(col, row) == nodata)
			continue;
		float e = none;
		for(float v : window) {
			if(better(v, e, extremum))
				e = v;
		}
		if(e != none)
			out[col] = e;
	}
}

void ExtremumFilter::pass(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output,
		Extremum extremum, Monitor* monitor) const {

	if(!input)
		r_argerr("Input must not be null.");

	const GridProps& props = input->props();
	if(!props.sameExtent(output.props()))
		r_argerr("The output must have the same extent as the input: " << props.cols() << "x" << props.rows()
				<< " vs. " << output.props().cols() << "x" << output.props().rows() << ".");

	r_debug((extremum == Extremum::Min ? "Erosion" : "Dilation") << " with a " << m_window.width() << "x" << m_window.height() << " window.");

	RowDispatcher<std::vector<float> > dispatcher(props.rows(), m_threads, Partition::Block);
	dispatcher.run(
		[this, &input, extremum](int row, std::vector<float>& data) {
			filterRow(*input, row, extremum, data);
		},
		[&output](int row, std::vector<float>& data) {
			output.setRow(row, data);
		},
		monitor, extremum == Extremum::Min ? "Erosion" : "Dilation"
	);
}

Window ExtremumFilter::erode(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor) const {
	pass(input, output, Extremum::Min, monitor);
	return m_window;
}

Window ExtremumFilter::dilate(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor) const {
	pass(input, output, Extremum::Max, monitor);
	return m_window;
}

Window ExtremumFilter::open(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor) const {
	twoPass(*this, input, output, Extremum::Min, Extremum::Max, monitor);
	return m_window;
}

Window ExtremumFilter::close(const std::shared_ptr<const GridSource<float> >& input, GridSink<float>& output, Monitor* monitor) const {
	twoPass(*this, input, output, Extremum::Max, Extremum::Min, monitor);
	return m_window;
}
