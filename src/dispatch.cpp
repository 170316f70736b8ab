/*
 * dispatch.cpp
 *
 *  Created on: Oct 8, 2026
 *      Author: rproc contributors
 */

#include <thread>

#include "rproc/dispatch.hpp"

using namespace rproc::dispatch;

int rproc::dispatch::defaultThreads() {
	int n = (int) std::thread::hardware_concurrency();
	return n > 0 ? n : 1;
}

std::vector<int> rproc::dispatch::partitionRows(int rows, int threads, int thread, Partition partition) {
	if(threads < 1)
		r_argerr("There must be at least one thread.");
	if(thread < 0 || thread >= threads)
		r_argerr("Invalid thread index: " << thread);
	std::vector<int> out;
	switch(partition) {
	case Partition::Striped:
		for(int r = thread; r < rows; r += threads)
			out.push_back(r);
		break;
	case Partition::Block:
	{
		int block = (rows + threads - 1) / threads;
		int start = thread * block;
		int end = rproc::min(start + block, rows);
		for(int r = start; r < end; ++r)
			out.push_back(r);
		break;
	}
	default:
		r_argerr("Unknown partition: " << (int) partition);
	}
	return out;
}
