/*
 * dispatch_test.cpp
 *
 *  Created on: Oct 14, 2026
 *      Author: rproc contributors
 */

#include <vector>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "rproc/dispatch.hpp"

using namespace rproc::dispatch;

TEST(PartitionTest, EveryRowExactlyOnce) {
	for(Partition part : {Partition::Striped, Partition::Block}) {
		for(int rows : {0, 1, 7, 100}) {
			for(int threads : {1, 3, 8, 150}) {
				std::vector<int> seen(rows, 0);
				for(int t = 0; t < threads; ++t) {
					for(int row : partitionRows(rows, threads, t, part))
						++seen[row];
				}
				for(int r = 0; r < rows; ++r)
					EXPECT_EQ(1, seen[r]) << "row " << r << ", " << rows << " rows, " << threads << " threads";
			}
		}
	}
}

TEST(PartitionTest, BlockRanges) {
	EXPECT_EQ(std::vector<int>({0, 1, 2, 3}), partitionRows(10, 3, 0, Partition::Block));
	EXPECT_EQ(std::vector<int>({4, 5, 6, 7}), partitionRows(10, 3, 1, Partition::Block));
	EXPECT_EQ(std::vector<int>({8, 9}), partitionRows(10, 3, 2, Partition::Block));
}

TEST(PartitionTest, StripedRows) {
	EXPECT_EQ(std::vector<int>({1, 4, 7}), partitionRows(9, 3, 1, Partition::Striped));
}

TEST(PartitionTest, InvalidArguments) {
	EXPECT_THROW(partitionRows(10, 0, 0, Partition::Block), std::invalid_argument);
	EXPECT_THROW(partitionRows(10, 3, 3, Partition::Striped), std::invalid_argument);
	EXPECT_THROW(partitionRows(10, 3, -1, Partition::Striped), std::invalid_argument);
}

TEST(RowDispatcherTest, ClampsThreads) {
	EXPECT_EQ(3, RowDispatcher<int>(3, 8).threads());
	EXPECT_EQ(1, RowDispatcher<int>(0, 8).threads());
	EXPECT_GE(RowDispatcher<int>(1000).threads(), 1);
	EXPECT_THROW(RowDispatcher<int>(-1), std::invalid_argument);
}

TEST(RowDispatcherTest, ComputesEveryRow) {
	for(Partition part : {Partition::Striped, Partition::Block}) {
		int rows = 53;
		std::vector<int> values(rows, -1);
		std::vector<int> counts(rows, 0);
		RowDispatcher<int> dispatcher(rows, 4, part);
		dispatcher.run(
			[](int row, int& payload) {
				payload = row * 2;
			},
			[&](int row, int& payload) {
				values[row] = payload;
				++counts[row];
			}
		);
		for(int r = 0; r < rows; ++r) {
			EXPECT_EQ(r * 2, values[r]);
			EXPECT_EQ(1, counts[r]);
		}
	}
}

TEST(RowDispatcherTest, ZeroRows) {
	int calls = 0;
	RowDispatcher<int> dispatcher(0, 4);
	dispatcher.run(
		[&](int, int&) { ++calls; },
		[&](int, int&) { ++calls; }
	);
	EXPECT_EQ(0, calls);
}

TEST(RowDispatcherTest, WorkerExceptionPropagates) {
	RowDispatcher<int> dispatcher(40, 4, Partition::Striped);
	try {
		dispatcher.run(
			[](int row, int& payload) {
				if(row == 13)
					throw std::out_of_range("bad row 13");
				payload = row;
			},
			[](int, int&) {}
		);
		FAIL() << "No exception was thrown.";
	} catch(const std::out_of_range& ex) {
		EXPECT_EQ(std::string("bad row 13"), ex.what());
	}
}

TEST(RowDispatcherTest, ConsumerExceptionPropagates) {
	RowDispatcher<int> dispatcher(20, 3, Partition::Block);
	EXPECT_THROW(
		dispatcher.run(
			[](int row, int& payload) { payload = row; },
			[](int row, int&) {
				if(row == 5)
					throw std::runtime_error("write failed");
			}
		),
		std::runtime_error
	);
}

TEST(RowDispatcherTest, ReportsProgress) {

	class CountingMonitor : public rproc::Monitor {
	public:
		int calls = 0;
		float last = 0;
		void status(float status, const std::string&) {
			++calls;
			last = status;
		}
	} monitor;

	RowDispatcher<int> dispatcher(10, 2);
	dispatcher.run(
		[](int row, int& payload) { payload = row; },
		[](int, int&) {},
		&monitor, "Testing"
	);
	EXPECT_EQ(10, monitor.calls);
	EXPECT_FLOAT_EQ(1.0f, monitor.last);
}
