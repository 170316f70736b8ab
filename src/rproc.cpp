/*
 * rproc.cpp
 *
 *  Created on: Oct 5, 2026
 *      Author: rproc contributors
 */

#include "rproc/rproc.hpp"

rproc::Monitor defaultMonitor;		///<! A default monitor for when none is provided.

rproc::Monitor* rproc::getDefaultMonitor() {
	return &defaultMonitor;
}

int r__loglevel = R_LOG_WARN;

void rproc::loglevel(int x) {
	r__loglevel = x;
}

int rproc::loglevel() {
	return r__loglevel;
}
