/*
 * grid.cpp
 *
 *  Created on: Oct 13, 2026
 *      Author: rproc contributors
 */

#include <string>
#include <mutex>

#include "rproc/grid.hpp"

using namespace rproc::grid;

namespace {

	std::once_flag __gdalInit;

} // anon

void rproc::grid::init() {
	std::call_once(__gdalInit, []() {
		GDALAllRegister();
	});
}

GDALDataType rproc::grid::detail::dataType2GDT(DataType type) {
	switch(type) {
	case DataType::Byte:  	return GDT_Byte;
	case DataType::UInt16: 	return GDT_UInt16;
	case DataType::UInt32:	return GDT_UInt32;
	case DataType::Int16:	return GDT_Int16;
	case DataType::Int32:	return GDT_Int32;
	case DataType::Float64:	return GDT_Float64;
	case DataType::Float32:	return GDT_Float32;
	case DataType::None:
	default:
		break;
	}
	return GDT_Unknown;
}

int rproc::grid::detail::gdalProgress(double dfComplete, const char *pszMessage, void *pProgressArg) {
	gdalprg* prg = static_cast<gdalprg*>(pProgressArg);
	int p = (int) (dfComplete * 100);
	if(p != prg->p) {
		prg->p = p;
		prg->m->status((float) dfComplete, pszMessage ? std::string(pszMessage) : "");
	}
	return 1;
}
