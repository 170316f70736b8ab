/**
 * grid.hpp
 *
 *  Created on: Oct 6, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_GRID_HPP_
#define INCLUDE_RPROC_GRID_HPP_

#include <vector>
#include <iterator>
#include <algorithm>
#include <string>
#include <map>
#include <set>
#include <list>
#include <cmath>
#include <cstring>
#include <type_traits>

#include <gdal_priv.h>
#include <cpl_string.h>

#include "rproc/rproc.hpp"
#include "rproc/util.hpp"

using namespace rproc::util;

namespace rproc {
namespace grid {

	/**
	 * \brief Initialize the raster capabilities. Only registers drivers once.
	 */
	R_DLL_EXPORT void init();

namespace detail {

	/**
	 * \brief Return the GDAL datatype corresponding to the DataType.
	 *
	 * \param type A DataType.
	 * \return The GDAL datatype corresponding to the given DataType.
	 */
	R_DLL_EXPORT GDALDataType dataType2GDT(DataType type);

	/**
	 * For status in the gdal progress monitor.
	 */
	struct gdalprg {
		int p;
		rproc::Monitor* m;
	};

	/**
	 * \brief Status callback for GDAL RasterIO.
	 */
	R_DLL_EXPORT int gdalProgress(double dfComplete, const char *pszMessage, void *pProgressArg);

	/**
	 * \brief Return the DataType corresponding to the template parameter.
	 */
	template <class T>
	DataType typeOf() {
		if(std::is_same<T, double>::value) {
			return DataType::Float64;
		} else if(std::is_same<T, float>::value) {
			return DataType::Float32;
		} else if(std::is_same<T, int>::value) {
			return DataType::Int32;
		} else if(std::is_same<T, unsigned int>::value) {
			return DataType::UInt32;
		} else if(std::is_same<T, short>::value) {
			return DataType::Int16;
		} else if(std::is_same<T, unsigned short>::value) {
			return DataType::UInt16;
		} else if(std::is_same<T, unsigned char>::value) {
			return DataType::Byte;
		} else {
			return DataType::None;
		}
	}

} // detail

using namespace rproc::grid::detail;

/**
 * \brief A class containing the properties of a raster.
 */
class R_DLL_EXPORT GridProps {
private:
	double m_trans[6];			///<! The geotransform properties.
	int m_cols, m_rows;			///<! The number of rows and columns.
	bool m_writable;            ///<! True if the raster is writable
	double m_nodata;			///<! The nodata value.
	bool m_nodataSet;			///<! True if nodata is set.
	DataType m_type;			///<! The data type.
	std::string m_filename;		///<! The grid filename.
	std::string m_projection;	///<! The WKT representation of the projection
	std::string m_driver;		///<! The name of the GDAL driver.
	std::vector<std::string> m_metadata;	///<! KEY=VALUE metadata entries.

public:

	/**
	 * \brief Construct an empty GridProps.
	 */
	GridProps() :
		m_trans{0, 1, 0, 0, 0, -1},
		m_cols(0), m_rows(0),
		m_writable(false),
		m_nodata(0),
		m_nodataSet(false),
		m_type(DataType::None) {
	}

	/**
	 * \brief Return the name of the GDAL driver used by the raster.
	 * Only relevant for file-based rasters.
	 *
	 * \return The name of the GDAL driver.
	 */
	const std::string& driver() const {
		return m_driver;
	}

	/**
	 * \brief Set the name of the GDAL driver used by the raster.
	 *
	 * \param name The name of the driver.
	 */
	void setDriver(const std::string& name) {
		m_driver = name;
	}

	/**
	 * \brief Returns the no data value.
	 *
	 * \return The no data value.
	 */
	double nodata() const {
		return m_nodata;
	}

	/**
	 * \brief Set the no data value.
	 *
	 * \param nodata The no data value.
	 */
	void setNoData(double nodata) {
		m_nodata = nodata;
		m_nodataSet = true;
	}

	/**
	 * \brief Returns true if the no data value has been set.
	 *
	 * \return True if the no data value has been set.
	 */
	bool nodataSet() const {
		return m_nodataSet;
	}

	/**
	 * \brief Return the number of columns.
	 *
	 * \return The number of columns.
	 */
	int cols() const{
		return m_cols;
	}

	/*
	 * \brief Return the number of rows.
	 *
	 * \param The number of rows.
	 */
	int rows() const{
		return m_rows;
	}

	/**
	 * \brief Returns true if the cell is in the raster.
	 *
	 * \param col The column.
	 * \param row The row.
	 * \return True if the cell is in the raster.
	 */
	bool hasCell(int col, int row) const {
		return !(col < 0 || row < 0 || row >= m_rows || col >= m_cols);
	}

	/**
	 * \brief Returns the number of pixels in the raster.
	 *
	 * \return The number of pixels in the raster.
	 */
	size_t size() const {
		return (size_t) m_cols * (size_t) m_rows;
	}

	/**
	 * \brief Returns true if the other properties describe a grid with the same
	 * number of rows and columns.
	 *
	 * \param other Another GridProps.
	 * \return True if the extents match.
	 */
	bool sameExtent(const GridProps& other) const {
		return m_cols == other.m_cols && m_rows == other.m_rows;
	}

	/**
	 * \brief Set the data type of the raster.
	 *
	 * \param type The data type.
	 */
	void setDataType(DataType type) {
		m_type = type;
	}

	/**
	 * \brief Get the data type of the raster.
	 *
	 * \return The data type.
	 */
	DataType dataType() const {
		return m_type;
	}

	/**
	 * \brief Set the size of the raster in columns, rows.
	 *
	 * \param cols The number of columns.
	 * \param rows The number of rows.
	 */
	void setSize(int cols, int rows){
		m_cols = cols;
		m_rows = rows;
	}

	/**
	 * \brief Set the WKT projection. It is carried from input to output, never interpreted.
	 *
	 * \param The projection string.
	 */
	void setProjection(const std::string& proj) {
		m_projection = proj;
	}

	/**
	 * \brief Get the WKT projection.
	 *
	 * \return The WKT projection.
	 */
	const std::string& projection() const {
		return m_projection;
	}

	/**
	 * \brief Set the geo transform properties.
	 *
	 * \param trans The six-element transformation matrix.
	 */
	void setTrans(const double trans[6]) {
		for(int i = 0; i < 6; ++i)
			m_trans[i] = trans[i];
	}

	/**
	 * \brief Gets the geo transform properties by setting them in the given array.
	 *
	 * \param trans The six-element transformation matrix.
	 */
	void trans(double trans[6]) const {
		for(int i = 0; i < 6; ++i)
			trans[i] = m_trans[i];
	}

	/**
	 * \brief Get the horizontal resolution.
	 *
	 * \return The horizontal resolution.
	 */
	double resX() const {
		return m_trans[1];
	}

	/**
	 * \brief Get the vertical resolution.
	 *
	 * \return The vertical resolution.
	 */
	double resY() const {
		return m_trans[5];
	}

	/**
	 * \brief Set the writable state of the raster.
	 *
	 * \param writable True, if the raster should be writable.
	 */
	void setWritable(bool writable) {
		m_writable = writable;
	}

	/**
	 * \brief Get the writable state of the raster.
	 *
	 * \param The writable state of the raster.
	 */
	bool writable() const  {
		return m_writable;
	}

	/**
	 * \brief Set the filename of the raster.
	 *
	 * \param filename The filename of the raster.
	 */
	void setFilename(const std::string& filename) {
		m_filename = filename;
	}

	/**
	 * \brief Return the filename for this raster.
	 *
	 * \return The filename for this raster.
	 */
	const std::string& filename() const {
		return m_filename;
	}

	/**
	 * \brief Set the list of KEY=VALUE metadata entries that are written with the raster.
	 *
	 * \param meta The metadata entries.
	 */
	void setMetadata(const std::vector<std::string>& meta) {
		m_metadata.assign(meta.begin(), meta.end());
	}

	const std::vector<std::string>& metadata() const {
		return m_metadata;
	}

};

/**
 * \brief A class to contain statistics of the raster.
 */
class R_DLL_EXPORT GridStats {
public:
	double min;
	double max;
	double mean;
	double stdDev;
	double variance;
	double sum;
	size_t count;

	GridStats() :
		min(0), max(0),
		mean(0), stdDev(0), variance(0),
		sum(0), count(0) {}
};

/**
 * \brief Read-only access to a single band of values.
 *
 * Implementations must be safe to read from several threads at once.
 */
template <class T>
class R_DLL_EXPORT GridSource {
public:

	/**
	 * \brief Return the properties of the band, including the extent and nodata value.
	 *
	 * \return The properties of the band.
	 */
	virtual const GridProps& props() const = 0;

	/**
	 * \brief Return the value at the given cell. Missing values are
	 * reported as the nodata value.
	 *
	 * \param col The column.
	 * \param row The row.
	 * \return The value.
	 */
	virtual T get(int col, int row) const = 0;

	/**
	 * \brief Compute and return the statistics for the band, ignoring nodata.
	 *
	 * \return A GridStats instance containing computed statistics.
	 */
	virtual GridStats stats() const = 0;

	virtual ~GridSource() {}
};

/**
 * \brief Write access to a band, one complete row at a time.
 */
template <class T>
class R_DLL_EXPORT GridSink {
public:

	/**
	 * \brief Return the properties of the band.
	 *
	 * \return The properties of the band.
	 */
	virtual const GridProps& props() const = 0;

	/**
	 * \brief Write a complete row. The list must contain one value per column.
	 *
	 * \param row The row index.
	 * \param values The row values.
	 */
	virtual void setRow(int row, const std::vector<T>& values) = 0;

	virtual ~GridSink() {}
};

/**
 * \brief A band of a raster, held in memory.
 *
 * A Band can be created anonymously from a GridProps or loaded from any
 * raster GDAL can read, and saved to any GDAL driver that supports creation.
 */
template <class T>
class R_DLL_EXPORT Band : public GridSource<T>, public GridSink<T> {
private:
	GridProps m_props;			///<! Properties of the raster.
	std::vector<T> m_data;		///<! The raster data, row-major.

	/**
	 * \brief Return the GDAL raster data type given the template parameter.
	 *
	 * \return The GDAL raster data type given the template parameter.
	 */
	GDALDataType gdalType() const {
		return dataType2GDT(typeOf<T>());
	}

	inline size_t index(int col, int row) const {
		if(col < 0 || row < 0 || col >= m_props.cols() || row >= m_props.rows())
			r_argerr("Col or row out of bounds: " << col << ", " << row);
		return (size_t) row * (size_t) m_props.cols() + (size_t) col;
	}

public:

	/**
	 * \brief Construct an empty Band.
	 */
	Band() {
		rproc::grid::init();
	}

	/**
	 * \brief Create an anonymous band with the given properties.
	 *
	 * \param props The properties of the band.
	 */
	Band(const GridProps& props) :
		Band() {
		init(props);
	}

	/**
	 * \brief Initialize the band. All cells are set to the nodata value.
	 *
	 * \param props The properties of the band.
	 */
	void init(const GridProps& props) {
		if (props.cols() <= 0 || props.rows() <= 0)
			r_argerr("Columns and rows must be larger than zero.");
		m_props = props;
		m_props.setDataType(typeOf<T>());
		m_props.setWritable(true);
		m_data.assign(m_props.size(), (T) m_props.nodata());
	}

	/**
	 * \brief Load a band from an extant raster.
	 *
	 * \param filename The path to the file.
	 * \param band The zero-based band index.
	 * \param monitor A monitor for load progress. If null, the default is used.
	 */
	Band(const std::string& filename, int band, Monitor* monitor = nullptr) :
		Band() {
		init(filename, band, monitor);
	}

	/**
	 * \brief Load a band from an extant raster.
	 *
	 * If the file has no nodata value for the band, the lowest value representable
	 * by the template type is used.
	 *
	 * \param filename The path to the file.
	 * \param band The zero-based band index.
	 * \param monitor A monitor for load progress. If null, the default is used.
	 */
	void init(const std::string& filename, int band, Monitor* monitor = nullptr) {

		if (filename.empty())
			r_argerr("Filename must be given.");

		if(!monitor)
			monitor = getDefaultMonitor();

		GDALDataset* ds = (GDALDataset *) GDALOpen(filename.c_str(), GA_ReadOnly);
		if (ds == NULL)
			r_runerr("Failed to open raster: " << filename);

		if(band < 0 || band >= ds->GetRasterCount()) {
			int count = ds->GetRasterCount();
			GDALClose(ds);
			r_runerr("Invalid band " << band << "; only " << count << " in raster.");
		}

		GDALRasterBand* bnd = ds->GetRasterBand(band + 1);

		double trans[6];
		if(CE_None != ds->GetGeoTransform(trans)) {
			r_debug("No geotransform in " << filename << ". Using the default.");
			GridProps().trans(trans);
		}

		GridProps props;
		props.setTrans(trans);
		props.setSize(ds->GetRasterXSize(), ds->GetRasterYSize());
		props.setProjection(std::string(ds->GetProjectionRef()));
		props.setFilename(filename);
		GDALDriver* drv = ds->GetDriver();
		if(drv != NULL && drv->GetDescription() != NULL)
			props.setDriver(drv->GetDescription());

		int hasNodata = 0;
		double nodata = bnd->GetNoDataValue(&hasNodata);
		if(hasNodata) {
			props.setNoData(nodata);
		} else {
			r_warn("No nodata value in band " << band << " of " << filename << ". Using " << (double) lowest<T>() << ".");
			props.setNoData((double) lowest<T>());
		}

		init(props);
		m_props.setWritable(false);

		monitor->status(0.0f, "Loading raster from file...");

		GDALRasterIOExtraArg arg;
		INIT_RASTERIO_EXTRA_ARG(arg);
		struct gdalprg prg;
		prg.p = 0;
		prg.m = monitor;
		arg.pfnProgress = gdalProgress;
		arg.pProgressData = &prg;

		int cols = m_props.cols();
		int rows = m_props.rows();
		CPLErr err = bnd->RasterIO(GF_Read, 0, 0, cols, rows,
				m_data.data(), cols, rows, gdalType(), 0, 0, &arg);
		GDALClose(ds);
		if(CE_None != err)
			r_runerr("Failed to read raster: " << filename);
	}

	/**
	 * \brief Return the number of bands in the file.
	 *
	 * \param filename The path to an existing raster.
	 * \return The number of bands.
	 */
	static int bands(const std::string& filename) {
		rproc::grid::init();
		GDALDataset* ds = (GDALDataset *) GDALOpen(filename.c_str(), GA_ReadOnly);
		if (ds == NULL)
			r_runerr("Failed to open raster: " << filename);
		int bands = ds->GetRasterCount();
		GDALClose(ds);
		return bands;
	}

	/**
	 * \brief Return a map containing the raster driver short name and extension.
	 *
	 * \param create If true, only drivers that support dataset creation are listed.
	 * \return A map containing the raster driver short name and extension.
	 */
	static std::map<std::string, std::set<std::string> > extensions(bool create = false) {
		rproc::grid::init();
		std::map<std::string, std::set<std::string> > extensions;
		GDALDriverManager* mgr = GetGDALDriverManager();
		for(int i = 0; i < mgr->GetDriverCount(); ++i) {
			GDALDriver* drv = mgr->GetDriver(i);
			const char* cc = drv->GetMetadataItem(GDAL_DCAP_RASTER);
			if(cc == NULL || std::strncmp(cc, "YES", 3) != 0)
				continue;
			if(create) {
				const char* cr = drv->GetMetadataItem(GDAL_DCAP_CREATE);
				if(cr == NULL || std::strncmp(cr, "YES", 3) != 0)
					continue;
			}
			const char* desc = drv->GetDescription();
			const char* ext = drv->GetMetadataItem(GDAL_DMD_EXTENSIONS);
			if(desc != NULL && ext != NULL) {
				std::list<std::string> lst;
				split(std::back_inserter(lst), std::string(ext), " ");
				for(const std::string& item : lst)
					extensions[desc].insert("." + lowercase(item));
			}
		}
		return extensions;
	}

	/**
	 * \brief Get the name of a driver that can create a file with the given path's extension.
	 *
	 * \param filename The path to a raster.
	 * \return The name of the driver or an empty string.
	 */
	static std::string getDriverForFilename(const std::string& filename) {
		std::string ext = lowercase(extension(filename));
		if(ext.empty())
			return "";
		std::map<std::string, std::set<std::string> > drivers = extensions(true);
		for(const auto& it : drivers) {
			if(it.second.find(ext) != it.second.end())
				return it.first;
		}
		return "";
	}

	/**
	 * \brief Write the band to a new raster file.
	 *
	 * The metadata entries in the properties are written to the dataset.
	 *
	 * \param filename The output file.
	 * \param driver The GDAL driver. If empty, it is guessed from the extension.
	 * \param monitor A monitor for write progress. If null, the default is used.
	 */
	void save(const std::string& filename, const std::string& driver = "", Monitor* monitor = nullptr) {
		if(filename.empty())
			r_argerr("Filename must be given.");
		if(m_data.empty())
			r_runerr("The band has not been initialized.");

		std::string drvName = driver.empty() ? getDriverForFilename(filename) : driver;
		if(drvName.empty())
			r_runerr("Couldn't find driver for: " << filename);

		GDALDriverManager* dm = GetGDALDriverManager();
		GDALDriver* drv = dm->GetDriverByName(drvName.c_str());
		if(!drv)
			r_runerr("Driver not found: " << drvName);

		const char *create = drv->GetMetadataItem(GDAL_DCAP_CREATE);
		if(create == NULL || std::strncmp(create, "YES", 3) != 0)
			r_runerr("The " << drvName << " driver does not support dataset creation. Please specify a different driver.");

		rem(filename);

		int cols = props().cols();
		int rows = props().rows();

		char **opts = NULL;
		if(drvName == "GTiff") {
			opts = CSLSetNameValue(opts, "COMPRESS", "LZW");
			opts = CSLSetNameValue(opts, "BIGTIFF", "IF_NEEDED");
		}
		GDALDataset* ds = drv->Create(filename.c_str(), cols, rows, 1, gdalType(), opts);
		if(opts)
			CSLDestroy(opts);
		if(!ds)
			r_runerr("Failed to create file: " << filename);

		double trans[6];
		props().trans(trans);
		ds->SetGeoTransform(trans);
		if(!props().projection().empty())
			ds->SetProjection(props().projection().c_str());

		if(!props().metadata().empty()) {
			char** meta = NULL;
			for(const std::string& item : props().metadata())
				meta = CSLAddString(meta, item.c_str());
			ds->SetMetadata(meta);
			CSLDestroy(meta);
		}

		GDALRasterIOExtraArg arg;
		INIT_RASTERIO_EXTRA_ARG(arg);
		struct gdalprg prg;
		prg.p = 0;
		prg.m = monitor ? monitor : getDefaultMonitor();
		arg.pfnProgress = gdalProgress;
		arg.pProgressData = &prg;

		r_debug("Writing band to " << filename);
		GDALRasterBand* band = ds->GetRasterBand(1);
		if(props().nodataSet())
			band->SetNoDataValue(props().nodata());
		CPLErr err = band->RasterIO(GF_Write, 0, 0, cols, rows, m_data.data(), cols, rows, gdalType(), 0, 0, &arg);
		GDALClose(ds);
		if(CE_None != err)
			r_runerr("Failed to write raster: " << filename);
	}

	/**
	 * \brief Return the properties of this Band.
	 *
	 * \return The properties of this Band.
	 */
	const GridProps& props() const {
		return m_props;
	}

	/**
	 * \brief Set the metadata entries written with the band on save.
	 *
	 * \param meta A list of KEY=VALUE entries.
	 */
	void setMetadata(const std::vector<std::string>& meta) {
		m_props.setMetadata(meta);
	}

	/**
	 * \brief Return a the value held at the given position in the grid.
	 *
	 * \param col The column.
	 * \param row The row.
	 * \return The value held at the given index in the grid.
	 */
	T get(int col, int row) const {
		return m_data[index(col, row)];
	}

	/**
	 * \brief Set the value held at the given index in the grid.
	 *
	 * \param col The column.
	 * \param row The row.
	 * \param value The value to set.
	 */
	void set(int col, int row, T value) {
		m_data[index(col, row)] = value;
	}

	/**
	 * \brief Copies the values of an entire row into the buffer, which is resized to fit.
	 *
	 * \param row The row index.
	 * \param buf A buffer to store the data.
	 */
	void getRow(int row, std::vector<T>& buf) const {
		size_t idx = index(0, row);
		buf.assign(m_data.begin() + idx, m_data.begin() + idx + m_props.cols());
	}

	/**
	 * \brief Copies the values from the buffer into an entire row.
	 *
	 * \param row The row index.
	 * \param buf A buffer containing one value per column.
	 */
	void setRow(int row, const std::vector<T>& buf) {
		if((int) buf.size() != m_props.cols())
			r_argerr("Row buffer has " << buf.size() << " values; " << m_props.cols() << " required.");
		size_t idx = index(0, row);
		std::copy(buf.begin(), buf.end(), m_data.begin() + idx);
	}

	/**
	 * \brief Fill the entire band with the given value.
	 *
	 * \param value The value to fill the raster with.
	 */
	void fill(T value) {
		std::fill(m_data.begin(), m_data.end(), value);
	}

	/**
	 * \brief Compute and return the statistics for the band.
	 *
	 * \return A GridStats instance containing computed statistics.
	 */
	GridStats stats() const {
		GridStats st;
		// Nodata is compared in the band's type.
		T nodata = (T) m_props.nodata();
		double v, m = 0, s = 0;
		size_t k = 1;
		st.min = maxvalue<double>();
		st.max = lowest<double>();
		// Welford's method for variance.
		for(const T& t : m_data) {
			if (t != nodata) {
				v = (double) t;
				double oldm = m;
				m = m + (v - m) / k;
				s = s + (v - m) * (v - oldm);
				st.sum += v;
				if(v < st.min) st.min = v;
				if(v > st.max) st.max = v;
				++st.count;
				++k;
			}
		}
		if(st.count) {
			st.mean = st.sum / st.count;
			st.variance = s / st.count;
			st.stdDev = std::sqrt(st.variance);
		} else {
			st.min = st.max = m_props.nodata();
		}
		return st;
	}

	/**
	 * \brief Return a pointer to the row-major data.
	 */
	const T* data() const {
		return m_data.data();
	}

};

} // grid
} // rproc

#endif /* INCLUDE_RPROC_GRID_HPP_ */
