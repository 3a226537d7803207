///////////////////////////////////////////////////////////////////////////////
///
///	\file    BasinMask.h
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2026
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _BASINMASK_H_
#define _BASINMASK_H_

#include "DataArray1D.h"
#include "DataArray2D.h"
#include "DataArray3D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Ocean basins of the zonal outputs.  Global covers every valid
///		target grid point; the others match basin mask codes 1, 2 and 3.
///	</summary>
enum BasinIndex {
	BasinGlobal = 0,
	BasinAtlantic = 1,
	BasinPacific = 2,
	BasinIndian = 3,
	BasinCount = 4
};

///	<summary>
///		Short name of a basin.
///	</summary>
const char * BasinName(int iBasin);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Basin membership of each target grid cell.
///	</summary>
class BasinMask {

public:
	///	<summary>
	///		Initialize from basin codes on a (lat, lon) target grid.  Missing
	///		codes mark land.
	///	</summary>
	void Initialize(
		const float * dCodes,
		size_t sLatitudes,
		size_t sLongitudes
	);

	///	<summary>
	///		Every cell is ocean and belongs only to the global basin.
	///	</summary>
	void InitializeGlobal(
		size_t sLatitudes,
		size_t sLongitudes
	);

	///	<summary>
	///		True if the cell belongs to the given basin.
	///	</summary>
	bool Contains(
		int iBasin,
		size_t iCell
	) const {
		if (iBasin == BasinGlobal) {
			return (m_nCode(iCell) >= 0);
		}
		return (m_nCode(iCell) == iBasin);
	}

	///	<summary>
	///		Number of latitudes.
	///	</summary>
	size_t GetLatitudes() const {
		return m_sLatitudes;
	}

	///	<summary>
	///		Number of longitudes.
	///	</summary>
	size_t GetLongitudes() const {
		return m_sLongitudes;
	}

	///	<summary>
	///		Number of cells.
	///	</summary>
	size_t GetCellCount() const {
		return m_sLatitudes * m_sLongitudes;
	}

protected:
	///	<summary>
	///		Grid shape.
	///	</summary>
	size_t m_sLatitudes;
	size_t m_sLongitudes;

	///	<summary>
	///		Basin code per cell, -1 for land.
	///	</summary>
	DataArray1D<int> m_nCode;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Area (m^2) of the cells of a regular grid given 1-D cell-centre
///		longitudes and latitudes in degrees, indexed (lat, lon).
///	</summary>
void ComputeCellArea(
	const std::vector<double> & vecLon,
	const std::vector<double> & vecLat,
	DataArray2D<double> & dArea
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Zonal (longitude) means of target grid fields, per basin.
///	</summary>
class ZonalAverager {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ZonalAverager(
		const BasinMask & mask,
		const DataArray2D<double> & dArea
	);

public:
	///	<summary>
	///		Masked mean over longitude of a (lat, lon) field within a
	///		basin, written to dZonal[lat].
	///	</summary>
	void ZonalMean(
		const float * dField,
		int iBasin,
		float * dZonal
	) const;

	///	<summary>
	///		Zonal mean of each level of a (level, cell) field for every
	///		basin, written as (basin, level, lat).
	///	</summary>
	void ZonalMean(
		const DataArray2D<float> & dField,
		DataArray3D<float> & dZonal
	) const;

	///	<summary>
	///		Zonal mean of a cell field for every basin, written as
	///		(basin, lat).
	///	</summary>
	void ZonalMean(
		const DataArray1D<float> & dField,
		DataArray2D<float> & dZonal
	) const;

	///	<summary>
	///		Total area of each latitude row of a basin.
	///	</summary>
	double GetZonalArea(
		int iBasin,
		size_t iLat
	) const {
		return m_dZonalArea(iBasin, iLat);
	}

	///	<summary>
	///		Convert zonal mean thickness (basin, level, lat) into isopycnal
	///		volume in units of 1e12 m^3.
	///	</summary>
	void ZonalVolume(
		const DataArray3D<float> & dZonalThick,
		DataArray3D<float> & dZonalVolume
	) const;

protected:
	///	<summary>
	///		Basin mask.
	///	</summary>
	const BasinMask & m_mask;

	///	<summary>
	///		Sum of cell areas over each latitude row of each basin.
	///	</summary>
	DataArray2D<double> m_dZonalArea;
};

///////////////////////////////////////////////////////////////////////////////

#endif

