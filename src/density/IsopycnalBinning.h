///////////////////////////////////////////////////////////////////////////////
///
///	\file    IsopycnalBinning.h
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

#ifndef _ISOPYCNALBINNING_H_
#define _ISOPYCNALBINNING_H_

#include "DensityGrid.h"
#include "Constants.h"
#include "DataArray3D.h"

#include <vector>
#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parameters of the isopycnal binning engine.
///	</summary>
struct BinningParameters {

	BinningParameters() :
		dStratificationThreshold(0.2),
		dMaxThickness(MaxLayerThickness)
	{ }

	///	<summary>
	///		Columns whose bottom minus surface density is below this value
	///		are treated as unstratified.  Normally the fine grid spacing.
	///	</summary>
	double dStratificationThreshold;

	///	<summary>
	///		Isopycnal thickness at or above this value is masked.
	///	</summary>
	double dMaxThickness;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Depth levels of the source grid and the lower bound of each depth
///		cell.
///	</summary>
struct VerticalAxis {

	///	<summary>
	///		Throw an Exception unless levels are strictly increasing and
	///		there is one lower bound per level.
	///	</summary>
	void Validate() const;

	///	<summary>
	///		Number of depth levels.
	///	</summary>
	size_t size() const {
		return vecDepth.size();
	}

	std::vector<double> vecDepth;
	std::vector<double> vecDepthBottom;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		One horizontal grid point's vertical profile at one time step.
///	</summary>
class GridColumn {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	explicit GridColumn(
		const VerticalAxis & axis
	);

	///	<summary>
	///		Load temperature and salinity from a (level, cell) slab with the
	///		given number of cells, then compute density.
	///	</summary>
	void Load(
		const float * dTheta,
		const float * dSalt,
		size_t sCell,
		size_t sCellCount
	);

	///	<summary>
	///		Compute the density profile from temperature and salinity.
	///	</summary>
	void ComputeSigma();

	///	<summary>
	///		Index of the deepest valid cell of the contiguous valid range
	///		starting at the surface, or -1 if the surface cell is missing.
	///	</summary>
	int GetBottomIndex() const;

	///	<summary>
	///		Vertical axis.
	///	</summary>
	const VerticalAxis & GetAxis() const {
		return m_axis;
	}

public:
	///	<summary>
	///		Potential temperature, salinity and sigma on each level.
	///	</summary>
	std::vector<double> vecTheta;
	std::vector<double> vecSalt;
	std::vector<double> vecSigma;

protected:
	///	<summary>
	///		Vertical axis.
	///	</summary>
	const VerticalAxis & m_axis;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A GridColumn remapped onto a DensityGrid.  Each profile has one
///		entry per density level plus the bottom sentinel level.
///	</summary>
struct BinnedColumn {

	///	<summary>
	///		Resize to the given number of density levels and fill with
	///		FillValue.
	///	</summary>
	void Reset(size_t sLevels);

	std::vector<double> vecDepth;
	std::vector<double> vecThick;
	std::vector<double> vecTheta;
	std::vector<double> vecSalt;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Monthly binned fields of one time chunk, indexed (time, level, cell)
///		with one more level than the density grid.
///	</summary>
struct BinnedChunk {

	///	<summary>
	///		Allocate and fill with FillValue.
	///	</summary>
	void Allocate(
		size_t sTimes,
		size_t sLevels,
		size_t sCells
	);

	DataArray3D<float> dDepth;
	DataArray3D<float> dThick;
	DataArray3D<float> dTheta;
	DataArray3D<float> dSalt;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Remaps vertical profiles of temperature and salinity from depth
///		coordinates onto a fixed grid of target densities.
///	</summary>
class IsopycnalBinner {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	IsopycnalBinner(
		const DensityGrid & grid,
		const BinningParameters & param
	);

public:
	///	<summary>
	///		Bin a single column.
	///	</summary>
	///	<returns>
	///		false if the column has no valid surface cell, in which case
	///		every output is FillValue.
	///	</returns>
	bool BinColumn(
		const GridColumn & column,
		BinnedColumn & binned
	) const;

	///	<summary>
	///		Bin every column of a time chunk of (time, level, cell) fields.
	///	</summary>
	void BinChunk(
		const VerticalAxis & axis,
		const DataArray3D<float> & dTheta,
		const DataArray3D<float> & dSalt,
		BinnedChunk & chunk
	) const;

	///	<summary>
	///		Density grid.
	///	</summary>
	const DensityGrid & GetGrid() const {
		return m_grid;
	}

protected:
	///	<summary>
	///		Compute isopycnal thickness from depth and apply the rejection
	///		rules.
	///	</summary>
	void ComputeThickness(
		BinnedColumn & binned
	) const;

protected:
	///	<summary>
	///		Target density grid.
	///	</summary>
	const DensityGrid & m_grid;

	///	<summary>
	///		Binning parameters.
	///	</summary>
	BinningParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Number of months to process per chunk for a horizontal grid of the
///		given size, never more than the number of requested months.
///	</summary>
int ComputeChunkMonths(
	size_t sGridSize,
	int nRequestedMonths
);

///////////////////////////////////////////////////////////////////////////////

#endif

