///////////////////////////////////////////////////////////////////////////////
///
///	\file    AnnualAggregation.h
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

#ifndef _ANNUALAGGREGATION_H_
#define _ANNUALAGGREGATION_H_

#include "DensityGrid.h"
#include "IsopycnalBinning.h"
#include "DataArray1D.h"
#include "DataArray2D.h"

#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Annual statistics of the binned fields for one year, indexed
///		(level, cell) without the bottom sentinel level, and bowl
///		diagnostics indexed by cell.
///	</summary>
struct AnnualFields {

	///	<summary>
	///		Allocate all fields and fill with FillValue.
	///	</summary>
	void Allocate(
		size_t sLevels,
		size_t sCells
	);

	///	<summary>
	///		Number of cells.
	///	</summary>
	size_t GetCellCount() const {
		return dDepth.GetSize(1);
	}

	DataArray2D<float> dDepth;
	DataArray2D<float> dThick;
	DataArray2D<float> dTheta;
	DataArray2D<float> dSalt;
	DataArray2D<float> dPersist;

	DataArray1D<float> dBowlDepth;
	DataArray1D<float> dBowlSigma;
	DataArray1D<float> dBowlTheta;
	DataArray1D<float> dBowlSalt;
	DataArray1D<float> dPersistentFraction;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reduces twelve consecutive months of binned fields to annual means,
///		persistence and bowl diagnostics.
///	</summary>
class AnnualAggregator {

public:
	///	<summary>
	///		Constructor.  dBowlThreshold is the persistence (in percent) at
	///		which a level belongs to the bowl.
	///	</summary>
	AnnualAggregator(
		const DensityGrid & grid,
		double dBowlThreshold = 99.0
	);

public:
	///	<summary>
	///		Aggregate the months [12 iYear, 12 iYear + 12) of a chunk.
	///	</summary>
	void Aggregate(
		const BinnedChunk & chunk,
		size_t iYear,
		AnnualFields & annual
	) const;

	///	<summary>
	///		Index of the first level of a cell whose persistence reaches
	///		the bowl threshold, or -1 if no level does.
	///	</summary>
	int FindBowlIndex(
		const DataArray2D<float> & dPersist,
		size_t iCell
	) const;

protected:
	///	<summary>
	///		Masked mean over the twelve months of one (level, cell).
	///	</summary>
	static float MonthlyMean(
		const DataArray3D<float> & data,
		size_t iMonthBegin,
		size_t iLevel,
		size_t iCell
	);

protected:
	///	<summary>
	///		Target density grid.
	///	</summary>
	const DensityGrid & m_grid;

	///	<summary>
	///		Bowl persistence threshold, in percent.
	///	</summary>
	double m_dBowlThreshold;
};

///////////////////////////////////////////////////////////////////////////////

#endif

