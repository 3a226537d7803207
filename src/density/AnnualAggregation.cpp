///////////////////////////////////////////////////////////////////////////////
///
///	\file    AnnualAggregation.cpp
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

#include "AnnualAggregation.h"

#include "Constants.h"
#include "Defines.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Persistence at or below this value is masked.
///	</summary>
static const double MinimumPersistence = 1.0e-6;

///////////////////////////////////////////////////////////////////////////////

void AnnualFields::Allocate(
	size_t sLevels,
	size_t sCells
) {
	dDepth.Allocate(sLevels, sCells);
	dThick.Allocate(sLevels, sCells);
	dTheta.Allocate(sLevels, sCells);
	dSalt.Allocate(sLevels, sCells);
	dPersist.Allocate(sLevels, sCells);

	dBowlDepth.Allocate(sCells);
	dBowlSigma.Allocate(sCells);
	dBowlTheta.Allocate(sCells);
	dBowlSalt.Allocate(sCells);
	dPersistentFraction.Allocate(sCells);

	dDepth.Fill(FillValue);
	dThick.Fill(FillValue);
	dTheta.Fill(FillValue);
	dSalt.Fill(FillValue);
	dPersist.Fill(FillValue);

	dBowlDepth.Fill(FillValue);
	dBowlSigma.Fill(FillValue);
	dBowlTheta.Fill(FillValue);
	dBowlSalt.Fill(FillValue);
	dPersistentFraction.Fill(FillValue);
}

///////////////////////////////////////////////////////////////////////////////

AnnualAggregator::AnnualAggregator(
	const DensityGrid & grid,
	double dBowlThreshold
) :
	m_grid(grid),
	m_dBowlThreshold(dBowlThreshold)
{ }

///////////////////////////////////////////////////////////////////////////////

float AnnualAggregator::MonthlyMean(
	const DataArray3D<float> & data,
	size_t iMonthBegin,
	size_t iLevel,
	size_t iCell
) {
	double dSum = 0.0;
	int nValid = 0;
	for (int m = 0; m < MonthsPerYear; m++) {
		float dValue = data(iMonthBegin + m, iLevel, iCell);
		if (!IsFillValue(dValue)) {
			dSum += dValue;
			nValid++;
		}
	}
	if (nValid == 0) {
		return FillValue;
	}
	return static_cast<float>(dSum / static_cast<double>(nValid));
}

///////////////////////////////////////////////////////////////////////////////

int AnnualAggregator::FindBowlIndex(
	const DataArray2D<float> & dPersist,
	size_t iCell
) const {
	for (size_t k = 0; k < dPersist.GetSize(0); k++) {
		float dValue = dPersist(k, iCell);
		if (!IsFillValue(dValue) && (dValue >= m_dBowlThreshold)) {
			return static_cast<int>(k);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

void AnnualAggregator::Aggregate(
	const BinnedChunk & chunk,
	size_t iYear,
	AnnualFields & annual
) const {
	const size_t nLevels = m_grid.size();
	const size_t nCells = chunk.dDepth.GetSize(2);
	const size_t iMonthBegin = iYear * MonthsPerYear;

	if (iMonthBegin + MonthsPerYear > chunk.dDepth.GetSize(0)) {
		_EXCEPTION2("Year %lu extends beyond chunk of %lu months",
			iYear, chunk.dDepth.GetSize(0));
	}
	if (chunk.dDepth.GetSize(1) != nLevels + 1) {
		_EXCEPTION2("Chunk has %lu levels, expected %lu",
			chunk.dDepth.GetSize(1), nLevels + 1);
	}

	annual.Allocate(nLevels, nCells);

	for (size_t s = 0; s < nLevels; s++) {
	for (size_t i = 0; i < nCells; i++) {
		annual.dDepth(s,i) = MonthlyMean(chunk.dDepth, iMonthBegin, s, i);
		annual.dThick(s,i) = MonthlyMean(chunk.dThick, iMonthBegin, s, i);
		annual.dTheta(s,i) = MonthlyMean(chunk.dTheta, iMonthBegin, s, i);
		annual.dSalt(s,i)  = MonthlyMean(chunk.dSalt,  iMonthBegin, s, i);

		// Percentage of months with a valid thickness
		int nOccupied = 0;
		for (int m = 0; m < MonthsPerYear; m++) {
			if (!IsFillValue(chunk.dThick(iMonthBegin + m, s, i))) {
				nOccupied++;
			}
		}
		double dPersist =
			100.0 * static_cast<double>(nOccupied)
			/ static_cast<double>(MonthsPerYear);

		if (dPersist > MinimumPersistence) {
			annual.dPersist(s,i) = static_cast<float>(dPersist);
		}
	}
	}

	// Bowl diagnostics and persistent fraction of the column
	for (size_t i = 0; i < nCells; i++) {
		int iBowl = FindBowlIndex(annual.dPersist, i);
		if (iBowl >= 0) {
			annual.dBowlDepth(i) = annual.dDepth(iBowl, i);
			annual.dBowlTheta(i) = annual.dTheta(iBowl, i);
			annual.dBowlSalt(i)  = annual.dSalt(iBowl, i);
			annual.dBowlSigma(i) = static_cast<float>(m_grid[iBowl]);
		}

		double dWeighted = 0.0;
		double dThickSum = 0.0;
		for (size_t s = 0; s < nLevels; s++) {
			float dThick = annual.dThick(s,i);
			float dPersist = annual.dPersist(s,i);
			if (IsFillValue(dThick) || IsFillValue(dPersist)) {
				continue;
			}
			dWeighted += dPersist * dThick;
			dThickSum += dThick;
		}
		if (dThickSum > 0.0) {
			annual.dPersistentFraction(i) =
				static_cast<float>(dWeighted / dThickSum);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

