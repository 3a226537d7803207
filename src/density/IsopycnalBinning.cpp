///////////////////////////////////////////////////////////////////////////////
///
///	\file    IsopycnalBinning.cpp
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

#include "IsopycnalBinning.h"

#include "EquationOfState.h"
#include "Defines.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

void VerticalAxis::Validate() const {
	if (vecDepth.size() == 0) {
		_EXCEPTIONT("Vertical axis has no levels");
	}
	if (vecDepthBottom.size() != vecDepth.size()) {
		_EXCEPTION2("Depth bounds (%lu) do not match depth levels (%lu)",
			vecDepthBottom.size(), vecDepth.size());
	}
	for (size_t k = 1; k < vecDepth.size(); k++) {
		if (!(vecDepth[k] > vecDepth[k-1])) {
			_EXCEPTION1("Depth levels not strictly increasing at level %lu", k);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////
// GridColumn
///////////////////////////////////////////////////////////////////////////////

GridColumn::GridColumn(
	const VerticalAxis & axis
) :
	vecTheta(axis.size(), FillValue),
	vecSalt(axis.size(), FillValue),
	vecSigma(axis.size(), FillValue),
	m_axis(axis)
{ }

///////////////////////////////////////////////////////////////////////////////

void GridColumn::Load(
	const float * dTheta,
	const float * dSalt,
	size_t sCell,
	size_t sCellCount
) {
	for (size_t k = 0; k < m_axis.size(); k++) {
		vecTheta[k] = dTheta[k * sCellCount + sCell];
		vecSalt[k] = dSalt[k * sCellCount + sCell];
	}
	ComputeSigma();
}

///////////////////////////////////////////////////////////////////////////////

void GridColumn::ComputeSigma() {
	vecSigma.resize(vecTheta.size());
	for (size_t k = 0; k < vecTheta.size(); k++) {
		if (IsFillValue(vecTheta[k]) || IsFillValue(vecSalt[k]) || (vecSalt[k] < 0.0)) {
			vecSigma[k] = FillValue;
		} else {
			vecSigma[k] =
				NeutralDensity(vecTheta[k], vecSalt[k]) - SigmaReferenceDensity;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

int GridColumn::GetBottomIndex() const {
	for (size_t k = 0; k < vecSigma.size(); k++) {
		if (IsFillValue(vecSigma[k])) {
			return static_cast<int>(k) - 1;
		}
	}
	return static_cast<int>(vecSigma.size()) - 1;
}

///////////////////////////////////////////////////////////////////////////////
// BinnedColumn
///////////////////////////////////////////////////////////////////////////////

void BinnedColumn::Reset(size_t sLevels) {
	vecDepth.assign(sLevels + 1, FillValue);
	vecThick.assign(sLevels + 1, FillValue);
	vecTheta.assign(sLevels + 1, FillValue);
	vecSalt.assign(sLevels + 1, FillValue);
}

///////////////////////////////////////////////////////////////////////////////
// BinnedChunk
///////////////////////////////////////////////////////////////////////////////

void BinnedChunk::Allocate(
	size_t sTimes,
	size_t sLevels,
	size_t sCells
) {
	dDepth.Allocate(sTimes, sLevels, sCells);
	dThick.Allocate(sTimes, sLevels, sCells);
	dTheta.Allocate(sTimes, sLevels, sCells);
	dSalt.Allocate(sTimes, sLevels, sCells);

	dDepth.Fill(FillValue);
	dThick.Fill(FillValue);
	dTheta.Fill(FillValue);
	dSalt.Fill(FillValue);
}

///////////////////////////////////////////////////////////////////////////////
// IsopycnalBinner
///////////////////////////////////////////////////////////////////////////////

IsopycnalBinner::IsopycnalBinner(
	const DensityGrid & grid,
	const BinningParameters & param
) :
	m_grid(grid),
	m_param(param)
{ }

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Linear interpolation that is missing when either end is missing.
///	</summary>
static double InterpolateValid(
	double d0,
	double d1,
	double dAlpha
) {
	if (IsFillValue(d0) || IsFillValue(d1)) {
		return FillValue;
	}
	return (d0 + dAlpha * (d1 - d0));
}

///////////////////////////////////////////////////////////////////////////////

bool IsopycnalBinner::BinColumn(
	const GridColumn & column,
	BinnedColumn & binned
) const {
	const size_t nLevels = m_grid.size();
	const VerticalAxis & axis = column.GetAxis();

	binned.Reset(nLevels);

	int iBottom = column.GetBottomIndex();
	if (iBottom < 0) {
		return false;
	}

	const std::vector<double> & vecSigma = column.vecSigma;

	// Bottom sentinel level
	double dBottomDepth = axis.vecDepthBottom[iBottom];
	binned.vecDepth[nLevels] = dBottomDepth;
	binned.vecTheta[nLevels] = column.vecTheta[iBottom];
	binned.vecSalt[nLevels] = column.vecSalt[iBottom];

	// Range of the monotonic part of the profile
	int iMin = 0;
	int iMax = 0;
	for (int k = 1; k <= iBottom; k++) {
		if (vecSigma[k] < vecSigma[iMin]) {
			iMin = k;
		}
		if (vecSigma[k] > vecSigma[iMax]) {
			iMax = k;
		}
	}
	if (iMin > iMax) {
		iMin = iMax;
	}

	// Unstratified columns use the whole profile
	if (vecSigma[iBottom] - vecSigma[0] < m_param.dStratificationThreshold) {
		iMin = 0;
		iMax = iBottom;
	}

	const double dSigmaMin = vecSigma[iMin];
	const double dSigmaMax = vecSigma[iMax];

	// Strictly increasing sub-profile between iMin and iMax
	std::vector<int> vecMonotone;
	vecMonotone.push_back(iMin);
	for (int k = iMin + 1; k <= iMax; k++) {
		if (vecSigma[k] > vecSigma[vecMonotone.back()]) {
			vecMonotone.push_back(k);
		}
	}

	for (size_t s = 0; s < nLevels; s++) {
		const double dTarget = m_grid[s];

		if (dTarget < dSigmaMin) {
			binned.vecDepth[s] = 0.0;
			continue;
		}
		if (dTarget > dSigmaMax) {
			binned.vecDepth[s] = dBottomDepth;
			continue;
		}

		// Locate the bracketing pair of the sub-profile
		size_t j = 0;
		while ((j + 1 < vecMonotone.size()) &&
		       (vecSigma[vecMonotone[j+1]] < dTarget)
		) {
			j++;
		}

		int k0 = vecMonotone[j];
		if (j + 1 == vecMonotone.size()) {
			if (dTarget > vecSigma[k0]) {
				binned.vecDepth[s] = dBottomDepth;
				continue;
			}
			binned.vecDepth[s] = axis.vecDepth[k0];
			binned.vecTheta[s] = column.vecTheta[k0];
			binned.vecSalt[s] = column.vecSalt[k0];
			continue;
		}

		int k1 = vecMonotone[j+1];
		double dAlpha =
			(dTarget - vecSigma[k0]) / (vecSigma[k1] - vecSigma[k0]);

		binned.vecDepth[s] =
			axis.vecDepth[k0] + dAlpha * (axis.vecDepth[k1] - axis.vecDepth[k0]);
		binned.vecTheta[s] =
			InterpolateValid(column.vecTheta[k0], column.vecTheta[k1], dAlpha);
		binned.vecSalt[s] =
			InterpolateValid(column.vecSalt[k0], column.vecSalt[k1], dAlpha);
	}

	ComputeThickness(binned);

	return true;
}

///////////////////////////////////////////////////////////////////////////////

void IsopycnalBinner::ComputeThickness(
	BinnedColumn & binned
) const {
	const size_t nLevels = m_grid.size();

	for (size_t s = 0; s < nLevels; s++) {
		binned.vecThick[s] = FillValue;

		if (IsFillValue(binned.vecDepth[s]) || IsFillValue(binned.vecTheta[s])) {
			continue;
		}

		double dThick = binned.vecDepth[s];
		if (s != 0) {
			if (IsFillValue(binned.vecDepth[s-1])) {
				continue;
			}
			dThick -= binned.vecDepth[s-1];
		}

		if ((dThick <= 0.0) || (dThick >= m_param.dMaxThickness)) {
			continue;
		}

		binned.vecThick[s] = dThick;
	}

	binned.vecThick[nLevels] = FillValue;
}

///////////////////////////////////////////////////////////////////////////////

void IsopycnalBinner::BinChunk(
	const VerticalAxis & axis,
	const DataArray3D<float> & dTheta,
	const DataArray3D<float> & dSalt,
	BinnedChunk & chunk
) const {
	const size_t nTimes = dTheta.GetSize(0);
	const size_t nDepth = dTheta.GetSize(1);
	const size_t nCells = dTheta.GetSize(2);
	const size_t nLevels = m_grid.size();

	if ((dSalt.GetSize(0) != nTimes) ||
	    (dSalt.GetSize(1) != nDepth) ||
	    (dSalt.GetSize(2) != nCells)
	) {
		_EXCEPTIONT("Temperature and salinity chunks have different shapes");
	}
	if (nDepth != axis.size()) {
		_EXCEPTION2("Chunk has %lu depth levels, vertical axis has %lu",
			nDepth, axis.size());
	}

	chunk.Allocate(nTimes, nLevels + 1, nCells);

	GridColumn column(axis);
	BinnedColumn binned;

	for (size_t t = 0; t < nTimes; t++) {
		const float * pTheta = &(dTheta(t, 0, 0));
		const float * pSalt = &(dSalt(t, 0, 0));

		for (size_t i = 0; i < nCells; i++) {
			column.Load(pTheta, pSalt, i, nCells);

			if (!BinColumn(column, binned)) {
				continue;
			}

			for (size_t s = 0; s <= nLevels; s++) {
				chunk.dDepth(t, s, i) = static_cast<float>(binned.vecDepth[s]);
				chunk.dThick(t, s, i) = static_cast<float>(binned.vecThick[s]);
				chunk.dTheta(t, s, i) = static_cast<float>(binned.vecTheta[s]);
				chunk.dSalt(t, s, i) = static_cast<float>(binned.vecSalt[s]);
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

int ComputeChunkMonths(
	size_t sGridSize,
	int nRequestedMonths
) {
	int nChunk;
	if (sGridSize <= 1000000) {
		nChunk = 120;
	} else if (sGridSize <= 10000000) {
		nChunk = 24;
	} else {
		nChunk = 12;
	}
	if (nChunk > nRequestedMonths) {
		nChunk = nRequestedMonths;
	}
	return nChunk;
}

///////////////////////////////////////////////////////////////////////////////

