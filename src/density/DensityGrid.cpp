///////////////////////////////////////////////////////////////////////////////
///
///	\file    DensityGrid.cpp
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

#include "DensityGrid.h"

#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Fraction of a spacing below which the range end is excluded.
///	</summary>
static const double RangeEndTolerance = 1.0e-6;

///////////////////////////////////////////////////////////////////////////////

void DensityGridParameters::Validate() const {
	if (!(dMin < dIntermediate)) {
		_EXCEPTION2("Density grid minimum (%f) must be less than "
			"intermediate value (%f)", dMin, dIntermediate);
	}
	if (!(dIntermediate < dMax)) {
		_EXCEPTION2("Density grid intermediate value (%f) must be less than "
			"maximum (%f)", dIntermediate, dMax);
	}
	if (!(dDeltaFine > 0.0) || !(dDeltaCoarse > 0.0)) {
		_EXCEPTION2("Density grid spacings must be positive (%f, %f)",
			dDeltaFine, dDeltaCoarse);
	}
}

///////////////////////////////////////////////////////////////////////////////

DensityGrid::DensityGrid(
	const DensityGridParameters & param
) :
	m_param(param)
{
	AppendRange(param.dMin, param.dIntermediate, param.dDeltaFine);
	AppendRange(param.dIntermediate, param.dMax, param.dDeltaCoarse);

	m_vecAxis = m_vecLevels;
	if (m_vecLevels.size() != 0) {
		m_vecAxis.push_back(m_vecLevels.back() + param.dDeltaCoarse);
	}
}

///////////////////////////////////////////////////////////////////////////////

void DensityGrid::AppendRange(
	double dBegin,
	double dEnd,
	double dDelta
) {
	// Values are computed as dBegin + i * dDelta so that rounding does not
	// accumulate; the tolerance keeps dEnd itself out of the range.
	int nCount = static_cast<int>(
		ceil((dEnd - dBegin) / dDelta - RangeEndTolerance));

	for (int i = 0; i < nCount; i++) {
		m_vecLevels.push_back(dBegin + static_cast<double>(i) * dDelta);
		m_vecDeltas.push_back(dDelta);
	}
}

///////////////////////////////////////////////////////////////////////////////

size_t DensityGrid::FirstLevelAtOrAbove(double dSigma) const {
	for (size_t k = 0; k < m_vecLevels.size(); k++) {
		if (m_vecLevels[k] >= dSigma) {
			return k;
		}
	}
	return m_vecLevels.size();
}

///////////////////////////////////////////////////////////////////////////////

