///////////////////////////////////////////////////////////////////////////////
///
///	\file    DensityGrid.h
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

#ifndef _DENSITYGRID_H_
#define _DENSITYGRID_H_

#include <vector>
#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parameters of the target density grid, in sigma units
///		(kg/m^3 - 1000).  Levels are spaced by dDeltaFine from dMin up to
///		dIntermediate and by dDeltaCoarse from dIntermediate up to dMax.
///	</summary>
struct DensityGridParameters {

	///	<summary>
	///		Default parameters (19, 26, 28.5, 0.2, 0.1).
	///	</summary>
	DensityGridParameters() :
		dMin(19.0),
		dIntermediate(26.0),
		dMax(28.5),
		dDeltaFine(0.2),
		dDeltaCoarse(0.1)
	{ }

	///	<summary>
	///		Throw an Exception if the parameters do not describe a valid grid.
	///	</summary>
	void Validate() const;

	double dMin;
	double dIntermediate;
	double dMax;
	double dDeltaFine;
	double dDeltaCoarse;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The target density levels of the isopycnal remapping.  Immutable
///		once built and shared read-only by every column.
///	</summary>
class DensityGrid {

public:
	///	<summary>
	///		Build the grid from the given parameters.  Parameters are not
	///		validated here; call DensityGridParameters::Validate() first.
	///	</summary>
	explicit DensityGrid(
		const DensityGridParameters & param
	);

public:
	///	<summary>
	///		Number of target levels, excluding the bottom sentinel level.
	///	</summary>
	size_t size() const {
		return m_vecLevels.size();
	}

	///	<summary>
	///		Target density of level k.
	///	</summary>
	double operator[](size_t k) const {
		return m_vecLevels[k];
	}

	///	<summary>
	///		Target density levels.
	///	</summary>
	const std::vector<double> & GetLevels() const {
		return m_vecLevels;
	}

	///	<summary>
	///		Spacing between level k and level k+1.
	///	</summary>
	const std::vector<double> & GetDeltas() const {
		return m_vecDeltas;
	}

	///	<summary>
	///		Levels followed by one trailing sentinel (last level plus the
	///		coarse spacing), used as the axis of output carrying the bottom
	///		level.
	///	</summary>
	const std::vector<double> & GetAxis() const {
		return m_vecAxis;
	}

	///	<summary>
	///		Parameters used to build this grid.
	///	</summary>
	const DensityGridParameters & GetParameters() const {
		return m_param;
	}

	///	<summary>
	///		Index of the first level whose density is at or above dSigma,
	///		or size() if there is none.
	///	</summary>
	size_t FirstLevelAtOrAbove(double dSigma) const;

protected:
	///	<summary>
	///		Append the levels of the half-open range [dBegin, dEnd).
	///	</summary>
	void AppendRange(
		double dBegin,
		double dEnd,
		double dDelta
	);

protected:
	///	<summary>
	///		Parameters used to build this grid.
	///	</summary>
	DensityGridParameters m_param;

	///	<summary>
	///		Target density levels.
	///	</summary>
	std::vector<double> m_vecLevels;

	///	<summary>
	///		Per-level spacing.
	///	</summary>
	std::vector<double> m_vecDeltas;

	///	<summary>
	///		Levels with the trailing sentinel.
	///	</summary>
	std::vector<double> m_vecAxis;
};

///////////////////////////////////////////////////////////////////////////////

#endif

