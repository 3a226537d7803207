///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegridMap.h
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

#ifndef _REGRIDMAP_H_
#define _REGRIDMAP_H_

#include "SparseMatrix.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A horizontal remapping operator from the source ocean grid onto a
///		regular latitude-longitude target grid, loaded from an offline
///		SCRIP map file or set to the identity when both grids coincide.
///	</summary>
class RegridMap {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	RegridMap() :
		m_fIdentity(true),
		m_sSourceSize(0),
		m_sTargetSize(0)
	{ }

public:
	///	<summary>
	///		Load weights and target grid coordinates from a SCRIP map file
	///		(n_a, n_b, row, col, S, dst_grid_dims, yc_b, xc_b).
	///	</summary>
	void Read(
		const std::string & strMapFile
	);

	///	<summary>
	///		Use the identity map on a regular grid with the given
	///		coordinates.
	///	</summary>
	void InitializeIdentity(
		const std::vector<double> & vecLat,
		const std::vector<double> & vecLon
	);

	///	<summary>
	///		Initialize an empty map between grids of the given size.
	///	</summary>
	void InitializeEmpty(
		size_t sSourceSize,
		const std::vector<double> & vecTargetLat,
		const std::vector<double> & vecTargetLon
	);

	///	<summary>
	///		Add a weight from source cell iSource to target cell iTarget
	///		(zero-based).
	///	</summary>
	void AddWeight(
		int iTarget,
		int iSource,
		double dWeight
	);

public:
	///	<summary>
	///		Remap a (level, source cell) field onto (level, target cell).
	///	</summary>
	void Apply(
		const DataArray2D<float> & dataIn,
		DataArray2D<float> & dataOut
	) const;

	///	<summary>
	///		Remap a single source field onto the target grid.
	///	</summary>
	void Apply(
		const float * dataIn,
		float * dataOut
	) const;

public:
	///	<summary>
	///		Number of source cells.
	///	</summary>
	size_t GetSourceSize() const {
		return m_sSourceSize;
	}

	///	<summary>
	///		Number of target cells.
	///	</summary>
	size_t GetTargetSize() const {
		return m_sTargetSize;
	}

	///	<summary>
	///		True if no weights are applied.
	///	</summary>
	bool IsIdentity() const {
		return m_fIdentity;
	}

	///	<summary>
	///		Target grid latitudes.
	///	</summary>
	const std::vector<double> & GetTargetLatitudes() const {
		return m_vecTargetLat;
	}

	///	<summary>
	///		Target grid longitudes.
	///	</summary>
	const std::vector<double> & GetTargetLongitudes() const {
		return m_vecTargetLon;
	}

protected:
	///	<summary>
	///		True if this map is the identity.
	///	</summary>
	bool m_fIdentity;

	///	<summary>
	///		Number of source cells.
	///	</summary>
	size_t m_sSourceSize;

	///	<summary>
	///		Number of target cells.
	///	</summary>
	size_t m_sTargetSize;

	///	<summary>
	///		Remapping weights (target, source).
	///	</summary>
	SparseMatrix<double> m_smatWeights;

	///	<summary>
	///		Target grid coordinates.
	///	</summary>
	std::vector<double> m_vecTargetLat;
	std::vector<double> m_vecTargetLon;
};

///////////////////////////////////////////////////////////////////////////////

#endif

