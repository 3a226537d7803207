///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegridMap.cpp
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

#include "RegridMap.h"

#include "NetCDFUtilities.h"
#include "Announce.h"
#include "Exception.h"

#include "netcdfcpp.h"

#include <cstring>

///////////////////////////////////////////////////////////////////////////////

void RegridMap::Read(
	const std::string & strMapFile
) {
	NcFile ncMap(strMapFile.c_str(), NcFile::ReadOnly);
	if (!ncMap.is_valid()) {
		_EXCEPTION1("Unable to open map file \"%s\"", strMapFile.c_str());
	}

	long lSourceSize = NcGetDimension(ncMap, "n_a", strMapFile)->size();
	long lTargetSize = NcGetDimension(ncMap, "n_b", strMapFile)->size();
	long lWeights = NcGetDimension(ncMap, "n_s", strMapFile)->size();

	// Target grid must be a regular lat-lon grid
	NcVar * varDstGridDims = NcGetVariable(ncMap, "dst_grid_dims", strMapFile);
	if (varDstGridDims->get_dim(0)->size() != 2) {
		_EXCEPTION1("Map file \"%s\" target grid is not rectilinear",
			strMapFile.c_str());
	}
	int nDstGridDims[2];
	varDstGridDims->set_cur((long)0);
	if (!varDstGridDims->get(nDstGridDims, 2)) {
		_EXCEPTION1("Error reading dst_grid_dims from \"%s\"",
			strMapFile.c_str());
	}

	// SCRIP stores dimensions with longitude first
	const long lTargetLon = nDstGridDims[0];
	const long lTargetLat = nDstGridDims[1];
	if (lTargetLon * lTargetLat != lTargetSize) {
		_EXCEPTION3("Map file target dimensions (%li x %li) do not match n_b (%li)",
			lTargetLat, lTargetLon, lTargetSize);
	}

	std::vector<double> vecCenterLat(lTargetSize);
	std::vector<double> vecCenterLon(lTargetSize);

	NcVar * varYc = NcGetVariable(ncMap, "yc_b", strMapFile);
	NcVar * varXc = NcGetVariable(ncMap, "xc_b", strMapFile);
	varYc->set_cur((long)0);
	varXc->set_cur((long)0);
	if (!varYc->get(&(vecCenterLat[0]), lTargetSize) ||
	    !varXc->get(&(vecCenterLon[0]), lTargetSize)
	) {
		_EXCEPTION1("Error reading target coordinates from \"%s\"",
			strMapFile.c_str());
	}

	std::vector<double> vecLat(lTargetLat);
	std::vector<double> vecLon(lTargetLon);
	for (long j = 0; j < lTargetLat; j++) {
		vecLat[j] = vecCenterLat[j * lTargetLon];
	}
	for (long i = 0; i < lTargetLon; i++) {
		vecLon[i] = vecCenterLon[i];
	}

	InitializeEmpty(static_cast<size_t>(lSourceSize), vecLat, vecLon);

	// Weights with one-based indices
	std::vector<int> vecRow(lWeights);
	std::vector<int> vecCol(lWeights);
	std::vector<double> vecS(lWeights);

	NcVar * varRow = NcGetVariable(ncMap, "row", strMapFile);
	NcVar * varCol = NcGetVariable(ncMap, "col", strMapFile);
	NcVar * varS = NcGetVariable(ncMap, "S", strMapFile);

	if (lWeights != 0) {
		varRow->set_cur((long)0);
		varCol->set_cur((long)0);
		varS->set_cur((long)0);
		if (!varRow->get(&(vecRow[0]), lWeights) ||
		    !varCol->get(&(vecCol[0]), lWeights) ||
		    !varS->get(&(vecS[0]), lWeights)
		) {
			_EXCEPTION1("Error reading weights from \"%s\"",
				strMapFile.c_str());
		}
	}

	for (long s = 0; s < lWeights; s++) {
		AddWeight(vecRow[s] - 1, vecCol[s] - 1, vecS[s]);
	}

	Announce("Map \"%s\": %li source cells, %li x %li target grid, %li weights",
		strMapFile.c_str(), lSourceSize, lTargetLat, lTargetLon, lWeights);
}

///////////////////////////////////////////////////////////////////////////////

void RegridMap::InitializeIdentity(
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon
) {
	m_fIdentity = true;
	m_sSourceSize = vecLat.size() * vecLon.size();
	m_sTargetSize = m_sSourceSize;
	m_vecTargetLat = vecLat;
	m_vecTargetLon = vecLon;
	m_smatWeights.Clear();
}

///////////////////////////////////////////////////////////////////////////////

void RegridMap::InitializeEmpty(
	size_t sSourceSize,
	const std::vector<double> & vecTargetLat,
	const std::vector<double> & vecTargetLon
) {
	m_fIdentity = false;
	m_sSourceSize = sSourceSize;
	m_sTargetSize = vecTargetLat.size() * vecTargetLon.size();
	m_vecTargetLat = vecTargetLat;
	m_vecTargetLon = vecTargetLon;
	m_smatWeights.Clear();
}

///////////////////////////////////////////////////////////////////////////////

void RegridMap::AddWeight(
	int iTarget,
	int iSource,
	double dWeight
) {
	if (m_fIdentity) {
		_EXCEPTIONT("Attempting to add weight to identity map");
	}
	if ((iTarget < 0) || (static_cast<size_t>(iTarget) >= m_sTargetSize)) {
		_EXCEPTION2("Map target index %i out of range (%lu)",
			iTarget, m_sTargetSize);
	}
	if ((iSource < 0) || (static_cast<size_t>(iSource) >= m_sSourceSize)) {
		_EXCEPTION2("Map source index %i out of range (%lu)",
			iSource, m_sSourceSize);
	}
	m_smatWeights(iTarget, iSource) += dWeight;
}

///////////////////////////////////////////////////////////////////////////////

void RegridMap::Apply(
	const float * dataIn,
	float * dataOut
) const {
	if (m_fIdentity) {
		memcpy(dataOut, dataIn, m_sTargetSize * sizeof(float));
		return;
	}
	m_smatWeights.ApplyWithMissing(dataIn, m_sSourceSize, dataOut, m_sTargetSize);
}

///////////////////////////////////////////////////////////////////////////////

void RegridMap::Apply(
	const DataArray2D<float> & dataIn,
	DataArray2D<float> & dataOut
) const {
	if (dataIn.GetSize(1) != m_sSourceSize) {
		_EXCEPTION2("Field has %lu cells, map source grid has %lu",
			dataIn.GetSize(1), m_sSourceSize);
	}

	const size_t nLevels = dataIn.GetSize(0);
	dataOut.Allocate(nLevels, m_sTargetSize);

	for (size_t k = 0; k < nLevels; k++) {
		Apply(&(dataIn(k,0)), &(dataOut(k,0)));
	}
}

///////////////////////////////////////////////////////////////////////////////

