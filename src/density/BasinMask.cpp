///////////////////////////////////////////////////////////////////////////////
///
///	\file    BasinMask.cpp
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

#include "BasinMask.h"

#include "Constants.h"
#include "Defines.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

const char * BasinName(int iBasin) {
	switch (iBasin) {
		case BasinGlobal:
			return "global";
		case BasinAtlantic:
			return "atlantic";
		case BasinPacific:
			return "pacific";
		case BasinIndian:
			return "indian";
		default:
			_EXCEPTION1("Invalid basin index %i", iBasin);
	}
}

///////////////////////////////////////////////////////////////////////////////

void BasinMask::Initialize(
	const float * dCodes,
	size_t sLatitudes,
	size_t sLongitudes
) {
	m_sLatitudes = sLatitudes;
	m_sLongitudes = sLongitudes;
	m_nCode.Allocate(sLatitudes * sLongitudes);

	for (size_t i = 0; i < GetCellCount(); i++) {
		if (IsFillValue(dCodes[i])) {
			m_nCode(i) = (-1);
		} else {
			m_nCode(i) = static_cast<int>(floor(dCodes[i] + 0.5));
			if (m_nCode(i) < 0) {
				m_nCode(i) = 0;
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void BasinMask::InitializeGlobal(
	size_t sLatitudes,
	size_t sLongitudes
) {
	m_sLatitudes = sLatitudes;
	m_sLongitudes = sLongitudes;
	m_nCode.Allocate(sLatitudes * sLongitudes);
}

///////////////////////////////////////////////////////////////////////////////

void ComputeCellArea(
	const std::vector<double> & vecLon,
	const std::vector<double> & vecLat,
	DataArray2D<double> & dArea
) {
	const size_t nLon = vecLon.size();
	const size_t nLat = vecLat.size();

	if ((nLon < 3) || (nLat < 2)) {
		_EXCEPTION2("Grid too small to compute cell area (%lu x %lu)",
			nLat, nLon);
	}

	const double dRadConv = M_PI / 180.0;
	const double dR2 = EarthRadius * EarthRadius;

	dArea.Allocate(nLat, nLon);

	for (size_t i = 1; i < nLon - 1; i++) {
		double dLonWest = 0.5 * (vecLon[i-1] + vecLon[i]) * dRadConv;
		double dLonEast = 0.5 * (vecLon[i] + vecLon[i+1]) * dRadConv;
		double dWidth = dLonEast - dLonWest;

		for (size_t j = 1; j < nLat - 1; j++) {
			double dLatSouth = 0.5 * (vecLat[j-1] + vecLat[j]) * dRadConv;
			double dLatNorth = 0.5 * (vecLat[j] + vecLat[j+1]) * dRadConv;
			dArea(j,i) = dR2 * dWidth * (sin(dLatNorth) - sin(dLatSouth));
		}

		// Rows adjacent to the poles
		double dLatSouth = 0.5 * (-90.0 + vecLat[0]) * dRadConv;
		double dLatNorth = 0.5 * (vecLat[0] + vecLat[1]) * dRadConv;
		dArea(0,i) = dR2 * dWidth * (sin(dLatNorth) - sin(dLatSouth));

		dLatSouth = 0.5 * (vecLat[nLat-2] + vecLat[nLat-1]) * dRadConv;
		dLatNorth = 0.5 * (vecLat[nLat-1] + 90.0) * dRadConv;
		dArea(nLat-1,i) = dR2 * dWidth * (sin(dLatNorth) - sin(dLatSouth));
	}

	// Edge columns
	for (size_t j = 0; j < nLat; j++) {
		dArea(j,0) = dArea(j,1);
		dArea(j,nLon-1) = dArea(j,nLon-2);
	}
}

///////////////////////////////////////////////////////////////////////////////

ZonalAverager::ZonalAverager(
	const BasinMask & mask,
	const DataArray2D<double> & dArea
) :
	m_mask(mask)
{
	const size_t nLat = mask.GetLatitudes();
	const size_t nLon = mask.GetLongitudes();

	if ((dArea.GetSize(0) != nLat) || (dArea.GetSize(1) != nLon)) {
		_EXCEPTION4("Area grid (%lu x %lu) does not match basin mask (%lu x %lu)",
			dArea.GetSize(0), dArea.GetSize(1), nLat, nLon);
	}

	m_dZonalArea.Allocate(BasinCount, nLat);
	for (int b = 0; b < BasinCount; b++) {
		for (size_t j = 0; j < nLat; j++) {
			for (size_t i = 0; i < nLon; i++) {
				if (mask.Contains(b, j * nLon + i)) {
					m_dZonalArea(b,j) += dArea(j,i);
				}
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ZonalAverager::ZonalMean(
	const float * dField,
	int iBasin,
	float * dZonal
) const {
	const size_t nLat = m_mask.GetLatitudes();
	const size_t nLon = m_mask.GetLongitudes();

	for (size_t j = 0; j < nLat; j++) {
		double dSum = 0.0;
		int nValid = 0;
		for (size_t i = 0; i < nLon; i++) {
			size_t iCell = j * nLon + i;
			if (!m_mask.Contains(iBasin, iCell)) {
				continue;
			}
			if (IsFillValue(dField[iCell])) {
				continue;
			}
			dSum += dField[iCell];
			nValid++;
		}
		if (nValid == 0) {
			dZonal[j] = FillValue;
		} else {
			dZonal[j] = static_cast<float>(dSum / static_cast<double>(nValid));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ZonalAverager::ZonalMean(
	const DataArray2D<float> & dField,
	DataArray3D<float> & dZonal
) const {
	if (dField.GetSize(1) != m_mask.GetCellCount()) {
		_EXCEPTION2("Field has %lu cells, target grid has %lu",
			dField.GetSize(1), m_mask.GetCellCount());
	}

	const size_t nLevels = dField.GetSize(0);
	dZonal.Allocate(BasinCount, nLevels, m_mask.GetLatitudes());

	for (int b = 0; b < BasinCount; b++) {
		for (size_t k = 0; k < nLevels; k++) {
			ZonalMean(&(dField(k,0)), b, &(dZonal(b,k,0)));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ZonalAverager::ZonalMean(
	const DataArray1D<float> & dField,
	DataArray2D<float> & dZonal
) const {
	if (dField.GetSize(0) != m_mask.GetCellCount()) {
		_EXCEPTION2("Field has %lu cells, target grid has %lu",
			dField.GetSize(0), m_mask.GetCellCount());
	}

	dZonal.Allocate(BasinCount, m_mask.GetLatitudes());

	for (int b = 0; b < BasinCount; b++) {
		ZonalMean(&(dField(0)), b, &(dZonal(b,0)));
	}
}

///////////////////////////////////////////////////////////////////////////////

void ZonalAverager::ZonalVolume(
	const DataArray3D<float> & dZonalThick,
	DataArray3D<float> & dZonalVolume
) const {
	const size_t nBasins = dZonalThick.GetSize(0);
	const size_t nLevels = dZonalThick.GetSize(1);
	const size_t nLat = dZonalThick.GetSize(2);

	if ((nBasins != BasinCount) || (nLat != m_mask.GetLatitudes())) {
		_EXCEPTIONT("Zonal thickness does not match basins and latitudes");
	}

	dZonalVolume.Allocate(nBasins, nLevels, nLat);

	for (size_t b = 0; b < nBasins; b++) {
	for (size_t k = 0; k < nLevels; k++) {
	for (size_t j = 0; j < nLat; j++) {
		float dThick = dZonalThick(b,k,j);
		if (IsFillValue(dThick)) {
			dZonalVolume(b,k,j) = FillValue;
		} else {
			dZonalVolume(b,k,j) = static_cast<float>(
				dThick * m_dZonalArea(b,j) * VolumeScale);
		}
	}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

