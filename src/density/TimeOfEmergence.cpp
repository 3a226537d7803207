///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeOfEmergence.cpp
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

#include "TimeOfEmergence.h"

#include "Defines.h"
#include "Exception.h"
#include "STLStringHelper.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

void EmergenceParameters::Validate(int nTimes) const {
	if (dMultiplier <= 0.0) {
		_EXCEPTION1("Noise multiplier (%f) must be positive", dMultiplier);
	}
	if ((iReferenceBegin < 0) ||
	    (iReferenceEnd <= iReferenceBegin) ||
	    (iReferenceEnd > nTimes)
	) {
		_EXCEPTION3("Invalid reference period [%i, %i) for %i time steps",
			iReferenceBegin, iReferenceEnd, nTimes);
	}
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDomain::FromString(const std::string & strDomain) {
	std::vector<double> vecBounds;
	STLStringHelper::ParseDoubleList(strDomain, vecBounds);

	if (vecBounds.size() != 4) {
		_EXCEPTION1("Domain \"%s\" must have the form latmin,latmax,rhomin,rhomax",
			strDomain.c_str());
	}

	dLatMin = vecBounds[0];
	dLatMax = vecBounds[1];
	dSigmaMin = vecBounds[2];
	dSigmaMax = vecBounds[3];

	if ((dLatMin > dLatMax) || (dSigmaMin > dSigmaMax)) {
		_EXCEPTION1("Domain \"%s\" has inverted bounds", strDomain.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDomain::ParseList(
	const std::string & strDomains,
	std::vector<EmergenceDomain> & vecDomains
) {
	std::vector<std::string> vecItems;
	STLStringHelper::ParseVariableList(strDomains, vecItems, ";");

	vecDomains.resize(vecItems.size());
	for (size_t d = 0; d < vecItems.size(); d++) {
		vecDomains[d].FromString(vecItems[d]);
	}
}

///////////////////////////////////////////////////////////////////////////////

EmergenceDetector::EmergenceDetector(
	const EmergenceParameters & param
) :
	m_param(param)
{ }

///////////////////////////////////////////////////////////////////////////////

void EmergenceDetector::FindTimeOfEmergence(
	const DataArray2D<float> & dSignal,
	const DataArray1D<float> & dNoise,
	DataArray1D<int> & nToE
) const {
	const size_t nTimes = dSignal.GetSize(0);
	const size_t nPoints = dSignal.GetSize(1);

	if (dNoise.GetSize(0) != nPoints) {
		_EXCEPTION2("Noise has %lu points, signal has %lu points",
			dNoise.GetSize(0), nPoints);
	}

	nToE.Allocate(nPoints);

	for (size_t p = 0; p < nPoints; p++) {
		if (IsFillValue(dNoise(p))) {
			nToE(p) = ToEMissing;
			continue;
		}

		const double dThreshold = m_param.dMultiplier * dNoise(p);

		// Scan backward for the most recent step below threshold
		int iEmergence = 0;
		for (size_t t = nTimes; t > 0; t--) {
			float dValue = dSignal(t-1,p);
			bool fExceeds =
				!IsFillValue(dValue) && (fabs(dValue) >= dThreshold);

			if (!fExceeds) {
				iEmergence = static_cast<int>(t);
				break;
			}
		}
		nToE(p) = iEmergence;
	}
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDetector::ReferenceAnomaly(
	DataArray2D<float> & dField
) const {
	const size_t nTimes = dField.GetSize(0);
	const size_t nPoints = dField.GetSize(1);

	m_param.Validate(static_cast<int>(nTimes));

	for (size_t p = 0; p < nPoints; p++) {
		double dSum = 0.0;
		int nValid = 0;
		for (int t = m_param.iReferenceBegin; t < m_param.iReferenceEnd; t++) {
			if (!IsFillValue(dField(t,p))) {
				dSum += dField(t,p);
				nValid++;
			}
		}

		for (size_t t = 0; t < nTimes; t++) {
			if (nValid == 0) {
				dField(t,p) = FillValue;
			} else if (!IsFillValue(dField(t,p))) {
				dField(t,p) -= static_cast<float>(dSum / static_cast<double>(nValid));
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDetector::ReferenceNoise(
	const DataArray2D<float> & dField,
	DataArray1D<float> & dNoise
) const {
	m_param.Validate(static_cast<int>(dField.GetSize(0)));

	TemporalStandardDeviation(
		dField,
		static_cast<size_t>(m_param.iReferenceBegin),
		static_cast<size_t>(m_param.iReferenceEnd),
		dNoise);
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDetector::TemporalStandardDeviation(
	const DataArray2D<float> & dField,
	size_t iBegin,
	size_t iEnd,
	DataArray1D<float> & dStd
) {
	const size_t nPoints = dField.GetSize(1);

	if ((iBegin >= iEnd) || (iEnd > dField.GetSize(0))) {
		_EXCEPTION3("Invalid time range [%lu, %lu) for %lu time steps",
			iBegin, iEnd, dField.GetSize(0));
	}

	dStd.Allocate(nPoints);

	for (size_t p = 0; p < nPoints; p++) {
		double dSum = 0.0;
		int nValid = 0;
		for (size_t t = iBegin; t < iEnd; t++) {
			if (!IsFillValue(dField(t,p))) {
				dSum += dField(t,p);
				nValid++;
			}
		}
		if (nValid == 0) {
			dStd(p) = FillValue;
			continue;
		}

		double dMean = dSum / static_cast<double>(nValid);
		double dSumSq = 0.0;
		for (size_t t = iBegin; t < iEnd; t++) {
			if (!IsFillValue(dField(t,p))) {
				double dDiff = dField(t,p) - dMean;
				dSumSq += dDiff * dDiff;
			}
		}
		dStd(p) = static_cast<float>(sqrt(dSumSq / static_cast<double>(nValid)));
	}
}

///////////////////////////////////////////////////////////////////////////////

void EmergenceDetector::AverageOverDomain(
	const DataArray2D<float> & dField,
	size_t iBasin,
	const std::vector<double> & vecSigma,
	const std::vector<double> & vecLat,
	const EmergenceDomain & domain,
	DataArray1D<float> & dSeries
) {
	const size_t nTimes = dField.GetSize(0);
	const size_t nLevels = vecSigma.size();
	const size_t nLat = vecLat.size();

	if (dField.GetSize(1) % (nLevels * nLat) != 0) {
		_EXCEPTION3("Field of %lu points is not a multiple of (%lu levels x %lu lat)",
			dField.GetSize(1), nLevels, nLat);
	}
	if ((iBasin + 1) * nLevels * nLat > dField.GetSize(1)) {
		_EXCEPTION1("Basin index %lu out of range", iBasin);
	}

	dSeries.Allocate(nTimes);

	for (size_t t = 0; t < nTimes; t++) {
		double dSum = 0.0;
		int nValid = 0;
		for (size_t k = 0; k < nLevels; k++) {
		for (size_t j = 0; j < nLat; j++) {
			if (!domain.Contains(vecLat[j], vecSigma[k])) {
				continue;
			}
			float dValue = dField(t, (iBasin * nLevels + k) * nLat + j);
			if (!IsFillValue(dValue)) {
				dSum += dValue;
				nValid++;
			}
		}
		}
		if (nValid == 0) {
			dSeries(t) = FillValue;
		} else {
			dSeries(t) = static_cast<float>(dSum / static_cast<double>(nValid));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

