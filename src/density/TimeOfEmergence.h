///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeOfEmergence.h
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

#ifndef _TIMEOFEMERGENCE_H_
#define _TIMEOFEMERGENCE_H_

#include "DataArray1D.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parameters of the emergence detection.
///	</summary>
struct EmergenceParameters {

	EmergenceParameters() :
		dMultiplier(2.0),
		iReferenceBegin(0),
		iReferenceEnd(0)
	{ }

	///	<summary>
	///		Throw an Exception if the parameters are inconsistent with a
	///		series of the given number of time steps.
	///	</summary>
	void Validate(int nTimes) const;

	///	<summary>
	///		Signal must exceed this multiple of the noise.
	///	</summary>
	double dMultiplier;

	///	<summary>
	///		Reference period [iReferenceBegin, iReferenceEnd).
	///	</summary>
	int iReferenceBegin;
	int iReferenceEnd;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A latitude / density box, bounds inclusive.
///	</summary>
struct EmergenceDomain {

	EmergenceDomain() :
		dLatMin(0.0),
		dLatMax(0.0),
		dSigmaMin(0.0),
		dSigmaMax(0.0)
	{ }

	///	<summary>
	///		Parse "latmin,latmax,rhomin,rhomax".
	///	</summary>
	void FromString(const std::string & strDomain);

	///	<summary>
	///		Parse a semicolon-separated list of domains.
	///	</summary>
	static void ParseList(
		const std::string & strDomains,
		std::vector<EmergenceDomain> & vecDomains
	);

	///	<summary>
	///		Determine if the point lies within the box.
	///	</summary>
	bool Contains(double dLat, double dSigma) const {
		return (
			(dLat >= dLatMin) && (dLat <= dLatMax) &&
			(dSigma >= dSigmaMin) && (dSigma <= dSigmaMax));
	}

	double dLatMin;
	double dLatMax;
	double dSigmaMin;
	double dSigmaMax;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Detects the time at which a signal permanently rises above a
///		multiple of the background noise.  Series are indexed (time, point).
///	</summary>
class EmergenceDetector {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	explicit EmergenceDetector(
		const EmergenceParameters & param
	);

public:
	///	<summary>
	///		Time of emergence per point: the index after the last time step
	///		where |signal| is below the threshold.  0 if the signal always
	///		exceeds, the series length if it never exceeds at the end, and
	///		ToEMissing where the noise is missing.
	///	</summary>
	void FindTimeOfEmergence(
		const DataArray2D<float> & dSignal,
		const DataArray1D<float> & dNoise,
		DataArray1D<int> & nToE
	) const;

	///	<summary>
	///		Subtract the reference period mean from each point in place.
	///		Points with no valid reference value become missing.
	///	</summary>
	void ReferenceAnomaly(
		DataArray2D<float> & dField
	) const;

	///	<summary>
	///		Noise of each point from the reference period of a series.
	///	</summary>
	void ReferenceNoise(
		const DataArray2D<float> & dField,
		DataArray1D<float> & dNoise
	) const;

	///	<summary>
	///		Parameters.
	///	</summary>
	const EmergenceParameters & GetParameters() const {
		return m_param;
	}

public:
	///	<summary>
	///		Population standard deviation over time steps [iBegin, iEnd) of
	///		each point, ignoring missing values.
	///	</summary>
	static void TemporalStandardDeviation(
		const DataArray2D<float> & dField,
		size_t iBegin,
		size_t iEnd,
		DataArray1D<float> & dStd
	);

	///	<summary>
	///		Masked mean over a domain of a (time, basin, level, lat) field
	///		flattened to (time, point), for a single basin.
	///	</summary>
	static void AverageOverDomain(
		const DataArray2D<float> & dField,
		size_t iBasin,
		const std::vector<double> & vecSigma,
		const std::vector<double> & vecLat,
		const EmergenceDomain & domain,
		DataArray1D<float> & dSeries
	);

protected:
	///	<summary>
	///		Parameters.
	///	</summary>
	EmergenceParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

#endif

