///////////////////////////////////////////////////////////////////////////////
///
///	\file    EquationOfState.h
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

#ifndef _EQUATIONOFSTATE_H_
#define _EQUATIONOFSTATE_H_

#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Approximate neutral density (kg/m^3) from potential temperature
///		(degrees C) and practical salinity, following the McDougall and
///		Jackett (2005) rational function fit.
///	</summary>
double NeutralDensity(
	double dTheta,
	double dSalt
);

///	<summary>
///		Neutral density minus 1000 kg/m^3 for arrays of temperature and
///		salinity.  Any point where either input is missing is set to
///		FillValue.
///	</summary>
void NeutralDensitySigma(
	const float * dTheta,
	const float * dSalt,
	float * dSigma,
	size_t sCount
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a temperature field from Kelvin to Celsius if its mean
///		valid value exceeds KelvinDetectionThreshold.
///	</summary>
///	<returns>
///		true if a correction was applied.
///	</returns>
bool CorrectTemperatureUnits(
	float * dTheta,
	size_t sCount
);

///	<summary>
///		Convert a salinity field from mass fraction to practical salinity
///		if every valid value lies below SalinityFractionThreshold.
///	</summary>
///	<returns>
///		true if a correction was applied.
///	</returns>
bool CorrectSalinityUnits(
	float * dSalt,
	size_t sCount
);

///////////////////////////////////////////////////////////////////////////////

#endif

