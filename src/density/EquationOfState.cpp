///////////////////////////////////////////////////////////////////////////////
///
///	\file    EquationOfState.cpp
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

#include "EquationOfState.h"

#include "Defines.h"
#include "Constants.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

double NeutralDensity(
	double dTheta,
	double dSalt
) {
	const double dSqrtSalt = sqrt(dSalt);

	double dR1 =
		((-4.3159255086706703e-4 * dTheta
		  + 8.1157118782170051e-2) * dTheta
		  + 2.2280832068441331e-1) * dTheta
		  + 1002.3063688892480;

	double dR2 =
		(-1.7052298331414675e-7 * dSalt
		 - 3.1710675488863952e-3 * dTheta
		 - 1.0304537539692924e-4) * dSalt;

	double dR3 =
		(((-2.3850178558212048e-9 * dTheta
		   - 1.6212552470310961e-7) * dTheta
		   + 7.8717799560577725e-5) * dTheta
		   + 4.3907692647825900e-5) * dTheta
		   + 1.0;

	double dR4 =
		((-2.2744455733317707e-9 * dTheta * dTheta
		  + 6.0399864718597388e-6) * dTheta
		  - 5.1268124398160734e-4) * dSalt;

	double dR5 =
		(-1.3409379420216683e-9 * dTheta * dTheta
		 - 3.6138532339703262e-5) * dSalt * dSqrtSalt;

	return (dR1 + dR2) / (dR3 + dR4 + dR5);
}

///////////////////////////////////////////////////////////////////////////////

void NeutralDensitySigma(
	const float * dTheta,
	const float * dSalt,
	float * dSigma,
	size_t sCount
) {
	for (size_t i = 0; i < sCount; i++) {
		if (IsFillValue(dTheta[i]) || IsFillValue(dSalt[i]) || (dSalt[i] < 0.0f)) {
			dSigma[i] = FillValue;
			continue;
		}
		dSigma[i] = static_cast<float>(
			NeutralDensity(dTheta[i], dSalt[i]) - SigmaReferenceDensity);
	}
}

///////////////////////////////////////////////////////////////////////////////

bool CorrectTemperatureUnits(
	float * dTheta,
	size_t sCount
) {
	double dSum = 0.0;
	size_t sValid = 0;
	for (size_t i = 0; i < sCount; i++) {
		if (!IsFillValue(dTheta[i])) {
			dSum += dTheta[i];
			sValid++;
		}
	}
	if ((sValid == 0) || (dSum / static_cast<double>(sValid) <= KelvinDetectionThreshold)) {
		return false;
	}

	for (size_t i = 0; i < sCount; i++) {
		if (!IsFillValue(dTheta[i])) {
			dTheta[i] = static_cast<float>(dTheta[i] - KelvinOffset);
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

bool CorrectSalinityUnits(
	float * dSalt,
	size_t sCount
) {
	size_t sValid = 0;
	for (size_t i = 0; i < sCount; i++) {
		if (IsFillValue(dSalt[i])) {
			continue;
		}
		if (dSalt[i] >= SalinityFractionThreshold) {
			return false;
		}
		sValid++;
	}
	if (sValid == 0) {
		return false;
	}

	for (size_t i = 0; i < sCount; i++) {
		if (!IsFillValue(dSalt[i])) {
			dSalt[i] = static_cast<float>(dSalt[i] * 1000.0);
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

