///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleAverager.cpp
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

#include "EnsembleAverager.h"

#include "Defines.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

void EnsembleParameters::Validate(int nTimes) const {
	if ((dCoverageThreshold < 0.0) || (dCoverageThreshold > 100.0)) {
		_EXCEPTION1("Coverage threshold (%f) must be between 0 and 100",
			dCoverageThreshold);
	}
	if (fMultiModel) {
		return;
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

void GetEnsembleZonalVariables(
	std::vector<EnsembleVariable> & vecVariables
) {
	vecVariables.clear();
	vecVariables.push_back(EnsembleVariable("isondepth", true));
	vecVariables.push_back(EnsembleVariable("isonpers", true));
	vecVariables.push_back(EnsembleVariable("isonso", false));
	vecVariables.push_back(EnsembleVariable("isonthetao", false));
	vecVariables.push_back(EnsembleVariable("isonthick", true));
	vecVariables.push_back(EnsembleVariable("isonvol", true));
}

///////////////////////////////////////////////////////////////////////////////

void GetEnsembleBowlVariables(
	std::vector<EnsembleVariable> & vecVariables
) {
	vecVariables.clear();
	vecVariables.push_back(EnsembleVariable("ptopdepth", false));
	vecVariables.push_back(EnsembleVariable("ptopsigma", false));
	vecVariables.push_back(EnsembleVariable("ptopso", false));
	vecVariables.push_back(EnsembleVariable("ptopthetao", false));
}

///////////////////////////////////////////////////////////////////////////////

void GetEnsembleMemberVariables(
	bool fMultiModel,
	std::vector<std::string> & vecZonalNames,
	std::vector<std::string> & vecBowlNames
) {
	std::vector<EnsembleVariable> vecZonal;
	std::vector<EnsembleVariable> vecBowl;
	GetEnsembleZonalVariables(vecZonal);
	GetEnsembleBowlVariables(vecBowl);

	vecZonalNames.clear();
	vecBowlNames.clear();

	for (size_t v = 0; v < vecZonal.size(); v++) {
		vecZonalNames.push_back(vecZonal[v].strName);
		if (fMultiModel) {
			vecZonalNames.push_back(vecZonal[v].strName + "Agree");
			vecZonalNames.push_back(vecZonal[v].strName + "Bowl");
		}
	}
	for (size_t v = 0; v < vecBowl.size(); v++) {
		vecBowlNames.push_back(vecBowl[v].strName);
		if (fMultiModel) {
			vecBowlNames.push_back(vecBowl[v].strName + "Agree");
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleShape::CheckDimensions(
	const std::string & strFile,
	const std::string & strVarName,
	bool fZonal,
	const std::vector<long> & vecDimSizes
) const {
	std::vector<long> vecExpected;
	vecExpected.push_back(lTimes);
	vecExpected.push_back(lBasins);
	if (fZonal) {
		vecExpected.push_back(lLevels);
	}
	vecExpected.push_back(lLatitudes);

	if (vecDimSizes.size() != vecExpected.size()) {
		_EXCEPTION3("Variable \"%s\" in \"%s\" must have %lu dimensions",
			strVarName.c_str(), strFile.c_str(), vecExpected.size());
	}
	if (vecDimSizes[0] != lTimes) {
		_EXCEPTION4("Time axis of \"%s\" in \"%s\" has length %li, expected %li",
			strVarName.c_str(), strFile.c_str(), vecDimSizes[0], lTimes);
	}
	for (size_t d = 1; d < vecExpected.size(); d++) {
		if (vecDimSizes[d] != vecExpected[d]) {
			_EXCEPTION5("Dimension %lu of \"%s\" in \"%s\" has length %li, expected %li",
				d, strVarName.c_str(), strFile.c_str(),
				vecDimSizes[d], vecExpected[d]);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

EnsembleAverager::EnsembleAverager(
	const EnsembleParameters & param
) :
	m_param(param)
{ }

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::ZeroFillMissing(
	DataArray3D<float> & dMembers
) {
	float * pData = dMembers.GetData();
	for (size_t i = 0; i < dMembers.GetTotalSize(); i++) {
		if (IsFillValue(pData[i])) {
			pData[i] = 0.0f;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::ComputeCoverage(
	const DataArray3D<float> & dMembers,
	DataArray2D<float> & dPercent
) const {
	const size_t nMembers = dMembers.GetSize(0);
	const size_t nTimes = dMembers.GetSize(1);
	const size_t nPoints = dMembers.GetSize(2);

	if (nMembers == 0) {
		_EXCEPTIONT("Ensemble has no members");
	}

	dPercent.Allocate(nTimes, nPoints);

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t p = 0; p < nPoints; p++) {
		int nValid = 0;
		for (size_t m = 0; m < nMembers; m++) {
			if (!IsFillValue(dMembers(m,t,p))) {
				nValid++;
			}
		}

		double dPercentValid =
			100.0 * static_cast<double>(nValid) / static_cast<double>(nMembers);

		if (dPercentValid < m_param.dCoverageThreshold) {
			dPercent(t,p) = FillValue;
		} else {
			dPercent(t,p) = static_cast<float>(dPercentValid);
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::Mean(
	const DataArray3D<float> & dMembers,
	const DataArray2D<float> & dPercent,
	DataArray2D<float> & dMean
) const {
	const size_t nMembers = dMembers.GetSize(0);
	const size_t nTimes = dMembers.GetSize(1);
	const size_t nPoints = dMembers.GetSize(2);

	if ((dPercent.GetSize(0) != nTimes) || (dPercent.GetSize(1) != nPoints)) {
		_EXCEPTIONT("Coverage field does not match member fields");
	}

	dMean.Allocate(nTimes, nPoints);

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t p = 0; p < nPoints; p++) {
		dMean(t,p) = FillValue;
		if (IsFillValue(dPercent(t,p))) {
			continue;
		}

		double dSum = 0.0;
		int nValid = 0;
		for (size_t m = 0; m < nMembers; m++) {
			float dValue = dMembers(m,t,p);
			if (!IsFillValue(dValue)) {
				dSum += dValue;
				nValid++;
			}
		}
		if (nValid != 0) {
			dMean(t,p) = static_cast<float>(dSum / static_cast<double>(nValid));
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::StandardDeviation(
	const DataArray3D<float> & dMembers,
	const DataArray2D<float> & dPercent,
	DataArray2D<float> & dStd
) const {
	const size_t nMembers = dMembers.GetSize(0);
	const size_t nTimes = dMembers.GetSize(1);
	const size_t nPoints = dMembers.GetSize(2);

	DataArray2D<float> dMean;
	Mean(dMembers, dPercent, dMean);

	dStd.Allocate(nTimes, nPoints);

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t p = 0; p < nPoints; p++) {
		dStd(t,p) = FillValue;
		if (IsFillValue(dMean(t,p))) {
			continue;
		}

		double dSumSq = 0.0;
		int nValid = 0;
		for (size_t m = 0; m < nMembers; m++) {
			float dValue = dMembers(m,t,p);
			if (!IsFillValue(dValue)) {
				double dDiff = dValue - dMean(t,p);
				dSumSq += dDiff * dDiff;
				nValid++;
			}
		}
		dStd(t,p) = static_cast<float>(
			sqrt(dSumSq / static_cast<double>(nValid)));
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::SignAgreement(
	const DataArray3D<float> & dMembers,
	const DataArray2D<float> & dPercent,
	DataArray2D<float> & dAgree
) const {
	const size_t nMembers = dMembers.GetSize(0);
	const size_t nTimes = dMembers.GetSize(1);
	const size_t nPoints = dMembers.GetSize(2);

	m_param.Validate(static_cast<int>(nTimes));

	// Reference period mean of each member
	DataArray2D<float> dReference(nMembers, nPoints);
	for (size_t m = 0; m < nMembers; m++) {
	for (size_t p = 0; p < nPoints; p++) {
		double dSum = 0.0;
		int nValid = 0;
		for (int t = m_param.iReferenceBegin; t < m_param.iReferenceEnd; t++) {
			float dValue = dMembers(m,t,p);
			if (!IsFillValue(dValue)) {
				dSum += dValue;
				nValid++;
			}
		}
		if (nValid == 0) {
			dReference(m,p) = FillValue;
		} else {
			dReference(m,p) = static_cast<float>(dSum / static_cast<double>(nValid));
		}
	}
	}

	dAgree.Allocate(nTimes, nPoints);

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t p = 0; p < nPoints; p++) {
		dAgree(t,p) = FillValue;
		if (IsFillValue(dPercent(t,p))) {
			continue;
		}

		double dSum = 0.0;
		int nValid = 0;
		for (size_t m = 0; m < nMembers; m++) {
			float dValue = dMembers(m,t,p);
			if (IsFillValue(dValue) || IsFillValue(dReference(m,p))) {
				continue;
			}
			dSum += copysign(1.0, static_cast<double>(dValue - dReference(m,p)));
			nValid++;
		}
		if (nValid != 0) {
			dAgree(t,p) = static_cast<float>(dSum / static_cast<double>(nValid));
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::ComputeBowlLimit(
	const DataArray3D<float> & dBowlSigma,
	DataArray1D<float> & dLimit
) const {
	const size_t nMembers = dBowlSigma.GetSize(0);
	const size_t nTimes = dBowlSigma.GetSize(1);
	const size_t nPoints = dBowlSigma.GetSize(2);

	dLimit.Allocate(nPoints);

	for (size_t p = 0; p < nPoints; p++) {
		double dTimeSum = 0.0;
		int nTimeValid = 0;

		for (size_t t = 0; t < nTimes; t++) {
			double dSum = 0.0;
			int nValid = 0;
			for (size_t m = 0; m < nMembers; m++) {
				float dValue = dBowlSigma(m,t,p);
				if (!IsFillValue(dValue)) {
					dSum += dValue;
					nValid++;
				}
			}
			if (nValid != 0) {
				dTimeSum += dSum / static_cast<double>(nValid);
				nTimeValid++;
			}
		}

		if (nTimeValid == 0) {
			dLimit(p) = FillValue;
		} else {
			dLimit(p) = static_cast<float>(
				dTimeSum / static_cast<double>(nTimeValid));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleAverager::TruncateAboveBowl(
	const std::vector<double> & vecSigma,
	size_t sBasins,
	size_t sLatitudes,
	const DataArray1D<float> & dLimit,
	DataArray2D<float> & dField
) const {
	const size_t nLevels = vecSigma.size();
	const size_t nTimes = dField.GetSize(0);

	if (dField.GetSize(1) != sBasins * nLevels * sLatitudes) {
		_EXCEPTION4("Field of %lu points is not (%lu basins x %lu levels x %lu lat)",
			dField.GetSize(1), sBasins, nLevels, sLatitudes);
	}
	if (dLimit.GetSize(0) != sBasins * sLatitudes) {
		_EXCEPTION3("Bowl limit of %lu points is not (%lu basins x %lu lat)",
			dLimit.GetSize(0), sBasins, sLatitudes);
	}

	for (size_t b = 0; b < sBasins; b++) {
	for (size_t j = 0; j < sLatitudes; j++) {
		float dSigmaLimit = dLimit(b * sLatitudes + j);

		// First level at or below the bowl is kept
		size_t kKeep = nLevels;
		if (!IsFillValue(dSigmaLimit)) {
			for (size_t k = 0; k < nLevels; k++) {
				if (vecSigma[k] >= dSigmaLimit) {
					kKeep = k;
					break;
				}
			}
		}

		for (size_t k = 0; k < kKeep; k++) {
			size_t p = (b * nLevels + k) * sLatitudes + j;
			for (size_t t = 0; t < nTimes; t++) {
				dField(t,p) = FillValue;
			}
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

