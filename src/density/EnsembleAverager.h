///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleAverager.h
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

#ifndef _ENSEMBLEAVERAGER_H_
#define _ENSEMBLEAVERAGER_H_

#include "DataArray1D.h"
#include "DataArray2D.h"
#include "DataArray3D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parameters of the ensemble aggregation.
///	</summary>
struct EnsembleParameters {

	EnsembleParameters() :
		dCoverageThreshold(50.0),
		fMultiModel(false),
		iReferenceBegin(0),
		iReferenceEnd(0)
	{ }

	///	<summary>
	///		Throw an Exception if the parameters are inconsistent with a
	///		series of the given number of time steps.
	///	</summary>
	void Validate(int nTimes) const;

	///	<summary>
	///		Minimum percentage of valid members for a point to be kept.
	///	</summary>
	double dCoverageThreshold;

	///	<summary>
	///		Members are themselves ensemble means carrying Agree and Bowl
	///		fields.
	///	</summary>
	bool fMultiModel;

	///	<summary>
	///		Reference period [iReferenceBegin, iReferenceEnd) of the sign
	///		agreement, as indices into the selected years.
	///	</summary>
	int iReferenceBegin;
	int iReferenceEnd;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Description of an aggregated variable and the value that stands in
///		for missing member data in the ensemble mean.
///	</summary>
struct EnsembleVariable {

	EnsembleVariable(
		const std::string & strNameIn,
		bool fZeroFillIn
	) :
		strName(strNameIn),
		fZeroFill(fZeroFillIn)
	{ }

	///	<summary>
	///		Variable name.
	///	</summary>
	std::string strName;

	///	<summary>
	///		Missing member data counts as zero in the mean.
	///	</summary>
	bool fZeroFill;
};

///	<summary>
///		Zonal (time, basin, density, lat) variables aggregated by the
///		ensemble tool.
///	</summary>
void GetEnsembleZonalVariables(
	std::vector<EnsembleVariable> & vecVariables
);

///	<summary>
///		Bowl (time, basin, lat) variables aggregated by the ensemble tool.
///	</summary>
void GetEnsembleBowlVariables(
	std::vector<EnsembleVariable> & vecVariables
);

///	<summary>
///		Names of every member variable read by the ensemble tool: the
///		aggregated variables and, for multi-model members, their Agree
///		fields (and Bowl fields of zonal variables).
///	</summary>
void GetEnsembleMemberVariables(
	bool fMultiModel,
	std::vector<std::string> & vecZonalNames,
	std::vector<std::string> & vecBowlNames
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Dimension sizes shared by all members: the full time axis and the
///		sizes of the remaining dimensions of zonal variables.
///	</summary>
struct EnsembleShape {

	EnsembleShape() :
		lTimes(0),
		lBasins(0),
		lLevels(0),
		lLatitudes(0)
	{ }

	///	<summary>
	///		Throw an Exception unless vecDimSizes matches this shape, as
	///		(time, basin, rho, lat) for zonal variables or (time, basin, lat)
	///		for bowl variables.
	///	</summary>
	void CheckDimensions(
		const std::string & strFile,
		const std::string & strVarName,
		bool fZonal,
		const std::vector<long> & vecDimSizes
	) const;

	long lTimes;
	long lBasins;
	long lLevels;
	long lLatitudes;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Combines member fields, stacked (member, time, point), into masked
///		ensemble statistics on (time, point).  Zonal points are flattened
///		(basin, level, lat) and bowl points (basin, lat).
///	</summary>
class EnsembleAverager {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	explicit EnsembleAverager(
		const EnsembleParameters & param
	);

public:
	///	<summary>
	///		Replace missing member values with zero.
	///	</summary>
	static void ZeroFillMissing(
		DataArray3D<float> & dMembers
	);

	///	<summary>
	///		Percentage of members with valid data, FillValue where below
	///		the coverage threshold.
	///	</summary>
	void ComputeCoverage(
		const DataArray3D<float> & dMembers,
		DataArray2D<float> & dPercent
	) const;

	///	<summary>
	///		Mean over valid members, masked where coverage is insufficient.
	///	</summary>
	void Mean(
		const DataArray3D<float> & dMembers,
		const DataArray2D<float> & dPercent,
		DataArray2D<float> & dMean
	) const;

	///	<summary>
	///		Population standard deviation over valid members, masked where
	///		coverage is insufficient.
	///	</summary>
	void StandardDeviation(
		const DataArray3D<float> & dMembers,
		const DataArray2D<float> & dPercent,
		DataArray2D<float> & dStd
	) const;

	///	<summary>
	///		Mean over valid members of the sign of each member's departure
	///		from its own reference period mean.
	///	</summary>
	void SignAgreement(
		const DataArray3D<float> & dMembers,
		const DataArray2D<float> & dPercent,
		DataArray2D<float> & dAgree
	) const;

	///	<summary>
	///		Bowl density limit per (basin, lat) point: the time mean of the
	///		member mean of the bowl density.
	///	</summary>
	void ComputeBowlLimit(
		const DataArray3D<float> & dBowlSigma,
		DataArray1D<float> & dLimit
	) const;

	///	<summary>
	///		Mask every level lighter than the bowl limit of its column; the
	///		whole column is masked where the limit is undefined.
	///	</summary>
	void TruncateAboveBowl(
		const std::vector<double> & vecSigma,
		size_t sBasins,
		size_t sLatitudes,
		const DataArray1D<float> & dLimit,
		DataArray2D<float> & dField
	) const;

	///	<summary>
	///		Parameters.
	///	</summary>
	const EnsembleParameters & GetParameters() const {
		return m_param;
	}

protected:
	///	<summary>
	///		Parameters.
	///	</summary>
	EnsembleParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

#endif

