///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestEnsembleAverager.cpp
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

#include <gtest/gtest.h>

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, CoverageBelowHalfIsMasked) {
	DataArray3D<float> dMembers(3, 1, 2);
	dMembers(0,0,0) = 1.0f;
	dMembers(1,0,0) = FillValue;
	dMembers(2,0,0) = FillValue;
	dMembers(0,0,1) = 1.0f;
	dMembers(1,0,1) = 2.0f;
	dMembers(2,0,1) = FillValue;

	EnsembleAverager averager((EnsembleParameters()));

	DataArray2D<float> dPercent;
	averager.ComputeCoverage(dMembers, dPercent);

	EXPECT_TRUE(IsFillValue(dPercent(0,0)));
	EXPECT_NEAR(dPercent(0,1), 200.0 / 3.0, 1.0e-4);

	DataArray2D<float> dMean;
	averager.Mean(dMembers, dPercent, dMean);

	EXPECT_TRUE(IsFillValue(dMean(0,0)));
	EXPECT_FLOAT_EQ(dMean(0,1), 1.5f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, ZeroFillCountsMissingMembers) {
	DataArray3D<float> dMembers(3, 1, 1);
	dMembers(0,0,0) = 3.0f;
	dMembers(1,0,0) = FillValue;
	dMembers(2,0,0) = FillValue;

	EnsembleAverager::ZeroFillMissing(dMembers);

	EnsembleAverager averager((EnsembleParameters()));

	DataArray2D<float> dPercent;
	averager.ComputeCoverage(dMembers, dPercent);
	EXPECT_FLOAT_EQ(dPercent(0,0), 100.0f);

	DataArray2D<float> dMean;
	averager.Mean(dMembers, dPercent, dMean);
	EXPECT_FLOAT_EQ(dMean(0,0), 1.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, SignAgreementAgainstReferencePeriod) {
	const float dRun0[4] = { 0.0f, 2.0f, 5.0f, 5.0f };
	const float dRun1[4] = { 0.0f, 2.0f, -3.0f, 4.0f };

	DataArray3D<float> dMembers(2, 4, 1);
	for (size_t t = 0; t < 4; t++) {
		dMembers(0,t,0) = dRun0[t];
		dMembers(1,t,0) = dRun1[t];
	}

	EnsembleParameters param;
	param.iReferenceBegin = 0;
	param.iReferenceEnd = 2;
	EnsembleAverager averager(param);

	DataArray2D<float> dPercent;
	averager.ComputeCoverage(dMembers, dPercent);

	DataArray2D<float> dAgree;
	averager.SignAgreement(dMembers, dPercent, dAgree);

	EXPECT_FLOAT_EQ(dAgree(0,0), -1.0f);
	EXPECT_FLOAT_EQ(dAgree(1,0), 1.0f);
	EXPECT_FLOAT_EQ(dAgree(2,0), 0.0f);
	EXPECT_FLOAT_EQ(dAgree(3,0), 1.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, InvalidReferencePeriodThrows) {
	DataArray3D<float> dMembers(2, 4, 1);
	DataArray2D<float> dPercent(4, 1);
	DataArray2D<float> dAgree;

	EnsembleParameters param;
	param.iReferenceBegin = 2;
	param.iReferenceEnd = 6;
	EnsembleAverager averager(param);

	EXPECT_THROW(averager.SignAgreement(dMembers, dPercent, dAgree), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, StandardDeviationOverMembers) {
	DataArray3D<float> dMembers(3, 1, 1);
	dMembers(0,0,0) = 1.0f;
	dMembers(1,0,0) = 3.0f;
	dMembers(2,0,0) = FillValue;

	EnsembleAverager averager((EnsembleParameters()));

	DataArray2D<float> dPercent;
	averager.ComputeCoverage(dMembers, dPercent);

	DataArray2D<float> dStd;
	averager.StandardDeviation(dMembers, dPercent, dStd);
	EXPECT_FLOAT_EQ(dStd(0,0), 1.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, BowlLimitIsTimeMeanOfMemberMean) {
	DataArray3D<float> dBowlSigma(2, 2, 2);
	dBowlSigma(0,0,0) = 26.0f;
	dBowlSigma(1,0,0) = 26.5f;
	dBowlSigma(0,1,0) = 27.0f;
	dBowlSigma(1,1,0) = FillValue;
	dBowlSigma(0,0,1) = FillValue;
	dBowlSigma(0,1,1) = FillValue;
	dBowlSigma(1,0,1) = FillValue;
	dBowlSigma(1,1,1) = FillValue;

	EnsembleAverager averager((EnsembleParameters()));

	DataArray1D<float> dLimit;
	averager.ComputeBowlLimit(dBowlSigma, dLimit);

	EXPECT_NEAR(dLimit(0), 26.625, 1.0e-5);
	EXPECT_TRUE(IsFillValue(dLimit(1)));
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, TruncateMasksLevelsLighterThanBowl) {
	std::vector<double> vecSigma;
	vecSigma.push_back(25.0);
	vecSigma.push_back(26.0);
	vecSigma.push_back(27.0);
	vecSigma.push_back(28.0);

	// One basin, four levels, two latitudes
	DataArray2D<float> dField(1, 8);
	dField.Fill(1.0f);

	DataArray1D<float> dLimit(2);
	dLimit(0) = 26.5f;
	dLimit(1) = FillValue;

	EnsembleAverager averager((EnsembleParameters()));
	averager.TruncateAboveBowl(vecSigma, 1, 2, dLimit, dField);

	// Latitude 0 keeps levels at and below the bowl
	EXPECT_TRUE(IsFillValue(dField(0, 0*2 + 0)));
	EXPECT_TRUE(IsFillValue(dField(0, 1*2 + 0)));
	EXPECT_FLOAT_EQ(dField(0, 2*2 + 0), 1.0f);
	EXPECT_FLOAT_EQ(dField(0, 3*2 + 0), 1.0f);

	// Undefined bowl masks the column
	for (size_t k = 0; k < 4; k++) {
		EXPECT_TRUE(IsFillValue(dField(0, k*2 + 1)));
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, TruncateShapeMismatchThrows) {
	std::vector<double> vecSigma(4, 0.0);
	DataArray2D<float> dField(1, 7);
	DataArray1D<float> dLimit(2);

	EnsembleAverager averager((EnsembleParameters()));
	EXPECT_THROW(
		averager.TruncateAboveBowl(vecSigma, 1, 2, dLimit, dField),
		Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, VariableTables) {
	std::vector<EnsembleVariable> vecZonal;
	GetEnsembleZonalVariables(vecZonal);
	ASSERT_EQ(vecZonal.size(), 6u);
	EXPECT_EQ(vecZonal[0].strName, "isondepth");
	EXPECT_TRUE(vecZonal[0].fZeroFill);
	EXPECT_EQ(vecZonal[2].strName, "isonso");
	EXPECT_FALSE(vecZonal[2].fZeroFill);

	std::vector<EnsembleVariable> vecBowl;
	GetEnsembleBowlVariables(vecBowl);
	ASSERT_EQ(vecBowl.size(), 4u);
	for (size_t v = 0; v < vecBowl.size(); v++) {
		EXPECT_FALSE(vecBowl[v].fZeroFill);
	}
}

///////////////////////////////////////////////////////////////////////////////


TEST(EnsembleAveragerTest, MemberVariablesIncludeMultiModelFields) {
	std::vector<std::string> vecZonal;
	std::vector<std::string> vecBowl;

	GetEnsembleMemberVariables(false, vecZonal, vecBowl);
	EXPECT_EQ(vecZonal.size(), 6u);
	EXPECT_EQ(vecBowl.size(), 4u);

	GetEnsembleMemberVariables(true, vecZonal, vecBowl);
	ASSERT_EQ(vecZonal.size(), 18u);
	EXPECT_EQ(vecZonal[0], "isondepth");
	EXPECT_EQ(vecZonal[1], "isondepthAgree");
	EXPECT_EQ(vecZonal[2], "isondepthBowl");
	ASSERT_EQ(vecBowl.size(), 8u);
	EXPECT_EQ(vecBowl[0], "ptopdepth");
	EXPECT_EQ(vecBowl[1], "ptopdepthAgree");
}

///////////////////////////////////////////////////////////////////////////////

TEST(EnsembleAveragerTest, MemberShapeMismatchThrows) {
	EnsembleShape shape;
	shape.lTimes = 10;
	shape.lBasins = 4;
	shape.lLevels = 60;
	shape.lLatitudes = 180;

	std::vector<long> vecZonal;
	vecZonal.push_back(10);
	vecZonal.push_back(4);
	vecZonal.push_back(60);
	vecZonal.push_back(180);
	EXPECT_NO_THROW(shape.CheckDimensions("a.nc", "isondepth", true, vecZonal));

	std::vector<long> vecBowl;
	vecBowl.push_back(10);
	vecBowl.push_back(4);
	vecBowl.push_back(180);
	EXPECT_NO_THROW(shape.CheckDimensions("a.nc", "ptopdepth", false, vecBowl));

	// Different time axis
	std::vector<long> vecShortTime(vecZonal);
	vecShortTime[0] = 9;
	EXPECT_THROW(
		shape.CheckDimensions("b.nc", "isondepth", true, vecShortTime),
		Exception);

	// Different latitude count
	std::vector<long> vecOtherLat(vecBowl);
	vecOtherLat[2] = 90;
	EXPECT_THROW(
		shape.CheckDimensions("b.nc", "ptopdepth", false, vecOtherLat),
		Exception);

	// Zonal variable with bowl rank
	EXPECT_THROW(
		shape.CheckDimensions("b.nc", "isondepth", true, vecBowl),
		Exception);
}

///////////////////////////////////////////////////////////////////////////////
