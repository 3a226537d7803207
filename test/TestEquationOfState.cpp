///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestEquationOfState.cpp
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

#include <gtest/gtest.h>

#include <vector>

///////////////////////////////////////////////////////////////////////////////

TEST(EquationOfStateTest, ReferenceValue) {
	EXPECT_NEAR(NeutralDensity(20.0, 35.0), 1024.5941675119673, 1.0e-9);
	EXPECT_NEAR(NeutralDensity(0.0, 35.0), 1028.4528058594997, 1.0e-9);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EquationOfStateTest, DensityIncreasesWithSalinityAndCooling) {
	EXPECT_GT(NeutralDensity(10.0, 36.0), NeutralDensity(10.0, 34.0));
	EXPECT_GT(NeutralDensity(2.0, 35.0), NeutralDensity(20.0, 35.0));
}

///////////////////////////////////////////////////////////////////////////////

TEST(EquationOfStateTest, SigmaMasksMissingInput) {
	float dTheta[4] = { 20.0f, FillValue, 20.0f, 20.0f };
	float dSalt[4]  = { 35.0f, 35.0f, FillValue, -1.0f };
	float dSigma[4];

	NeutralDensitySigma(dTheta, dSalt, dSigma, 4);

	EXPECT_NEAR(dSigma[0], 24.5941675, 1.0e-4);
	EXPECT_TRUE(IsFillValue(dSigma[1]));
	EXPECT_TRUE(IsFillValue(dSigma[2]));
	EXPECT_TRUE(IsFillValue(dSigma[3]));
}

///////////////////////////////////////////////////////////////////////////////

TEST(EquationOfStateTest, KelvinTemperatureIsConverted) {
	float dTheta[3] = { 293.15f, FillValue, 275.15f };

	EXPECT_TRUE(CorrectTemperatureUnits(dTheta, 3));
	EXPECT_NEAR(dTheta[0], 20.0f, 1.0e-3);
	EXPECT_TRUE(IsFillValue(dTheta[1]));
	EXPECT_NEAR(dTheta[2], 2.0f, 1.0e-3);

	EXPECT_FALSE(CorrectTemperatureUnits(dTheta, 3));
}

///////////////////////////////////////////////////////////////////////////////

TEST(EquationOfStateTest, SalinityFractionIsConverted) {
	float dSalt[3] = { 0.035f, FillValue, 0.034f };

	EXPECT_TRUE(CorrectSalinityUnits(dSalt, 3));
	EXPECT_NEAR(dSalt[0], 35.0f, 1.0e-3);
	EXPECT_NEAR(dSalt[2], 34.0f, 1.0e-3);

	EXPECT_FALSE(CorrectSalinityUnits(dSalt, 3));
}

///////////////////////////////////////////////////////////////////////////////

