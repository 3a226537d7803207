///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestTimeOfEmergence.cpp
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

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Ten time steps at four points with unit noise and multiplier 2.
///	</summary>
class TimeOfEmergenceTest : public ::testing::Test {
protected:
	TimeOfEmergenceTest() :
		m_dSignal(10, 4),
		m_dNoise(4)
	{
		m_param.dMultiplier = 2.0;
		m_param.iReferenceBegin = 0;
		m_param.iReferenceEnd = 3;
		m_dNoise.Fill(1.0f);
	}

	EmergenceParameters m_param;
	DataArray2D<float> m_dSignal;
	DataArray1D<float> m_dNoise;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(TimeOfEmergenceTest, BoundaryCases) {
	for (size_t t = 0; t < 10; t++) {
		// Always above threshold
		m_dSignal(t,0) = 5.0f;

		// Never above threshold
		m_dSignal(t,1) = 1.0f;

		// Crosses at step 6 and stays above
		m_dSignal(t,2) = (t >= 6)?(-3.0f):(0.5f);

		// Only the final step exceeds
		m_dSignal(t,3) = (t == 9)?(2.0f):(0.0f);
	}

	EmergenceDetector detector(m_param);

	DataArray1D<int> nToE;
	detector.FindTimeOfEmergence(m_dSignal, m_dNoise, nToE);

	EXPECT_EQ(nToE(0), 0);
	EXPECT_EQ(nToE(1), 10);
	EXPECT_EQ(nToE(2), 6);
	EXPECT_EQ(nToE(3), 9);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(TimeOfEmergenceTest, IntermittentCrossingUsesLastSustained) {
	const float dSeries[10] = {
		0.0f, 3.0f, 3.0f, 0.0f, 3.0f, 0.0f, 3.0f, 3.0f, 3.0f, 3.0f };

	for (size_t t = 0; t < 10; t++) {
		for (size_t p = 0; p < 4; p++) {
			m_dSignal(t,p) = dSeries[t];
		}
	}

	// Missing value breaks the final run at point 1
	m_dSignal(7,1) = FillValue;

	// Missing noise at point 2
	m_dNoise(2) = FillValue;

	EmergenceDetector detector(m_param);

	DataArray1D<int> nToE;
	detector.FindTimeOfEmergence(m_dSignal, m_dNoise, nToE);

	EXPECT_EQ(nToE(0), 6);
	EXPECT_EQ(nToE(1), 8);
	EXPECT_EQ(nToE(2), ToEMissing);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(TimeOfEmergenceTest, NoiseShapeMismatchThrows) {
	DataArray1D<float> dNoise(3);
	DataArray1D<int> nToE;

	EmergenceDetector detector(m_param);
	EXPECT_THROW(detector.FindTimeOfEmergence(m_dSignal, dNoise, nToE), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(TimeOfEmergenceTest, ReferenceAnomalyAndNoise) {
	for (size_t t = 0; t < 10; t++) {
		m_dSignal(t,0) = static_cast<float>(t);
		m_dSignal(t,1) = (t % 2 == 0)?(1.0f):(3.0f);
		m_dSignal(t,2) = FillValue;
		m_dSignal(t,3) = 7.0f;
	}
	m_dSignal(1,3) = FillValue;

	EmergenceDetector detector(m_param);

	DataArray1D<float> dNoise;
	detector.ReferenceNoise(m_dSignal, dNoise);

	EXPECT_NEAR(dNoise(0), sqrt(2.0 / 3.0), 1.0e-6);
	EXPECT_TRUE(IsFillValue(dNoise(2)));
	EXPECT_FLOAT_EQ(dNoise(3), 0.0f);

	detector.ReferenceAnomaly(m_dSignal);

	EXPECT_FLOAT_EQ(m_dSignal(0,0), -1.0f);
	EXPECT_FLOAT_EQ(m_dSignal(9,0), 8.0f);
	EXPECT_TRUE(IsFillValue(m_dSignal(5,2)));
	EXPECT_TRUE(IsFillValue(m_dSignal(1,3)));
	EXPECT_FLOAT_EQ(m_dSignal(2,3), 0.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(TemporalStandardDeviationTest, PopulationStatistic) {
	DataArray2D<float> dField(4, 1);
	dField(0,0) = 1.0f;
	dField(1,0) = 3.0f;
	dField(2,0) = FillValue;
	dField(3,0) = 100.0f;

	DataArray1D<float> dStd;
	EmergenceDetector::TemporalStandardDeviation(dField, 0, 3, dStd);
	EXPECT_FLOAT_EQ(dStd(0), 1.0f);

	EXPECT_THROW(
		EmergenceDetector::TemporalStandardDeviation(dField, 2, 5, dStd),
		Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EmergenceDomainTest, AverageOverInclusiveBox) {
	std::vector<double> vecSigma;
	vecSigma.push_back(26.0);
	vecSigma.push_back(27.0);
	vecSigma.push_back(28.0);

	std::vector<double> vecLat;
	vecLat.push_back(-30.0);
	vecLat.push_back(0.0);
	vecLat.push_back(30.0);

	// Two basins, three levels, three latitudes, one time step
	DataArray2D<float> dField(1, 2 * 3 * 3);
	for (size_t p = 0; p < dField.GetSize(1); p++) {
		dField(0,p) = static_cast<float>(p);
	}
	dField(0, (1 * 3 + 1) * 3 + 1) = FillValue;

	EmergenceDomain domain;
	domain.FromString("0,30,27,28");

	DataArray1D<float> dSeries;
	EmergenceDetector::AverageOverDomain(dField, 1, vecSigma, vecLat, domain, dSeries);

	// Basin 1 points (k,j) in {1,2} x {1,2}, with (1,1) missing
	double dExpected =
		( ((1*3 + 1) * 3 + 2)
		+ ((1*3 + 2) * 3 + 1)
		+ ((1*3 + 2) * 3 + 2)) / 3.0;

	ASSERT_EQ(dSeries.GetSize(0), 1u);
	EXPECT_NEAR(dSeries(0), dExpected, 1.0e-5);

	EXPECT_THROW(
		EmergenceDetector::AverageOverDomain(dField, 2, vecSigma, vecLat, domain, dSeries),
		Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EmergenceDomainTest, ParseList) {
	std::vector<EmergenceDomain> vecDomains;
	EmergenceDomain::ParseList("-40,-20,25.5,26.5;20,40,26,27", vecDomains);

	ASSERT_EQ(vecDomains.size(), 2u);
	EXPECT_DOUBLE_EQ(vecDomains[0].dLatMin, -40.0);
	EXPECT_DOUBLE_EQ(vecDomains[0].dSigmaMax, 26.5);
	EXPECT_TRUE(vecDomains[1].Contains(20.0, 27.0));
	EXPECT_FALSE(vecDomains[1].Contains(19.9, 26.5));

	EmergenceDomain domain;
	EXPECT_THROW(domain.FromString("0,30,27"), Exception);
	EXPECT_THROW(domain.FromString("30,0,27,28"), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(EmergenceParametersTest, Validation) {
	EmergenceParameters param;
	param.iReferenceBegin = 0;
	param.iReferenceEnd = 5;
	EXPECT_NO_THROW(param.Validate(5));
	EXPECT_THROW(param.Validate(4), Exception);

	param.dMultiplier = 0.0;
	EXPECT_THROW(param.Validate(5), Exception);
}

///////////////////////////////////////////////////////////////////////////////

