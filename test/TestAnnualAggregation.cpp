///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestAnnualAggregation.cpp
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

#include "AnnualAggregation.h"
#include "RegridMap.h"
#include "BasinMask.h"
#include "DensityGrid.h"
#include "Constants.h"
#include "Defines.h"
#include "Exception.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Four density levels (20, 20.5, 21, 21.5) and a year of binned data
///		on two cells, the second of which is land.
///	</summary>
class AnnualAggregationTest : public ::testing::Test {
protected:
	AnnualAggregationTest() :
		m_grid(MakeGridParameters())
	{
		const size_t nLevels = m_grid.size();

		m_chunk.Allocate(MonthsPerYear, nLevels + 1, 2);

		for (int m = 0; m < MonthsPerYear; m++) {
			for (size_t s = 0; s < nLevels; s++) {
				m_chunk.dDepth(m,s,0) = static_cast<float>(10.0 * (s+1) + m);
				m_chunk.dTheta(m,s,0) = 5.0f;
				m_chunk.dSalt(m,s,0) = 35.0f;
				m_chunk.dThick(m,s,0) = 10.0f;
			}
			// Lightest level only occupied half the year
			if (m < 6) {
				m_chunk.dThick(m,0,0) = FillValue;
			}
		}
	}

	static DensityGridParameters MakeGridParameters() {
		DensityGridParameters param;
		param.dMin = 20.0;
		param.dIntermediate = 21.0;
		param.dMax = 22.0;
		param.dDeltaFine = 0.5;
		param.dDeltaCoarse = 0.5;
		return param;
	}

	DensityGrid m_grid;
	BinnedChunk m_chunk;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(AnnualAggregationTest, AnnualMeanAndPersistence) {
	AnnualAggregator aggregator(m_grid);
	AnnualFields annual;
	aggregator.Aggregate(m_chunk, 0, annual);

	ASSERT_EQ(annual.dDepth.GetSize(0), m_grid.size());
	ASSERT_EQ(annual.GetCellCount(), 2u);

	for (size_t s = 0; s < m_grid.size(); s++) {
		EXPECT_NEAR(annual.dDepth(s,0), 10.0 * (s+1) + 5.5, 1.0e-5);
		EXPECT_FLOAT_EQ(annual.dTheta(s,0), 5.0f);
		EXPECT_FLOAT_EQ(annual.dThick(s,0), 10.0f);
	}
	EXPECT_NEAR(annual.dPersist(0,0), 50.0, 1.0e-5);
	EXPECT_NEAR(annual.dPersist(1,0), 100.0, 1.0e-5);

	EXPECT_TRUE(IsFillValue(annual.dDepth(0,1)));
	EXPECT_TRUE(IsFillValue(annual.dPersist(0,1)));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(AnnualAggregationTest, BowlIsShallowestPersistentLevel) {
	AnnualAggregator aggregator(m_grid);
	AnnualFields annual;
	aggregator.Aggregate(m_chunk, 0, annual);

	EXPECT_NEAR(annual.dBowlDepth(0), 25.5, 1.0e-5);
	EXPECT_NEAR(annual.dBowlSigma(0), 20.5, 1.0e-5);
	EXPECT_FLOAT_EQ(annual.dBowlTheta(0), 5.0f);
	EXPECT_FLOAT_EQ(annual.dBowlSalt(0), 35.0f);

	EXPECT_TRUE(IsFillValue(annual.dBowlDepth(1)));
	EXPECT_TRUE(IsFillValue(annual.dBowlSigma(1)));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(AnnualAggregationTest, PersistentFractionWeightedByThickness) {
	AnnualAggregator aggregator(m_grid);
	AnnualFields annual;
	aggregator.Aggregate(m_chunk, 0, annual);

	EXPECT_NEAR(annual.dPersistentFraction(0), 87.5, 1.0e-4);
	EXPECT_TRUE(IsFillValue(annual.dPersistentFraction(1)));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(AnnualAggregationTest, NoPersistentLevelLeavesBowlUndefined) {
	for (int m = 0; m < 6; m++) {
		for (size_t s = 0; s < m_grid.size(); s++) {
			m_chunk.dThick(m,s,0) = FillValue;
		}
	}

	AnnualAggregator aggregator(m_grid);
	AnnualFields annual;
	aggregator.Aggregate(m_chunk, 0, annual);

	EXPECT_TRUE(IsFillValue(annual.dBowlDepth(0)));
	EXPECT_TRUE(IsFillValue(annual.dBowlSigma(0)));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(AnnualAggregationTest, YearBeyondChunkThrows) {
	AnnualAggregator aggregator(m_grid);
	AnnualFields annual;
	EXPECT_THROW(aggregator.Aggregate(m_chunk, 1, annual), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(RegridMapTest, IdentityCopies) {
	std::vector<double> vecLat(2);
	std::vector<double> vecLon(2);

	RegridMap map;
	map.InitializeIdentity(vecLat, vecLon);

	float dIn[4] = { 1.0f, FillValue, 3.0f, 4.0f };
	float dOut[4];
	map.Apply(dIn, dOut);

	EXPECT_TRUE(map.IsIdentity());
	EXPECT_FLOAT_EQ(dOut[0], 1.0f);
	EXPECT_TRUE(IsFillValue(dOut[1]));
	EXPECT_FLOAT_EQ(dOut[3], 4.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(RegridMapTest, MissingSourcesRenormalised) {
	std::vector<double> vecLat(1, 0.0);
	std::vector<double> vecLon(2);
	vecLon[1] = 180.0;

	RegridMap map;
	map.InitializeEmpty(3, vecLat, vecLon);
	map.AddWeight(0, 0, 0.5);
	map.AddWeight(0, 1, 0.5);
	map.AddWeight(1, 2, 1.0);

	DataArray2D<float> dIn(2, 3);
	dIn(0,0) = 1.0f;
	dIn(0,1) = FillValue;
	dIn(0,2) = 4.0f;
	dIn(1,0) = FillValue;
	dIn(1,1) = FillValue;
	dIn(1,2) = 2.0f;

	DataArray2D<float> dOut;
	map.Apply(dIn, dOut);

	ASSERT_EQ(dOut.GetSize(0), 2u);
	ASSERT_EQ(dOut.GetSize(1), 2u);
	EXPECT_FLOAT_EQ(dOut(0,0), 1.0f);
	EXPECT_FLOAT_EQ(dOut(0,1), 4.0f);
	EXPECT_TRUE(IsFillValue(dOut(1,0)));
	EXPECT_FLOAT_EQ(dOut(1,1), 2.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST(RegridMapTest, WeightOutOfRangeThrows) {
	std::vector<double> vecLat(1, 0.0);
	std::vector<double> vecLon(2);

	RegridMap map;
	map.InitializeEmpty(3, vecLat, vecLon);
	EXPECT_THROW(map.AddWeight(2, 0, 1.0), Exception);
	EXPECT_THROW(map.AddWeight(0, 3, 1.0), Exception);

	DataArray2D<float> dWrongSize(1, 4);
	DataArray2D<float> dOut;
	EXPECT_THROW(map.Apply(dWrongSize, dOut), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(CellAreaTest, InteriorAndPolarRows) {
	std::vector<double> vecLat;
	for (int j = 0; j < 5; j++) {
		vecLat.push_back(-60.0 + 30.0 * j);
	}
	std::vector<double> vecLon;
	for (int i = 0; i < 4; i++) {
		vecLon.push_back(10.0 * i);
	}

	DataArray2D<double> dArea;
	ComputeCellArea(vecLon, vecLat, dArea);

	const double dDegToRad = M_PI / 180.0;
	const double dR2 = EarthRadius * EarthRadius;

	double dEquator = dR2 * (10.0 * dDegToRad) * 2.0 * sin(15.0 * dDegToRad);
	EXPECT_NEAR(dArea(2,1) / dEquator, 1.0, 1.0e-12);
	EXPECT_NEAR(dArea(2,0) / dEquator, 1.0, 1.0e-12);
	EXPECT_NEAR(dArea(2,3) / dEquator, 1.0, 1.0e-12);

	double dSouth = dR2 * (10.0 * dDegToRad)
		* (sin(-45.0 * dDegToRad) - sin(-75.0 * dDegToRad));
	EXPECT_NEAR(dArea(0,1) / dSouth, 1.0, 1.0e-12);
	EXPECT_NEAR(dArea(4,2) / dArea(0,1), 1.0, 1.0e-12);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A 2 x 3 target grid with codes
///		  lat 0: atlantic, pacific, land
///		  lat 1: indian, other ocean, atlantic
///	</summary>
class ZonalAveragerTest : public ::testing::Test {
protected:
	ZonalAveragerTest() {
		float dCodes[6] = { 1.0f, 2.0f, FillValue, 3.0f, 0.0f, 1.0f };
		m_mask.Initialize(dCodes, 2, 3);

		m_dArea.Allocate(2, 3);
		for (size_t j = 0; j < 2; j++) {
			for (size_t i = 0; i < 3; i++) {
				m_dArea(j,i) = 1.0e12 * static_cast<double>(i + 1);
			}
		}
	}

	BasinMask m_mask;
	DataArray2D<double> m_dArea;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(ZonalAveragerTest, BasinMembership) {
	EXPECT_TRUE(m_mask.Contains(BasinGlobal, 0));
	EXPECT_FALSE(m_mask.Contains(BasinGlobal, 2));
	EXPECT_TRUE(m_mask.Contains(BasinGlobal, 4));
	EXPECT_TRUE(m_mask.Contains(BasinAtlantic, 5));
	EXPECT_FALSE(m_mask.Contains(BasinAtlantic, 4));
	EXPECT_TRUE(m_mask.Contains(BasinIndian, 3));
	EXPECT_STREQ(BasinName(BasinPacific), "pacific");
	EXPECT_THROW(BasinName(BasinCount), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(ZonalAveragerTest, ZonalMeanPerBasin) {
	ZonalAverager zonal(m_mask, m_dArea);

	DataArray2D<float> dField(1, 6);
	dField(0,0) = 1.0f;
	dField(0,1) = 2.0f;
	dField(0,2) = 99.0f;
	dField(0,3) = 3.0f;
	dField(0,4) = 4.0f;
	dField(0,5) = 5.0f;

	DataArray3D<float> dZonal;
	zonal.ZonalMean(dField, dZonal);

	ASSERT_EQ(dZonal.GetSize(0), static_cast<size_t>(BasinCount));
	EXPECT_FLOAT_EQ(dZonal(BasinGlobal,0,0), 1.5f);
	EXPECT_FLOAT_EQ(dZonal(BasinGlobal,0,1), 4.0f);
	EXPECT_FLOAT_EQ(dZonal(BasinAtlantic,0,0), 1.0f);
	EXPECT_FLOAT_EQ(dZonal(BasinAtlantic,0,1), 5.0f);
	EXPECT_FLOAT_EQ(dZonal(BasinPacific,0,0), 2.0f);
	EXPECT_TRUE(IsFillValue(dZonal(BasinPacific,0,1)));
	EXPECT_TRUE(IsFillValue(dZonal(BasinIndian,0,0)));
	EXPECT_FLOAT_EQ(dZonal(BasinIndian,0,1), 3.0f);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(ZonalAveragerTest, VolumeFromZonalArea) {
	ZonalAverager zonal(m_mask, m_dArea);

	EXPECT_DOUBLE_EQ(zonal.GetZonalArea(BasinGlobal, 0), 3.0e12);
	EXPECT_DOUBLE_EQ(zonal.GetZonalArea(BasinGlobal, 1), 6.0e12);
	EXPECT_DOUBLE_EQ(zonal.GetZonalArea(BasinAtlantic, 1), 3.0e12);

	DataArray3D<float> dThick(BasinCount, 1, 2);
	dThick.Fill(2.0f);
	dThick(BasinIndian,0,0) = FillValue;

	DataArray3D<float> dVolume;
	zonal.ZonalVolume(dThick, dVolume);

	EXPECT_NEAR(dVolume(BasinGlobal,0,1), 12.0f, 1.0e-5);
	EXPECT_NEAR(dVolume(BasinAtlantic,0,1), 6.0f, 1.0e-5);
	EXPECT_TRUE(IsFillValue(dVolume(BasinIndian,0,0)));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(ZonalAveragerTest, AreaShapeMismatchThrows) {
	DataArray2D<double> dArea(3, 2);
	EXPECT_THROW(ZonalAverager zonal(m_mask, dArea), Exception);
}

///////////////////////////////////////////////////////////////////////////////

