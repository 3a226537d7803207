///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestIsopycnalBinning.cpp
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

#include "IsopycnalBinning.h"
#include "DensityGrid.h"
#include "Defines.h"
#include "Exception.h"

#include <gtest/gtest.h>

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Ten levels centred at 5, 15, ..., 95 m with cell bottoms at 10, 20,
///		..., 100 m, and a density grid from 20 to 31 every 0.5.
///	</summary>
class IsopycnalBinningTest : public ::testing::Test {
protected:
	IsopycnalBinningTest() :
		m_grid(MakeGridParameters())
	{
		for (int k = 0; k < 10; k++) {
			m_axis.vecDepth.push_back(5.0 + 10.0 * k);
			m_axis.vecDepthBottom.push_back(10.0 + 10.0 * k);
		}
		m_param.dStratificationThreshold = 0.5;
	}

	static DensityGridParameters MakeGridParameters() {
		DensityGridParameters param;
		param.dMin = 20.0;
		param.dIntermediate = 25.0;
		param.dMax = 31.0;
		param.dDeltaFine = 0.5;
		param.dDeltaCoarse = 0.5;
		return param;
	}

	///	<summary>
	///		Set a column's density profile directly, with temperature equal
	///		to depth and constant salinity so interpolation can be checked.
	///	</summary>
	void SetProfile(
		GridColumn & column,
		const std::vector<double> & vecSigma
	) {
		for (size_t k = 0; k < m_axis.size(); k++) {
			if (k < vecSigma.size()) {
				column.vecSigma[k] = vecSigma[k];
				column.vecTheta[k] = m_axis.vecDepth[k];
				column.vecSalt[k] = 35.0;
			} else {
				column.vecSigma[k] = FillValue;
				column.vecTheta[k] = FillValue;
				column.vecSalt[k] = FillValue;
			}
		}
	}

	///	<summary>
	///		Density 21, 22, ..., 30 on the ten levels.
	///	</summary>
	static std::vector<double> RegularProfile() {
		std::vector<double> vecSigma;
		for (int k = 0; k < 10; k++) {
			vecSigma.push_back(21.0 + k);
		}
		return vecSigma;
	}

	size_t LevelOf(double dSigma) const {
		return m_grid.FirstLevelAtOrAbove(dSigma - 1.0e-9);
	}

	VerticalAxis m_axis;
	DensityGrid m_grid;
	BinningParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, InterpolatesBetweenLevels) {
	GridColumn column(m_axis);
	SetProfile(column, RegularProfile());

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	size_t s = LevelOf(25.5);
	ASSERT_DOUBLE_EQ(m_grid[s], 25.5);
	EXPECT_NEAR(binned.vecDepth[s], 50.0, 1.0e-9);
	EXPECT_NEAR(binned.vecTheta[s], 50.0, 1.0e-9);
	EXPECT_NEAR(binned.vecSalt[s], 35.0, 1.0e-9);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, PinsOutOfRangeDensities) {
	GridColumn column(m_axis);
	SetProfile(column, RegularProfile());

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	// Lighter than the surface
	size_t sLight = LevelOf(20.0);
	EXPECT_DOUBLE_EQ(binned.vecDepth[sLight], 0.0);
	EXPECT_TRUE(IsFillValue(binned.vecTheta[sLight]));
	EXPECT_TRUE(IsFillValue(binned.vecThick[sLight]));

	// Denser than the bottom
	size_t sDense = LevelOf(30.5);
	EXPECT_DOUBLE_EQ(binned.vecDepth[sDense], 100.0);
	EXPECT_TRUE(IsFillValue(binned.vecTheta[sDense]));

	// Bottom sentinel level
	const size_t nLevels = m_grid.size();
	EXPECT_DOUBLE_EQ(binned.vecDepth[nLevels], 100.0);
	EXPECT_DOUBLE_EQ(binned.vecTheta[nLevels], 95.0);
	EXPECT_DOUBLE_EQ(binned.vecSalt[nLevels], 35.0);
	EXPECT_TRUE(IsFillValue(binned.vecThick[nLevels]));
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, MissingPropertyIsNotInterpolated) {
	GridColumn column(m_axis);
	SetProfile(column, RegularProfile());
	column.vecTheta[5] = FillValue;

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	// Between levels 4 and 5
	size_t s = LevelOf(25.5);
	EXPECT_NEAR(binned.vecDepth[s], 50.0, 1.0e-9);
	EXPECT_TRUE(IsFillValue(binned.vecTheta[s]));
	EXPECT_NEAR(binned.vecSalt[s], 35.0, 1.0e-9);
	EXPECT_TRUE(IsFillValue(binned.vecThick[s]));

	// Between levels 3 and 4 is unaffected
	size_t s2 = LevelOf(24.5);
	EXPECT_NEAR(binned.vecTheta[s2], 40.0, 1.0e-9);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, SampledDensitiesReproduceDepths) {
	GridColumn column(m_axis);
	SetProfile(column, RegularProfile());

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	for (int k = 0; k < 10; k++) {
		size_t s = LevelOf(21.0 + k);
		EXPECT_NEAR(binned.vecDepth[s], m_axis.vecDepth[k], 1.0e-9);
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, MonotonicProfileGivesNonDecreasingDepth) {
	const double dSigma[8] = { 22.1, 22.4, 23.9, 24.0, 26.2, 27.7, 28.3, 29.05 };

	GridColumn column(m_axis);
	SetProfile(column, std::vector<double>(dSigma, dSigma + 8));

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	for (size_t s = 1; s < m_grid.size(); s++) {
		ASSERT_FALSE(IsFillValue(binned.vecDepth[s]));
		EXPECT_GE(binned.vecDepth[s], binned.vecDepth[s-1]);
	}

	// Bottom of an eight level column
	EXPECT_DOUBLE_EQ(binned.vecDepth[m_grid.size()], 80.0);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, ThicknessIsPositiveAndBounded) {
	const double dSigma[10] = { 24.0, 23.0, 25.0, 24.5, 26.0, 26.0, 27.5, 27.0, 28.0, 27.9 };

	GridColumn column(m_axis);
	SetProfile(column, std::vector<double>(dSigma, dSigma + 10));

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	for (size_t s = 0; s <= m_grid.size(); s++) {
		if (IsFillValue(binned.vecThick[s])) {
			continue;
		}
		EXPECT_GT(binned.vecThick[s], 0.0);
		EXPECT_LT(binned.vecThick[s], MaxLayerThickness);
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, InversionUsesMonotonicSubProfile) {
	const double dSigma[5] = { 24.0, 23.0, 25.0, 24.5, 26.0 };

	GridColumn column(m_axis);
	SetProfile(column, std::vector<double>(dSigma, dSigma + 5));

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	// Sub-profile is levels 1, 2 and 4 (23, 25, 26)
	EXPECT_NEAR(binned.vecDepth[LevelOf(24.0)], 20.0, 1.0e-9);
	EXPECT_NEAR(binned.vecDepth[LevelOf(25.5)], 35.0, 1.0e-9);
	EXPECT_DOUBLE_EQ(binned.vecDepth[LevelOf(22.5)], 0.0);
	EXPECT_DOUBLE_EQ(binned.vecDepth[LevelOf(26.5)], 50.0);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, UnstratifiedColumnUsesWholeProfile) {
	const double dSigma[3] = { 25.0, 25.1, 25.05 };

	GridColumn column(m_axis);
	SetProfile(column, std::vector<double>(dSigma, dSigma + 3));

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	ASSERT_TRUE(binner.BinColumn(column, binned));

	EXPECT_NEAR(binned.vecDepth[LevelOf(25.0)], 5.0, 1.0e-9);
	EXPECT_DOUBLE_EQ(binned.vecDepth[LevelOf(24.5)], 0.0);
	EXPECT_DOUBLE_EQ(binned.vecDepth[LevelOf(25.5)], 30.0);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, LandColumnIsSkipped) {
	GridColumn column(m_axis);
	SetProfile(column, std::vector<double>());

	EXPECT_EQ(column.GetBottomIndex(), -1);

	IsopycnalBinner binner(m_grid, m_param);
	BinnedColumn binned;
	EXPECT_FALSE(binner.BinColumn(column, binned));

	for (size_t s = 0; s <= m_grid.size(); s++) {
		EXPECT_TRUE(IsFillValue(binned.vecDepth[s]));
		EXPECT_TRUE(IsFillValue(binned.vecThick[s]));
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, ChunkFromTemperatureAndSalinity) {
	const size_t nTimes = 2;
	const size_t nCells = 3;

	DataArray3D<float> dTheta(nTimes, m_axis.size(), nCells);
	DataArray3D<float> dSalt(nTimes, m_axis.size(), nCells);

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t k = 0; k < m_axis.size(); k++) {
		for (size_t i = 0; i < nCells; i++) {
			dTheta(t,k,i) = static_cast<float>(25.0 - 2.0 * k);
			dSalt(t,k,i) = 35.0f;
		}
		// Last cell is land
		dTheta(t,k,nCells-1) = FillValue;
		dSalt(t,k,nCells-1) = FillValue;
	}
	}

	IsopycnalBinner binner(m_grid, m_param);
	BinnedChunk chunk;
	binner.BinChunk(m_axis, dTheta, dSalt, chunk);

	ASSERT_EQ(chunk.dDepth.GetSize(0), nTimes);
	ASSERT_EQ(chunk.dDepth.GetSize(1), m_grid.size() + 1);
	ASSERT_EQ(chunk.dDepth.GetSize(2), nCells);

	for (size_t t = 0; t < nTimes; t++) {
		EXPECT_FLOAT_EQ(chunk.dDepth(t, m_grid.size(), 0), 100.0f);
		EXPECT_TRUE(IsFillValue(chunk.dDepth(t, m_grid.size(), nCells-1)));
		for (size_t s = 1; s < m_grid.size(); s++) {
			EXPECT_GE(chunk.dDepth(t,s,1), chunk.dDepth(t,s-1,1));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(IsopycnalBinningTest, ChunkShapeMismatchThrows) {
	DataArray3D<float> dTheta(1, m_axis.size(), 4);
	DataArray3D<float> dSalt(1, m_axis.size(), 5);

	IsopycnalBinner binner(m_grid, m_param);
	BinnedChunk chunk;
	EXPECT_THROW(binner.BinChunk(m_axis, dTheta, dSalt, chunk), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(ChunkMonthsTest, DependsOnGridSize) {
	EXPECT_EQ(ComputeChunkMonths(500000, 1200), 120);
	EXPECT_EQ(ComputeChunkMonths(5000000, 1200), 24);
	EXPECT_EQ(ComputeChunkMonths(50000000, 1200), 12);
	EXPECT_EQ(ComputeChunkMonths(500000, 36), 36);
}

///////////////////////////////////////////////////////////////////////////////

