///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestDensityGrid.cpp
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

#include "DensityGrid.h"
#include "Exception.h"

#include <gtest/gtest.h>

///////////////////////////////////////////////////////////////////////////////

TEST(DensityGridTest, DefaultGridHasSixtyLevels) {
	DensityGridParameters param;
	param.Validate();

	DensityGrid grid(param);

	ASSERT_EQ(grid.size(), 60u);
	EXPECT_DOUBLE_EQ(grid[0], 19.0);
	EXPECT_NEAR(grid[34], 25.8, 1.0e-12);
	EXPECT_DOUBLE_EQ(grid[35], 26.0);
	EXPECT_NEAR(grid[59], 28.4, 1.0e-12);

	EXPECT_EQ(grid.GetDeltas().size(), 60u);
	EXPECT_DOUBLE_EQ(grid.GetDeltas()[0], 0.2);
	EXPECT_DOUBLE_EQ(grid.GetDeltas()[59], 0.1);
}

///////////////////////////////////////////////////////////////////////////////

TEST(DensityGridTest, LevelsStrictlyIncreasing) {
	DensityGridParameters param;
	param.dMin = 20.0;
	param.dIntermediate = 27.0;
	param.dMax = 28.0;
	param.dDeltaFine = 0.25;
	param.dDeltaCoarse = 0.05;

	DensityGrid grid(param);

	ASSERT_EQ(grid.size(), 28u + 20u);
	for (size_t k = 1; k < grid.size(); k++) {
		EXPECT_GT(grid[k], grid[k-1]);
	}
}

///////////////////////////////////////////////////////////////////////////////

TEST(DensityGridTest, AxisCarriesTrailingSentinel) {
	DensityGrid grid((DensityGridParameters()));

	const std::vector<double> & vecAxis = grid.GetAxis();
	ASSERT_EQ(vecAxis.size(), grid.size() + 1);
	EXPECT_NEAR(vecAxis.back(), 28.5, 1.0e-12);
}

///////////////////////////////////////////////////////////////////////////////

TEST(DensityGridTest, FirstLevelAtOrAbove) {
	DensityGrid grid((DensityGridParameters()));

	EXPECT_EQ(grid.FirstLevelAtOrAbove(10.0), 0u);
	EXPECT_EQ(grid.FirstLevelAtOrAbove(26.0), 35u);
	EXPECT_EQ(grid.FirstLevelAtOrAbove(26.05), 36u);
	EXPECT_EQ(grid.FirstLevelAtOrAbove(30.0), grid.size());
}

///////////////////////////////////////////////////////////////////////////////

TEST(DensityGridTest, InvalidOrderingRejected) {
	DensityGridParameters param;
	param.dMin = 26.0;
	EXPECT_THROW(param.Validate(), Exception);

	param.dMin = 19.0;
	param.dMax = 25.0;
	EXPECT_THROW(param.Validate(), Exception);

	param.dMax = 28.5;
	param.dDeltaCoarse = 0.0;
	EXPECT_THROW(param.Validate(), Exception);
}

///////////////////////////////////////////////////////////////////////////////

