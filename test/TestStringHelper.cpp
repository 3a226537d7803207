///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestStringHelper.cpp
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

#include "STLStringHelper.h"
#include "FilenameList.h"
#include "Exception.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

TEST(STLStringHelperTest, NumberClassification) {
	EXPECT_TRUE(STLStringHelper::IsInteger("12"));
	EXPECT_TRUE(STLStringHelper::IsInteger("-3"));
	EXPECT_FALSE(STLStringHelper::IsInteger("-"));
	EXPECT_FALSE(STLStringHelper::IsInteger("1.5"));
	EXPECT_FALSE(STLStringHelper::IsInteger(""));

	EXPECT_TRUE(STLStringHelper::IsFloat("28.5"));
	EXPECT_TRUE(STLStringHelper::IsFloat("-1.0e-3"));
	EXPECT_TRUE(STLStringHelper::IsFloat("7"));
	EXPECT_FALSE(STLStringHelper::IsFloat("1.2.3"));
	EXPECT_FALSE(STLStringHelper::IsFloat("e5"));
	EXPECT_FALSE(STLStringHelper::IsFloat("abc"));
}

///////////////////////////////////////////////////////////////////////////////

TEST(STLStringHelperTest, RemoveWhitespace) {
	std::string str("  thetao.nc \t\n");
	STLStringHelper::RemoveWhitespaceInPlace(str);
	EXPECT_EQ(str, "thetao.nc");

	std::string strBlank(" \t ");
	STLStringHelper::RemoveWhitespaceInPlace(strBlank);
	EXPECT_EQ(strBlank, "");

	std::string strSingle("x ");
	STLStringHelper::RemoveWhitespaceInPlace(strSingle);
	EXPECT_EQ(strSingle, "x");
}

///////////////////////////////////////////////////////////////////////////////

TEST(STLStringHelperTest, ParseLists) {
	std::vector<std::string> vecItems;
	STLStringHelper::ParseVariableList("a.nc;b.nc", vecItems, ";");
	ASSERT_EQ(vecItems.size(), 2u);
	EXPECT_EQ(vecItems[1], "b.nc");

	std::vector<std::string> vecEmpty;
	EXPECT_THROW(
		STLStringHelper::ParseVariableList("a;;b", vecEmpty, ";"),
		Exception);

	std::vector<double> vecValues;
	STLStringHelper::ParseDoubleList("19, 26,28.5", vecValues);
	ASSERT_EQ(vecValues.size(), 3u);
	EXPECT_DOUBLE_EQ(vecValues[2], 28.5);
	EXPECT_THROW(STLStringHelper::ParseDoubleList("19,x", vecValues), Exception);

	int iFirst;
	int iSecond;
	STLStringHelper::ParseIntegerPair("1,120", iFirst, iSecond);
	EXPECT_EQ(iFirst, 1);
	EXPECT_EQ(iSecond, 120);
	EXPECT_THROW(STLStringHelper::ParseIntegerPair("1,2,3", iFirst, iSecond), Exception);
	EXPECT_THROW(STLStringHelper::ParseIntegerPair("1,b", iFirst, iSecond), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(FilenameListTest, FromString) {
	FilenameList vecFiles;
	vecFiles.FromString("run1.nc; run2.nc,run3.nc");

	ASSERT_EQ(vecFiles.size(), 3u);
	EXPECT_EQ(vecFiles[1], "run2.nc");
	EXPECT_EQ(vecFiles[2], "run3.nc");
}

///////////////////////////////////////////////////////////////////////////////

TEST(FilenameListTest, FromFileSkipsCommentsAndBlanks) {
	char szTempName[] = "/tmp/isobin_filelist_XXXXXX";
	int fd = mkstemp(szTempName);
	ASSERT_NE(fd, -1);

	FILE * fp = fdopen(fd, "w");
	ASSERT_TRUE(fp != NULL);
	fprintf(fp, "# ensemble members\n");
	fprintf(fp, "run1.nc\n\n");
	fprintf(fp, "  run2.nc  \n");
	fclose(fp);

	FilenameList vecFiles;
	vecFiles.FromFile(szTempName);
	remove(szTempName);

	ASSERT_EQ(vecFiles.size(), 2u);
	EXPECT_EQ(vecFiles[0], "run1.nc");
	EXPECT_EQ(vecFiles[1], "run2.nc");

	FilenameList vecMissing;
	EXPECT_THROW(vecMissing.FromFile("/nonexistent/isobin/list.txt"), Exception);
}

///////////////////////////////////////////////////////////////////////////////

