///////////////////////////////////////////////////////////////////////////////
///
///	\file    STLStringHelper.h
///	\author  Paul Ullrich
///	\version July 26, 2010
///
///	<remarks>
///		Copyright 2000-2010 Paul Ullrich
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _STLSTRINGHELPER_H_
#define _STLSTRINGHELPER_H_

#include "Exception.h"

#include <string>
#include <vector>

#include <cstdlib>
#include <cstring>
#include <cctype>

///	<summary>
///		This class exposes additional functionality which can be used to
///		supplement the STL string class.
///	</summary>
class STLStringHelper {

///////////////////////////////////////////////////////////////////////////////

private:
STLStringHelper() { }

public:

///////////////////////////////////////////////////////////////////////////////

inline static void ToLower(std::string &str) {
	for(size_t i = 0; i < str.length(); i++) {
		str[i] = tolower(str[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsInteger(const std::string &str) {
	if (str.length() == 0) {
		return false;
	}
	for(size_t i = 0; i < str.length(); i++) {
		if ((i == 0) && ((str[i] == '-') || (str[i] == '+'))) {
			if (str.length() == 1) {
				return false;
			}
			continue;
		}
		if ((str[i] < '0') || (str[i] > '9')) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsFloat(const std::string &str) {
	bool fIsFloat = false;
	bool fHasExponent = false;
	bool fHasDecimal = false;
	for(size_t i = 0; i < str.length(); i++) {
		if ((str[i] >= '0') && (str[i] <= '9')) {
			fIsFloat = true;
			continue;
		}
		if (str[i] == '.') {
			if (fHasDecimal || fHasExponent) {
				return false;
			}
			fHasDecimal = true;
			continue;
		}
		if ((str[i] == 'e') || (str[i] == 'E')) {
			if (fHasExponent || !fIsFloat) {
				return false;
			}
			fHasExponent = true;
			continue;
		}
		if ((str[i] == '-') || (str[i] == '+')) {
			if ((i == 0) || (str[i-1] == 'e') || (str[i-1] == 'E')) {
				continue;
			}
		}
		return false;
	}
	return fIsFloat;
}

///////////////////////////////////////////////////////////////////////////////

static void RemoveWhitespaceInPlace(
	std::string & strString
) {
	size_t sBegin = strString.length();
	for (size_t s = 0; s < strString.length(); s++) {
		if ((strString[s] != ' ') && (strString[s] != '\t')
		 && (strString[s] != '\r') && (strString[s] != '\n')
		) {
			sBegin = s;
			break;
		}
	}
	if (sBegin == strString.length()) {
		strString = "";
		return;
	}

	size_t sEnd = strString.length();
	for (size_t s = sEnd-1; s > sBegin; s--) {
		if ((strString[s] != ' ') && (strString[s] != '\t')
		 && (strString[s] != '\r') && (strString[s] != '\n')
		) {
			sEnd = s+1;
			break;
		}
		sEnd = s;
	}

	strString = strString.substr(sBegin, sEnd - sBegin);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a delimited list into its items.  Empty items are an error.
///	</summary>
static void ParseVariableList(
	const std::string & strVariables,
	std::vector< std::string > & vecVariableStrings,
	const std::string & strDelimiters = std::string(" ,;")
) {
	if (strVariables.length() == 0) {
		return;
	}

	size_t iVarBegin = 0;
	for (size_t iVarCurrent = 0; iVarCurrent <= strVariables.length(); iVarCurrent++) {
		if ((iVarCurrent == strVariables.length()) ||
		    (strDelimiters.find(strVariables[iVarCurrent]) != std::string::npos)
		) {
			if (iVarCurrent == iVarBegin) {
				_EXCEPTION1("Zero length item in list \"%s\"",
					strVariables.c_str());
			}
			vecVariableStrings.push_back(
				strVariables.substr(iVarBegin, iVarCurrent - iVarBegin));

			iVarBegin = iVarCurrent + 1;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parse a list of floating point values such as "19,26,28.5".
///	</summary>
static void ParseDoubleList(
	const std::string & strValues,
	std::vector<double> & vecValues
) {
	std::vector<std::string> vecItems;
	ParseVariableList(strValues, vecItems, ",");

	vecValues.clear();
	for (size_t i = 0; i < vecItems.size(); i++) {
		RemoveWhitespaceInPlace(vecItems[i]);
		if (!IsFloat(vecItems[i])) {
			_EXCEPTION2("Invalid value \"%s\" in list \"%s\"",
				vecItems[i].c_str(), strValues.c_str());
		}
		vecValues.push_back(atof(vecItems[i].c_str()));
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parse a pair of integers of the form "a,b".
///	</summary>
static void ParseIntegerPair(
	const std::string & strPair,
	int & iFirst,
	int & iSecond
) {
	std::vector<std::string> vecItems;
	ParseVariableList(strPair, vecItems, ",");
	if (vecItems.size() != 2) {
		_EXCEPTION1("Expected pair of integers \"a,b\", found \"%s\"",
			strPair.c_str());
	}
	for (size_t i = 0; i < 2; i++) {
		RemoveWhitespaceInPlace(vecItems[i]);
		if (!IsInteger(vecItems[i])) {
			_EXCEPTION1("Expected pair of integers \"a,b\", found \"%s\"",
				strPair.c_str());
		}
	}
	iFirst = atoi(vecItems[0].c_str());
	iSecond = atoi(vecItems[1].c_str());
}

///////////////////////////////////////////////////////////////////////////////

static std::string ConcatenateStringVector(
	const std::vector< std::string > & vecStrings,
	std::string strDelimiter
) {
	std::string strConcat;
	for (size_t v = 0; v < vecStrings.size(); v++) {
		strConcat += vecStrings[v];
		if (v != vecStrings.size() - 1) {
			strConcat += strDelimiter;
		}
	}
	return strConcat;
}

///////////////////////////////////////////////////////////////////////////////

};

#endif

