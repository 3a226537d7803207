///////////////////////////////////////////////////////////////////////////////
///
///	\file    Defines.h
///	\author  Paul Ullrich
///	\version September 17, 2019
///
///	<remarks>
///		Copyright 2000-2014 Paul Ullrich
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _DEFINES_H_
#define _DEFINES_H_

#include <cmath>

///////////////////////////////////////////////////////////////////////////////
//
// Defines for floating point tolerance.
//
static const double HighTolerance = 1.0e-10;

///////////////////////////////////////////////////////////////////////////////
//
// Missing value written to all output variables as _FillValue.  Any input
// value above FillValueThreshold is treated as missing.
//
static const float FillValue = 1.0e20f;

static const double FillValueThreshold = 1.0e19;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Returns true if the value should be treated as missing.
///	</summary>
inline bool IsFillValue(double d) {
	return ((d != d) || (std::fabs(d) > FillValueThreshold));
}

///////////////////////////////////////////////////////////////////////////////
//
// Sentinel written to integer time-of-emergence outputs when the noise
// level is undefined.
//
static const int ToEMissing = -1;

///////////////////////////////////////////////////////////////////////////////

#endif

