///////////////////////////////////////////////////////////////////////////////
///
///	\file    Constants.h
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

#ifndef _CONSTANTS_H_
#define _CONSTANTS_H_

///////////////////////////////////////////////////////////////////////////////
// Mean Earth radius used for ocean cell areas, in meters
static const double EarthRadius = 6.371e6;

///////////////////////////////////////////////////////////////////////////////
// Thickness of an isopycnal layer at or above this value is rejected, in meters
static const double MaxLayerThickness = 6000.0;

///////////////////////////////////////////////////////////////////////////////
// Offset between Kelvin and Celsius
static const double KelvinOffset = 273.15;

///////////////////////////////////////////////////////////////////////////////
// Temperatures above this value are assumed to be in Kelvin
static const double KelvinDetectionThreshold = 100.0;

///////////////////////////////////////////////////////////////////////////////
// Salinities below this value are assumed to be mass fractions
static const double SalinityFractionThreshold = 1.0;

///////////////////////////////////////////////////////////////////////////////
// Reference density subtracted from in-situ density to give sigma, in kg/m^3
static const double SigmaReferenceDensity = 1000.0;

///////////////////////////////////////////////////////////////////////////////
// Months per year of monthly input
static const int MonthsPerYear = 12;

///////////////////////////////////////////////////////////////////////////////
// Scale applied to area-integrated thickness to express volumes in 1e12 m^3
static const double VolumeScale = 1.0e-12;

#endif // _CONSTANTS_H_

