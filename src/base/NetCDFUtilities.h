///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
///	\author  Paul Ullrich
///	\version August 14, 2014
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

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

#include "netcdfcpp.h"

#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time dimension from the NetCDF file, or NULL if none.
///	</summary>
NcDim * NcGetTimeDimension(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time variable from the NetCDF file, or NULL if none.
///	</summary>
NcVar * NcGetTimeVariable(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a variable from the NetCDF file, throwing if it is absent.
///	</summary>
NcVar * NcGetVariable(
	NcFile & ncFile,
	const std::string & strVarName,
	const std::string & strFileName
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a dimension from the NetCDF file, throwing if it is absent.
///	</summary>
NcDim * NcGetDimension(
	NcFile & ncFile,
	const std::string & strDimName,
	const std::string & strFileName
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the missing value declared by a variable through its _FillValue
///		or missing_value attribute.  Returns false if neither is present.
///	</summary>
bool NcGetMissingValue(
	NcVar * var,
	double & dMissingValue
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a hyperslab of a variable as float, replacing its declared
///		missing value, NaN and out-of-range values with FillValue.
///	</summary>
void NcReadNormalised(
	NcVar * var,
	const std::vector<long> & vecOffset,
	const std::vector<long> & vecCount,
	float * data
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read an entire one-dimensional variable as double.
///	</summary>
void NcReadCoordinate(
	NcVar * var,
	std::vector<double> & vecValues
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a hyperslab of a variable.
///	</summary>
template <typename ValueType>
void NcWriteSlab(
	NcVar * var,
	const std::vector<long> & vecOffset,
	const std::vector<long> & vecCount,
	const ValueType * data
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Copy NetCDF attribute metadata from one variable to another.
///		_FillValue, missing_value, add_offset and scale_factor are never
///		copied.
///	</summary>
void CopyNcVarAttributes(
	NcVar * varIn,
	NcVar * varOut
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Insert a new dimension into the NcFile, or use existing.
///	</summary>
NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a variable carrying _FillValue and missing_value attributes
///		set to FillValue, with optional long_name and units.
///	</summary>
NcVar * AddNcFillVar(
	NcFile & ncFile,
	const std::string & strVarName,
	NcType nctype,
	const std::vector<NcDim *> & vecDims,
	const std::string & strLongName = "",
	const std::string & strUnits = ""
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a one-dimensional coordinate variable and write its values.
///	</summary>
NcVar * AddNcCoordinateVar(
	NcFile & ncFile,
	NcDim * dim,
	const std::vector<double> & vecValues,
	const std::string & strUnits = ""
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write the "history" provenance attribute to an output file.
///	</summary>
void NcAddHistory(
	NcFile & ncFile,
	const std::string & strCommandLine
);

////////////////////////////////////////////////////////////////////////////////

#endif

