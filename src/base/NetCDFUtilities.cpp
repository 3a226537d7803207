///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
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

#include "Defines.h"
#include "NetCDFUtilities.h"
#include "Exception.h"
#include "Announce.h"
#include "netcdfcpp.h"

#include <cstring>
#include <ctime>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

static const char * TimeDimensionNames[] = {
	"time",
	"Time",
	"time_counter",
	"t"
};

static const int TimeDimensionNameCount = 4;

////////////////////////////////////////////////////////////////////////////////

NcDim * NcGetTimeDimension(
	NcFile & ncFile
) {
	for (int i = 0; i < TimeDimensionNameCount; i++) {
		NcDim * dim = ncFile.get_dim(TimeDimensionNames[i]);
		if (dim != NULL) {
			return dim;
		}
	}
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetTimeVariable(
	NcFile & ncFile
) {
	for (int i = 0; i < TimeDimensionNameCount; i++) {
		NcVar * var = ncFile.get_var(TimeDimensionNames[i]);
		if (var != NULL) {
			return var;
		}
	}
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetVariable(
	NcFile & ncFile,
	const std::string & strVarName,
	const std::string & strFileName
) {
	NcVar * var = ncFile.get_var(strVarName.c_str());
	if (var == NULL) {
		_EXCEPTION2("Unable to load variable \"%s\" from file \"%s\"",
			strVarName.c_str(), strFileName.c_str());
	}
	return var;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * NcGetDimension(
	NcFile & ncFile,
	const std::string & strDimName,
	const std::string & strFileName
) {
	NcDim * dim = ncFile.get_dim(strDimName.c_str());
	if (dim == NULL) {
		_EXCEPTION2("Unable to load dimension \"%s\" from file \"%s\"",
			strDimName.c_str(), strFileName.c_str());
	}
	return dim;
}

////////////////////////////////////////////////////////////////////////////////

bool NcGetMissingValue(
	NcVar * var,
	double & dMissingValue
) {
	NcAtt * att = var->get_att("_FillValue");
	if (att == NULL) {
		att = var->get_att("missing_value");
	}
	if (att == NULL) {
		return false;
	}

	dMissingValue = att->as_double(0);
	delete att;

	return true;
}

////////////////////////////////////////////////////////////////////////////////

void NcReadNormalised(
	NcVar * var,
	const std::vector<long> & vecOffset,
	const std::vector<long> & vecCount,
	float * data
) {
	if ((vecOffset.size() != static_cast<size_t>(var->num_dims())) ||
	    (vecCount.size() != static_cast<size_t>(var->num_dims()))
	) {
		_EXCEPTION3("Variable \"%s\" has %i dimensions, hyperslab has %lu",
			var->name(), var->num_dims(), vecCount.size());
	}

	var->set_cur(const_cast<long *>(&(vecOffset[0])));
	if (!var->get(data, &(vecCount[0]))) {
		_EXCEPTION1("Error reading variable \"%s\"", var->name());
	}

	size_t sTotal = 1;
	for (size_t d = 0; d < vecCount.size(); d++) {
		sTotal *= static_cast<size_t>(vecCount[d]);
	}

	double dMissingValue = FillValue;
	bool fHasMissing = NcGetMissingValue(var, dMissingValue);
	float flMissingValue = static_cast<float>(dMissingValue);

	for (size_t i = 0; i < sTotal; i++) {
		if (fHasMissing && (data[i] == flMissingValue)) {
			data[i] = FillValue;
		} else if (IsFillValue(data[i])) {
			data[i] = FillValue;
		}
	}
}

////////////////////////////////////////////////////////////////////////////////

void NcReadCoordinate(
	NcVar * var,
	std::vector<double> & vecValues
) {
	if (var->num_dims() != 1) {
		_EXCEPTION1("Coordinate variable \"%s\" must be one-dimensional",
			var->name());
	}

	long lSize = var->get_dim(0)->size();
	vecValues.resize(lSize);
	if (lSize == 0) {
		return;
	}

	var->set_cur((long)0);
	if (!var->get(&(vecValues[0]), lSize)) {
		_EXCEPTION1("Error reading coordinate variable \"%s\"", var->name());
	}
}

////////////////////////////////////////////////////////////////////////////////

template <typename ValueType>
void NcWriteSlab(
	NcVar * var,
	const std::vector<long> & vecOffset,
	const std::vector<long> & vecCount,
	const ValueType * data
) {
	if ((vecOffset.size() != static_cast<size_t>(var->num_dims())) ||
	    (vecCount.size() != static_cast<size_t>(var->num_dims()))
	) {
		_EXCEPTION3("Variable \"%s\" has %i dimensions, hyperslab has %lu",
			var->name(), var->num_dims(), vecCount.size());
	}

	var->set_cur(const_cast<long *>(&(vecOffset[0])));
	if (!var->put(data, &(vecCount[0]))) {
		_EXCEPTION1("Error writing variable \"%s\"", var->name());
	}
}

template void NcWriteSlab<float>(
	NcVar *, const std::vector<long> &, const std::vector<long> &, const float *);

template void NcWriteSlab<int>(
	NcVar *, const std::vector<long> &, const std::vector<long> &, const int *);

template void NcWriteSlab<double>(
	NcVar *, const std::vector<long> &, const std::vector<long> &, const double *);

////////////////////////////////////////////////////////////////////////////////

void CopyNcVarAttributes(
	NcVar * varIn,
	NcVar * varOut
) {
	for (int a = 0; a < varIn->num_atts(); a++) {
		NcAtt * att = varIn->get_att(a);
		long num_vals = att->num_vals();
		std::string strAttName = att->name();

		// Fill values and packing are set by the writer
		if ((strAttName == "_FillValue") ||
		    (strAttName == "missing_value") ||
		    (strAttName == "add_offset") ||
		    (strAttName == "scale_factor")
		) {
			delete att;
			continue;
		}

		NcValues * pValues = att->values();
		if (pValues == NULL) {
			std::string strVarName = varIn->name();
			delete att;
			_EXCEPTION2("Invalid attribute type \"%s::%s\"",
				strVarName.c_str(), strAttName.c_str());
		}

		if (att->type() == ncByte) {
			varOut->add_att(att->name(), num_vals,
				(const ncbyte*)(pValues->base()));

		} else if (att->type() == ncChar) {
			varOut->add_att(att->name(), num_vals,
				(const char*)(pValues->base()));

		} else if (att->type() == ncShort) {
			varOut->add_att(att->name(), num_vals,
				(const short*)(pValues->base()));

		} else if (att->type() == ncInt) {
			varOut->add_att(att->name(), num_vals,
				(const int*)(pValues->base()));

		} else if (att->type() == ncFloat) {
			varOut->add_att(att->name(), num_vals,
				(const float*)(pValues->base()));

		} else if (att->type() == ncDouble) {
			varOut->add_att(att->name(), num_vals,
				(const double*)(pValues->base()));

		} else {
			Announce("WARNING: Skipping attribute \"%s\" of unsupported type",
				strAttName.c_str());
		}

		delete pValues;
		delete att;
	}
}

////////////////////////////////////////////////////////////////////////////////

NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
) {
	NcDim * dim = ncFile.get_dim(strDimName.c_str());
	if (dim == NULL) {
		dim = ncFile.add_dim(strDimName.c_str(), lDimSize);
		if (dim == NULL) {
			_EXCEPTION2("Error adding dimension \"%s\" (%li) to file",
				strDimName.c_str(), lDimSize);
		}
	} else if (dim->size() != lDimSize) {
		_EXCEPTION3("Attempting to redefine dimension \"%s\" from size %li to %li",
			strDimName.c_str(), dim->size(), lDimSize);
	}
	return dim;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * AddNcFillVar(
	NcFile & ncFile,
	const std::string & strVarName,
	NcType nctype,
	const std::vector<NcDim *> & vecDims,
	const std::string & strLongName,
	const std::string & strUnits
) {
	if (vecDims.size() == 0) {
		_EXCEPTION1("No dimensions given for variable \"%s\"",
			strVarName.c_str());
	}

	NcVar * var =
		ncFile.add_var(
			strVarName.c_str(),
			nctype,
			static_cast<int>(vecDims.size()),
			const_cast<const NcDim **>(&(vecDims[0])));

	if (var == NULL) {
		_EXCEPTION1("Error creating variable \"%s\"", strVarName.c_str());
	}

	if (nctype == ncInt) {
		var->add_att("_FillValue", ToEMissing);
		var->add_att("missing_value", ToEMissing);
	} else if (nctype == ncDouble) {
		var->add_att("_FillValue", static_cast<double>(FillValue));
		var->add_att("missing_value", static_cast<double>(FillValue));
	} else {
		var->add_att("_FillValue", FillValue);
		var->add_att("missing_value", FillValue);
	}

	if (strLongName != "") {
		var->add_att("long_name", strLongName.c_str());
	}
	if (strUnits != "") {
		var->add_att("units", strUnits.c_str());
	}

	return var;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * AddNcCoordinateVar(
	NcFile & ncFile,
	NcDim * dim,
	const std::vector<double> & vecValues,
	const std::string & strUnits
) {
	if (dim->size() != static_cast<long>(vecValues.size())) {
		_EXCEPTION3("Coordinate \"%s\" has %lu values, dimension size %li",
			dim->name(), vecValues.size(), dim->size());
	}

	NcVar * var = ncFile.add_var(dim->name(), ncDouble, dim);
	if (var == NULL) {
		_EXCEPTION1("Error creating coordinate variable \"%s\"", dim->name());
	}
	if (strUnits != "") {
		var->add_att("units", strUnits.c_str());
	}
	if (vecValues.size() != 0) {
		var->set_cur((long)0);
		if (!var->put(&(vecValues[0]), static_cast<long>(vecValues.size()))) {
			_EXCEPTION1("Error writing coordinate variable \"%s\"",
				dim->name());
		}
	}
	return var;
}

////////////////////////////////////////////////////////////////////////////////

void NcAddHistory(
	NcFile & ncFile,
	const std::string & strCommandLine
) {
	time_t rawtime;
	time(&rawtime);

	std::string strTime(asctime(localtime(&rawtime)));
	if ((strTime.length() > 0) && (strTime[strTime.length()-1] == '\n')) {
		strTime = strTime.substr(0, strTime.length()-1);
	}

	std::string strHistory = strTime + ": " + strCommandLine;
	ncFile.add_att("history", strHistory.c_str());
}

////////////////////////////////////////////////////////////////////////////////

