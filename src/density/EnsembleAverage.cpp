///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleAverage.cpp
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

#include "CommandLine.h"
#include "Announce.h"
#include "Exception.h"
#include "Defines.h"
#include "STLStringHelper.h"
#include "FilenameList.h"
#include "NetCDFUtilities.h"
#include "DataArray1D.h"
#include "DataArray2D.h"
#include "DataArray3D.h"

#include "EnsembleAverager.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

#if defined(ISOBIN_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Sizes of all dimensions of a variable.
///	</summary>
std::vector<long> GetDimensionSizes(
	NcVar * var
) {
	std::vector<long> vecDimSizes(var->num_dims());
	for (int d = 0; d < var->num_dims(); d++) {
		vecDimSizes[d] = var->get_dim(d)->size();
	}
	return vecDimSizes;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Check every variable read from every member against the shape of
///		the first member, so that a mismatch is reported before any output
///		is written.
///	</summary>
void ValidateMembers(
	const FilenameList & vecFiles,
	const EnsembleShape & shape,
	bool fMultiModel
) {
	std::vector<std::string> vecZonalNames;
	std::vector<std::string> vecBowlNames;
	GetEnsembleMemberVariables(fMultiModel, vecZonalNames, vecBowlNames);

	for (size_t m = 0; m < vecFiles.size(); m++) {
		NcFile ncMember(vecFiles[m].c_str(), NcFile::ReadOnly);
		if (!ncMember.is_valid()) {
			_EXCEPTION1("Unable to open member file \"%s\"", vecFiles[m].c_str());
		}
		for (size_t v = 0; v < vecZonalNames.size(); v++) {
			NcVar * var = NcGetVariable(ncMember, vecZonalNames[v], vecFiles[m]);
			shape.CheckDimensions(
				vecFiles[m], vecZonalNames[v], true, GetDimensionSizes(var));
		}
		for (size_t v = 0; v < vecBowlNames.size(); v++) {
			NcVar * var = NcGetVariable(ncMember, vecBowlNames[v], vecFiles[m]);
			shape.CheckDimensions(
				vecFiles[m], vecBowlNames[v], false, GetDimensionSizes(var));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read the selected years of a variable from every member into a
///		(member, time, point) stack.  Members whose dimensions differ from
///		the first member raise an Exception.
///	</summary>
void ReadMemberStack(
	const FilenameList & vecFiles,
	const std::string & strVarName,
	const EnsembleShape & shape,
	bool fZonal,
	int iYearBegin,
	int nYears,
	DataArray3D<float> & dStack
) {
	std::vector<long> vecCount;
	vecCount.push_back(nYears);
	vecCount.push_back(shape.lBasins);
	if (fZonal) {
		vecCount.push_back(shape.lLevels);
	}
	vecCount.push_back(shape.lLatitudes);

	std::vector<long> vecOffset(vecCount.size(), 0);
	vecOffset[0] = iYearBegin;

	size_t sPoints = 1;
	for (size_t d = 1; d < vecCount.size(); d++) {
		sPoints *= static_cast<size_t>(vecCount[d]);
	}

	dStack.Allocate(vecFiles.size(), nYears, sPoints);

	for (size_t m = 0; m < vecFiles.size(); m++) {
		NcFile ncMember(vecFiles[m].c_str(), NcFile::ReadOnly);
		if (!ncMember.is_valid()) {
			_EXCEPTION1("Unable to open member file \"%s\"", vecFiles[m].c_str());
		}

		NcVar * var = NcGetVariable(ncMember, strVarName, vecFiles[m]);
		shape.CheckDimensions(
			vecFiles[m], strVarName, fZonal, GetDimensionSizes(var));

		NcReadNormalised(var, vecOffset, vecCount, &(dStack(m,0,0)));
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a (time, point) field to a variable with the given dimension
///		sizes after time.
///	</summary>
void WriteEnsembleField(
	NcVar * var,
	const DataArray2D<float> & dField
) {
	std::vector<long> vecOffset(var->num_dims(), 0);
	std::vector<long> vecCount(var->num_dims());
	for (int d = 0; d < var->num_dims(); d++) {
		vecCount[d] = var->get_dim(d)->size();
	}
	NcWriteSlab(var, vecOffset, vecCount, dField.GetData());
}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(ISOBIN_MPIOMP)
	// Initialize MPI
	MPI_Init(&argc, &argv);
#endif

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	// Enable output only on rank zero
	AnnounceOnlyOutputOnRankZero();

try {

#if defined(ISOBIN_MPIOMP)
	int nMPISize;
	MPI_Comm_size(MPI_COMM_WORLD, &nMPISize);
	if (nMPISize > 1) {
		_EXCEPTIONT("At present EnsembleAverage only supports serial execution.");
	}
#endif

	// File containing the list of member files
	std::string strInputFileList;

	// List of member files
	std::string strInputFiles;

	// Output file
	std::string strOutputFile;

	// Selected years
	std::string strYears;

	// Reference period of the sign agreement
	std::string strReferencePeriod;

	// Aggregation parameters
	EnsembleParameters param;

	// Debug output
	bool fDebug;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strInputFileList, "in_list", "");
		CommandLineString(strInputFiles, "in", "");
		CommandLineString(strOutputFile, "out", "");
		CommandLineStringD(strYears, "years", "", "[t1,t2]");
		CommandLineStringD(strReferencePeriod, "refperiod", "", "[p1,p2]");
		CommandLineBool(param.fMultiModel, "mme");
		CommandLineDouble(param.dCoverageThreshold, "coverage", 50.0);
		CommandLineBool(fDebug, "debug");

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	if (fDebug) {
		AnnounceSetVerbosityLevel(1);
	}

	// Validate arguments
	if ((strInputFileList.length() == 0) && (strInputFiles.length() == 0)) {
		_EXCEPTIONT("No member files (--in_list or --in) specified");
	}
	if ((strInputFileList.length() != 0) && (strInputFiles.length() != 0)) {
		_EXCEPTIONT("Only one of --in_list or --in may be specified");
	}
	if (strOutputFile.length() == 0) {
		_EXCEPTIONT("No output file (--out) specified");
	}
	if (!param.fMultiModel && (strReferencePeriod.length() == 0)) {
		_EXCEPTIONT("No reference period (--refperiod) specified");
	}

	FilenameList vecFiles;
	if (strInputFileList.length() != 0) {
		vecFiles.FromFile(strInputFileList);
	} else {
		vecFiles.FromString(strInputFiles);
	}

	Announce("Ensemble of %lu members (%s)", vecFiles.size(),
		(param.fMultiModel)?("multi-model"):("single model"));

	// Shape and coordinates from the first member
	AnnounceStartBlock("Reading coordinates");

	NcFile ncFirst(vecFiles[0].c_str(), NcFile::ReadOnly);
	if (!ncFirst.is_valid()) {
		_EXCEPTION1("Unable to open member file \"%s\"", vecFiles[0].c_str());
	}

	NcVar * varShape = NcGetVariable(ncFirst, "isondepth", vecFiles[0]);
	if (varShape->num_dims() != 4) {
		_EXCEPTION1("\"isondepth\" in \"%s\" must have dimensions (time, basin, rho, lat)",
			vecFiles[0].c_str());
	}

	EnsembleShape shape;
	shape.lTimes = varShape->get_dim(0)->size();
	shape.lBasins = varShape->get_dim(1)->size();
	shape.lLevels = varShape->get_dim(2)->size();
	shape.lLatitudes = varShape->get_dim(3)->size();

	std::vector<double> vecBasin;
	std::vector<double> vecSigma;
	std::vector<double> vecLat;
	NcReadCoordinate(
		NcGetVariable(ncFirst, varShape->get_dim(1)->name(), vecFiles[0]), vecBasin);
	NcReadCoordinate(
		NcGetVariable(ncFirst, varShape->get_dim(2)->name(), vecFiles[0]), vecSigma);
	NcReadCoordinate(
		NcGetVariable(ncFirst, varShape->get_dim(3)->name(), vecFiles[0]), vecLat);

	// Selected years
	int iYearBegin = 0;
	int iYearEnd = static_cast<int>(shape.lTimes);
	if (strYears.length() != 0) {
		STLStringHelper::ParseIntegerPair(strYears, iYearBegin, iYearEnd);
		if ((iYearBegin < 0) ||
		    (iYearEnd <= iYearBegin) ||
		    (iYearEnd > static_cast<int>(shape.lTimes))
		) {
			_EXCEPTION2("Years (--years) \"%s\" out of range for %li time steps",
				strYears.c_str(), shape.lTimes);
		}
	}
	const int nYears = iYearEnd - iYearBegin;

	if (strReferencePeriod.length() != 0) {
		STLStringHelper::ParseIntegerPair(
			strReferencePeriod, param.iReferenceBegin, param.iReferenceEnd);
	}
	param.Validate(nYears);

	std::vector<double> vecTime(nYears);
	NcVar * varTimeIn = NcGetTimeVariable(ncFirst);
	if (varTimeIn != NULL) {
		varTimeIn->set_cur(static_cast<long>(iYearBegin));
		if (!varTimeIn->get(&(vecTime[0]), nYears)) {
			_EXCEPTIONT("Error reading time variable");
		}
	} else {
		for (int t = 0; t < nYears; t++) {
			vecTime[t] = static_cast<double>(iYearBegin + t);
		}
	}

	Announce("%i years, %li basins, %li levels, %li latitudes",
		nYears, shape.lBasins, shape.lLevels, shape.lLatitudes);

	AnnounceEndBlock("Done");

	AnnounceStartBlock("Checking members");
	ValidateMembers(vecFiles, shape, param.fMultiModel);
	AnnounceEndBlock("Done");

	// Output file
	AnnounceStartBlock("Initializing output");

	NcFile ncOut(strOutputFile.c_str(), NcFile::Replace);
	if (!ncOut.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"", strOutputFile.c_str());
	}

	NcDim * dimTime = ncOut.add_dim("time", nYears);
	NcDim * dimBasin = ncOut.add_dim("basin", shape.lBasins);
	NcDim * dimRho = ncOut.add_dim("rho", shape.lLevels);
	NcDim * dimLat = ncOut.add_dim("lat", shape.lLatitudes);
	if ((dimTime == NULL) || (dimBasin == NULL) || (dimRho == NULL) || (dimLat == NULL)) {
		_EXCEPTIONT("Error creating dimensions in output file");
	}

	NcVar * varTimeOut = AddNcCoordinateVar(ncOut, dimTime, vecTime);
	if (varTimeIn != NULL) {
		CopyNcVarAttributes(varTimeIn, varTimeOut);
	}
	AddNcCoordinateVar(ncOut, dimBasin, vecBasin);
	AddNcCoordinateVar(ncOut, dimRho, vecSigma, "kg m-3");
	AddNcCoordinateVar(ncOut, dimLat, vecLat, "degrees_north");

	std::vector<NcDim *> vecZonalDims;
	vecZonalDims.push_back(dimTime);
	vecZonalDims.push_back(dimBasin);
	vecZonalDims.push_back(dimRho);
	vecZonalDims.push_back(dimLat);

	std::vector<NcDim *> vecBowlDims;
	vecBowlDims.push_back(dimTime);
	vecBowlDims.push_back(dimBasin);
	vecBowlDims.push_back(dimLat);

	NcAddHistory(ncOut, GetCommandLineAsString(argc, argv));

	AnnounceEndBlock("Done");

	EnsembleAverager averager(param);

	// Bowl variables
	AnnounceStartBlock("Bowl variables");

	DataArray2D<float> dBowlPercent;
	DataArray1D<float> dBowlLimit;
	{
		DataArray3D<float> dStack;
		ReadMemberStack(vecFiles, "ptopdepth", shape, false,
			iYearBegin, nYears, dStack);
		averager.ComputeCoverage(dStack, dBowlPercent);

		NcVar * varPercent = AddNcFillVar(ncOut, "ptoppercent", ncFloat, vecBowlDims,
			"Percentage of members with a bowl", "%");
		WriteEnsembleField(varPercent, dBowlPercent);
	}

	std::vector<EnsembleVariable> vecBowlVariables;
	GetEnsembleBowlVariables(vecBowlVariables);

	for (size_t v = 0; v < vecBowlVariables.size(); v++) {
		const EnsembleVariable & ensvar = vecBowlVariables[v];
		Announce("%s", ensvar.strName.c_str());

		DataArray3D<float> dStack;
		ReadMemberStack(vecFiles, ensvar.strName, shape, false,
			iYearBegin, nYears, dStack);
		if (ensvar.fZeroFill) {
			EnsembleAverager::ZeroFillMissing(dStack);
		}

		DataArray2D<float> dMean;
		averager.Mean(dStack, dBowlPercent, dMean);

		if (ensvar.strName == "ptopsigma") {
			averager.ComputeBowlLimit(dStack, dBowlLimit);
		}

		DataArray2D<float> dAgree;
		if (param.fMultiModel) {
			DataArray3D<float> dAgreeStack;
			ReadMemberStack(vecFiles, ensvar.strName + "Agree", shape, false,
				iYearBegin, nYears, dAgreeStack);
			averager.Mean(dAgreeStack, dBowlPercent, dAgree);
		} else {
			averager.SignAgreement(dStack, dBowlPercent, dAgree);
		}

		NcVar * varMean = AddNcFillVar(ncOut, ensvar.strName, ncFloat, vecBowlDims);
		NcVar * varAgree = AddNcFillVar(ncOut, ensvar.strName + "Agree", ncFloat, vecBowlDims,
			"Sign agreement of members");
		WriteEnsembleField(varMean, dMean);
		WriteEnsembleField(varAgree, dAgree);
	}

	if (!dBowlLimit.IsAttached()) {
		_EXCEPTIONT("Bowl density \"ptopsigma\" was not aggregated");
	}

	AnnounceEndBlock("Done");

	// Zonal variables
	AnnounceStartBlock("Zonal variables");

	DataArray2D<float> dPercent;
	{
		DataArray3D<float> dStack;
		ReadMemberStack(vecFiles, "isondepth", shape, true,
			iYearBegin, nYears, dStack);
		averager.ComputeCoverage(dStack, dPercent);

		NcVar * varPercent = AddNcFillVar(ncOut, "isonpercent", ncFloat, vecZonalDims,
			"Percentage of members with valid data", "%");
		WriteEnsembleField(varPercent, dPercent);
	}

	std::vector<EnsembleVariable> vecZonalVariables;
	GetEnsembleZonalVariables(vecZonalVariables);

	const size_t sBasins = static_cast<size_t>(shape.lBasins);
	const size_t sLatitudes = static_cast<size_t>(shape.lLatitudes);

	for (size_t v = 0; v < vecZonalVariables.size(); v++) {
		const EnsembleVariable & ensvar = vecZonalVariables[v];
		Announce("%s", ensvar.strName.c_str());

		DataArray3D<float> dStack;
		ReadMemberStack(vecFiles, ensvar.strName, shape, true,
			iYearBegin, nYears, dStack);
		if (ensvar.fZeroFill) {
			EnsembleAverager::ZeroFillMissing(dStack);
		}

		DataArray2D<float> dMean;
		averager.Mean(dStack, dPercent, dMean);

		DataArray2D<float> dAgree;
		DataArray2D<float> dBowl;
		DataArray2D<float> dModelStd;

		if (param.fMultiModel) {
			DataArray3D<float> dAgreeStack;
			ReadMemberStack(vecFiles, ensvar.strName + "Agree", shape, true,
				iYearBegin, nYears, dAgreeStack);
			averager.Mean(dAgreeStack, dPercent, dAgree);

			DataArray3D<float> dBowlStack;
			ReadMemberStack(vecFiles, ensvar.strName + "Bowl", shape, true,
				iYearBegin, nYears, dBowlStack);
			averager.Mean(dBowlStack, dPercent, dBowl);
			averager.StandardDeviation(dBowlStack, dPercent, dModelStd);

			averager.TruncateAboveBowl(
				vecSigma, sBasins, sLatitudes, dBowlLimit, dModelStd);

		} else {
			averager.SignAgreement(dStack, dPercent, dAgree);
			dBowl = dMean;
		}

		averager.TruncateAboveBowl(vecSigma, sBasins, sLatitudes, dBowlLimit, dAgree);
		averager.TruncateAboveBowl(vecSigma, sBasins, sLatitudes, dBowlLimit, dBowl);

		NcVar * varMean = AddNcFillVar(ncOut, ensvar.strName, ncFloat, vecZonalDims);
		NcVar * varAgree = AddNcFillVar(ncOut, ensvar.strName + "Agree", ncFloat, vecZonalDims,
			"Sign agreement of members");
		NcVar * varBowl = AddNcFillVar(ncOut, ensvar.strName + "Bowl", ncFloat, vecZonalDims,
			"Ensemble mean below the bowl");
		WriteEnsembleField(varMean, dMean);
		WriteEnsembleField(varAgree, dAgree);
		WriteEnsembleField(varBowl, dBowl);

		if (param.fMultiModel) {
			NcVar * varModelStd = AddNcFillVar(ncOut, ensvar.strName + "ModStd", ncFloat,
				vecZonalDims, "Inter-model standard deviation below the bowl");
			WriteEnsembleField(varModelStd, dModelStd);
		}
	}

	AnnounceEndBlock("Done");

	ncOut.close();

	AnnounceBanner();

} catch(Exception & e) {
	Announce(e.ToString().c_str());
#if defined(ISOBIN_MPIOMP)
	MPI_Abort(MPI_COMM_WORLD, -1);
#endif
	return (-1);
}

#if defined(ISOBIN_MPIOMP)
	// Deinitialize MPI
	MPI_Finalize();
#endif

	return 0;
}

///////////////////////////////////////////////////////////////////////////////

