///////////////////////////////////////////////////////////////////////////////
///
///	\file    ComputeToE.cpp
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
#include "NetCDFUtilities.h"
#include "DataArray1D.h"
#include "DataArray2D.h"

#include "TimeOfEmergence.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

#if defined(ISOBIN_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read an entire (time, basin, rho, lat) variable as (time, point).
///	</summary>
void ReadZonalSeries(
	NcVar * var,
	const std::string & strFile,
	DataArray2D<float> & dField
) {
	if (var->num_dims() != 4) {
		_EXCEPTION2("Variable \"%s\" in \"%s\" must have dimensions (time, basin, rho, lat)",
			var->name(), strFile.c_str());
	}

	std::vector<long> vecOffset(4, 0);
	std::vector<long> vecCount(4);
	for (int d = 0; d < 4; d++) {
		vecCount[d] = var->get_dim(d)->size();
	}

	dField.Allocate(vecCount[0], vecCount[1] * vecCount[2] * vecCount[3]);
	NcReadNormalised(var, vecOffset, vecCount, dField.GetData());
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
		_EXCEPTIONT("At present TimeOfEmergence only supports serial execution.");
	}
#endif

	// Input file
	std::string strInputFile;

	// Input variable
	std::string strVarName;

	// Noise file
	std::string strNoiseFile;

	// Noise variable
	std::string strNoiseVarName;

	// Reference period
	std::string strReferencePeriod;

	// Domains for box-averaged emergence
	std::string strDomains;

	// Output file
	std::string strOutputFile;

	// Detection parameters
	EmergenceParameters param;

	// Debug output
	bool fDebug;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strInputFile, "in", "");
		CommandLineString(strVarName, "var", "");
		CommandLineString(strNoiseFile, "noise_in", "");
		CommandLineString(strNoiseVarName, "noise_var", "");
		CommandLineStringD(strReferencePeriod, "refperiod", "", "[p1,p2]");
		CommandLineDouble(param.dMultiplier, "mult", 2.0);
		CommandLineStringD(strDomains, "domains", "",
			"[latmin,latmax,rhomin,rhomax;...]");
		CommandLineString(strOutputFile, "out", "");
		CommandLineBool(fDebug, "debug");

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	if (fDebug) {
		AnnounceSetVerbosityLevel(1);
	}

	// Validate arguments
	if (strInputFile.length() == 0) {
		_EXCEPTIONT("No input file (--in) specified");
	}
	if (strVarName.length() == 0) {
		_EXCEPTIONT("No variable (--var) specified");
	}
	if (strOutputFile.length() == 0) {
		_EXCEPTIONT("No output file (--out) specified");
	}
	if (strReferencePeriod.length() == 0) {
		_EXCEPTIONT("No reference period (--refperiod) specified");
	}
	if (strNoiseVarName.length() == 0) {
		strNoiseVarName = strVarName;
	}

	STLStringHelper::ParseIntegerPair(
		strReferencePeriod, param.iReferenceBegin, param.iReferenceEnd);

	std::vector<EmergenceDomain> vecDomains;
	if (strDomains.length() != 0) {
		EmergenceDomain::ParseList(strDomains, vecDomains);
	}

	// Load the signal
	AnnounceStartBlock("Loading \"%s\"", strVarName.c_str());

	NcFile ncIn(strInputFile.c_str(), NcFile::ReadOnly);
	if (!ncIn.is_valid()) {
		_EXCEPTION1("Unable to open input file \"%s\"", strInputFile.c_str());
	}

	NcVar * varIn = NcGetVariable(ncIn, strVarName, strInputFile);

	DataArray2D<float> dField;
	ReadZonalSeries(varIn, strInputFile, dField);

	const long lBasins = varIn->get_dim(1)->size();
	const long lLevels = varIn->get_dim(2)->size();
	const long lLatitudes = varIn->get_dim(3)->size();
	const size_t nTimes = dField.GetSize(0);

	param.Validate(static_cast<int>(nTimes));

	std::vector<double> vecBasin;
	std::vector<double> vecSigma;
	std::vector<double> vecLat;
	NcReadCoordinate(
		NcGetVariable(ncIn, varIn->get_dim(1)->name(), strInputFile), vecBasin);
	NcReadCoordinate(
		NcGetVariable(ncIn, varIn->get_dim(2)->name(), strInputFile), vecSigma);
	NcReadCoordinate(
		NcGetVariable(ncIn, varIn->get_dim(3)->name(), strInputFile), vecLat);

	Announce("%lu time steps, %li basins, %li levels, %li latitudes",
		nTimes, lBasins, lLevels, lLatitudes);

	AnnounceEndBlock("Done");

	EmergenceDetector detector(param);

	DataArray2D<float> dSignal(dField);
	detector.ReferenceAnomaly(dSignal);

	// Noise
	AnnounceStartBlock("Computing noise");

	DataArray2D<float> dNoiseField;
	size_t iNoiseBegin = static_cast<size_t>(param.iReferenceBegin);
	size_t iNoiseEnd = static_cast<size_t>(param.iReferenceEnd);

	if (strNoiseFile.length() != 0) {
		NcFile ncNoise(strNoiseFile.c_str(), NcFile::ReadOnly);
		if (!ncNoise.is_valid()) {
			_EXCEPTION1("Unable to open noise file \"%s\"", strNoiseFile.c_str());
		}
		NcVar * varNoise = NcGetVariable(ncNoise, strNoiseVarName, strNoiseFile);
		ReadZonalSeries(varNoise, strNoiseFile, dNoiseField);

		if ((varNoise->get_dim(1)->size() != lBasins) ||
		    (varNoise->get_dim(2)->size() != lLevels) ||
		    (varNoise->get_dim(3)->size() != lLatitudes)
		) {
			_EXCEPTION2("Noise \"%s\" and signal \"%s\" have different shapes",
				strNoiseVarName.c_str(), strVarName.c_str());
		}

		iNoiseBegin = 0;
		iNoiseEnd = dNoiseField.GetSize(0);
		Announce("Noise from %lu steps of \"%s\"", iNoiseEnd, strNoiseFile.c_str());

	} else {
		dNoiseField = dField;
		Announce("Noise from reference period [%i, %i)",
			param.iReferenceBegin, param.iReferenceEnd);
	}

	DataArray1D<float> dNoise;
	EmergenceDetector::TemporalStandardDeviation(
		dNoiseField, iNoiseBegin, iNoiseEnd, dNoise);

	AnnounceEndBlock("Done");

	// Emergence per point
	AnnounceStartBlock("Detecting emergence");

	DataArray1D<int> nToE;
	detector.FindTimeOfEmergence(dSignal, dNoise, nToE);

	// Emergence of domain averages
	const size_t nDomains = vecDomains.size();
	DataArray2D<int> nDomainToE;
	if (nDomains != 0) {
		nDomainToE.Allocate(lBasins, nDomains);

		for (long b = 0; b < lBasins; b++) {
		for (size_t d = 0; d < nDomains; d++) {
			DataArray1D<float> dSeries;
			EmergenceDetector::AverageOverDomain(
				dSignal, b, vecSigma, vecLat, vecDomains[d], dSeries);

			DataArray1D<float> dNoiseSeries;
			EmergenceDetector::AverageOverDomain(
				dNoiseField, b, vecSigma, vecLat, vecDomains[d], dNoiseSeries);

			DataArray2D<float> dSeriesSignal(nTimes, 1);
			for (size_t t = 0; t < nTimes; t++) {
				dSeriesSignal(t,0) = dSeries(t);
			}
			DataArray2D<float> dSeriesNoise(dNoiseSeries.GetSize(0), 1);
			for (size_t t = 0; t < dNoiseSeries.GetSize(0); t++) {
				dSeriesNoise(t,0) = dNoiseSeries(t);
			}

			DataArray1D<float> dDomainNoise;
			EmergenceDetector::TemporalStandardDeviation(
				dSeriesNoise, iNoiseBegin, iNoiseEnd, dDomainNoise);

			DataArray1D<int> nSeriesToE;
			detector.FindTimeOfEmergence(dSeriesSignal, dDomainNoise, nSeriesToE);
			nDomainToE(b,d) = nSeriesToE(0);

			Announce(1, "Basin %li domain %lu: emergence at %i", b, d, nSeriesToE(0));
		}
		}
	}

	AnnounceEndBlock("Done");

	// Output
	AnnounceStartBlock("Writing output");

	NcFile ncOut(strOutputFile.c_str(), NcFile::Replace);
	if (!ncOut.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"", strOutputFile.c_str());
	}

	NcDim * dimBasin = ncOut.add_dim("basin", lBasins);
	NcDim * dimRho = ncOut.add_dim("rho", lLevels);
	NcDim * dimLat = ncOut.add_dim("lat", lLatitudes);
	if ((dimBasin == NULL) || (dimRho == NULL) || (dimLat == NULL)) {
		_EXCEPTIONT("Error creating dimensions in output file");
	}

	AddNcCoordinateVar(ncOut, dimBasin, vecBasin);
	AddNcCoordinateVar(ncOut, dimRho, vecSigma, "kg m-3");
	AddNcCoordinateVar(ncOut, dimLat, vecLat, "degrees_north");

	std::vector<NcDim *> vecDims;
	vecDims.push_back(dimBasin);
	vecDims.push_back(dimRho);
	vecDims.push_back(dimLat);

	NcVar * varToE = AddNcFillVar(ncOut, strVarName + "ToE1", ncInt, vecDims,
		"Time of emergence", "time steps since start");
	varToE->add_att("multiplier", param.dMultiplier);

	std::vector<long> vecOffset(3, 0);
	std::vector<long> vecCount(3);
	vecCount[0] = lBasins;
	vecCount[1] = lLevels;
	vecCount[2] = lLatitudes;
	NcWriteSlab(varToE, vecOffset, vecCount, nToE.GetData());

	if (nDomains != 0) {
		NcDim * dimDomain = ncOut.add_dim("domain", static_cast<long>(nDomains));
		if (dimDomain == NULL) {
			_EXCEPTIONT("Error creating dimensions in output file");
		}

		std::vector<NcDim *> vecDomainDims;
		vecDomainDims.push_back(dimBasin);
		vecDomainDims.push_back(dimDomain);

		NcVar * varDomainToE = AddNcFillVar(ncOut, strVarName + "ToE2", ncInt,
			vecDomainDims, "Time of emergence of domain average",
			"time steps since start");
		varDomainToE->add_att("domains", strDomains.c_str());

		std::vector<long> vecDomainOffset(2, 0);
		std::vector<long> vecDomainCount(2);
		vecDomainCount[0] = lBasins;
		vecDomainCount[1] = static_cast<long>(nDomains);
		NcWriteSlab(varDomainToE, vecDomainOffset, vecDomainCount, nDomainToE.GetData());
	}

	NcAddHistory(ncOut, GetCommandLineAsString(argc, argv));
	ncOut.close();

	AnnounceEndBlock("Done");

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

