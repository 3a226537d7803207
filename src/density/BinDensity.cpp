///////////////////////////////////////////////////////////////////////////////
///
///	\file    BinDensity.cpp
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
#include "Constants.h"
#include "STLStringHelper.h"
#include "FunctionTimer.h"
#include "NetCDFUtilities.h"
#include "DataArray1D.h"
#include "DataArray2D.h"
#include "DataArray3D.h"

#include "EquationOfState.h"
#include "DensityGrid.h"
#include "IsopycnalBinning.h"
#include "AnnualAggregation.h"
#include "RegridMap.h"
#include "BasinMask.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>
#include <cstdlib>

#if defined(ISOBIN_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read the depth levels of a (time, lev, j, i) variable and the lower
///		bound of each depth cell.  Bounds come from the variable named by
///		the "bounds" attribute of the depth coordinate, or are placed
///		halfway between levels when absent.
///	</summary>
void ReadVerticalAxis(
	NcFile & ncFile,
	NcVar * var,
	const std::string & strFile,
	VerticalAxis & axis
) {
	NcDim * dimDepth = var->get_dim(1);
	NcVar * varDepth = NcGetVariable(ncFile, dimDepth->name(), strFile);
	NcReadCoordinate(varDepth, axis.vecDepth);

	const size_t nDepth = axis.vecDepth.size();
	axis.vecDepthBottom.resize(nDepth);

	NcAtt * attBounds = varDepth->get_att("bounds");
	if (attBounds != NULL) {
		std::string strBounds = attBounds->as_string(0);
		delete attBounds;

		NcVar * varBounds = NcGetVariable(ncFile, strBounds, strFile);
		if ((varBounds->num_dims() != 2) ||
		    (varBounds->get_dim(0)->size() != static_cast<long>(nDepth)) ||
		    (varBounds->get_dim(1)->size() != 2)
		) {
			_EXCEPTION2("Depth bounds \"%s\" in \"%s\" must have shape (lev, 2)",
				strBounds.c_str(), strFile.c_str());
		}

		std::vector<double> vecBounds(2 * nDepth);
		varBounds->set_cur(0, 0);
		if (!varBounds->get(&(vecBounds[0]), static_cast<long>(nDepth), 2)) {
			_EXCEPTION1("Error reading depth bounds \"%s\"", strBounds.c_str());
		}
		for (size_t k = 0; k < nDepth; k++) {
			axis.vecDepthBottom[k] = vecBounds[2*k+1];
		}

	} else {
		Announce("No depth bounds found; using midpoints between levels");
		for (size_t k = 0; k < nDepth; k++) {
			if (k != nDepth-1) {
				axis.vecDepthBottom[k] =
					0.5 * (axis.vecDepth[k] + axis.vecDepth[k+1]);
			} else if (nDepth > 1) {
				axis.vecDepthBottom[k] = axis.vecDepth[k]
					+ 0.5 * (axis.vecDepth[k] - axis.vecDepth[k-1]);
			} else {
				axis.vecDepthBottom[k] = 2.0 * axis.vecDepth[k];
			}
		}
	}

	axis.Validate();
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parse the time interval "all" or "start,count" with a one-based
///		start into a zero-based start and a count.
///	</summary>
void ParseTimeInterval(
	const std::string & strInterval,
	int nTimes,
	int & iStart,
	int & nCount
) {
	if (strInterval == "all") {
		iStart = 0;
		nCount = nTimes;
		return;
	}

	int iFirst;
	STLStringHelper::ParseIntegerPair(strInterval, iFirst, nCount);
	iStart = iFirst - 1;

	if ((iStart < 0) || (nCount <= 0) || (iStart + nCount > nTimes)) {
		_EXCEPTION2("Time interval (--timeint) \"%s\" out of range for %i time steps",
			strInterval.c_str(), nTimes);
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Set every cell outside the ocean of the target grid to FillValue.
///	</summary>
void MaskLand(
	const BasinMask & mask,
	float * dField
) {
	for (size_t i = 0; i < mask.GetCellCount(); i++) {
		if (!mask.Contains(BasinGlobal, i)) {
			dField[i] = FillValue;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Announce one binned column of the first month of a chunk.
///	</summary>
void AnnounceTestColumn(
	const VerticalAxis & axis,
	const IsopycnalBinner & binner,
	const DataArray3D<float> & dTheta,
	const DataArray3D<float> & dSalt,
	size_t iCell
) {
	const size_t nCells = dTheta.GetSize(2);

	GridColumn column(axis);
	column.Load(&(dTheta(0,0,0)), &(dSalt(0,0,0)), iCell, nCells);

	BinnedColumn binned;
	if (!binner.BinColumn(column, binned)) {
		Announce(1, "Test column %lu is land", iCell);
		return;
	}

	AnnounceStartBlock(1, "Test column");
	Announce(1, "cell %lu, bottom level %i", iCell, column.GetBottomIndex());
	for (int k = 0; k <= column.GetBottomIndex(); k++) {
		Announce(1, "z %8.2f  theta %7.3f  so %7.3f  sigma %7.3f",
			axis.vecDepth[k], column.vecTheta[k],
			column.vecSalt[k], column.vecSigma[k]);
	}
	const DensityGrid & grid = binner.GetGrid();
	for (size_t s = 0; s < grid.size(); s++) {
		if (IsFillValue(binned.vecDepth[s])) {
			continue;
		}
		Announce(1, "rho %6.2f  z %8.2f  thick %8.2f  theta %7.3f  so %7.3f",
			grid[s], binned.vecDepth[s], binned.vecThick[s],
			binned.vecTheta[s], binned.vecSalt[s]);
	}
	AnnounceEndBlock(1, NULL);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Variables of the annual output file.
///	</summary>
struct AnnualOutput {
	NcVar * varDepth;
	NcVar * varThick;
	NcVar * varVolume;
	NcVar * varTheta;
	NcVar * varSalt;
	NcVar * varPersist;

	NcVar * varBowlDepth;
	NcVar * varBowlSigma;
	NcVar * varBowlTheta;
	NcVar * varBowlSalt;

	NcVar * varBowlDepthMap;
	NcVar * varBowlSigmaMap;
	NcVar * varBowlThetaMap;
	NcVar * varBowlSaltMap;
	NcVar * varPersistentFraction;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Define dimensions, coordinates and variables of the annual file.
///	</summary>
void DefineAnnualOutput(
	NcFile & ncOut,
	int nYears,
	const DensityGrid & grid,
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon,
	AnnualOutput & out
) {
	NcDim * dimTime = ncOut.add_dim("time", nYears);
	NcDim * dimBasin = ncOut.add_dim("basin", BasinCount);
	NcDim * dimRho = ncOut.add_dim("rho", static_cast<long>(grid.size()));
	NcDim * dimLat = ncOut.add_dim("lat", static_cast<long>(vecLat.size()));
	NcDim * dimLon = ncOut.add_dim("lon", static_cast<long>(vecLon.size()));

	if ((dimTime == NULL) || (dimBasin == NULL) || (dimRho == NULL) ||
	    (dimLat == NULL) || (dimLon == NULL)
	) {
		_EXCEPTIONT("Error creating dimensions in annual output file");
	}

	std::vector<double> vecYears(nYears);
	for (int y = 0; y < nYears; y++) {
		vecYears[y] = static_cast<double>(y);
	}
	AddNcCoordinateVar(ncOut, dimTime, vecYears, "years since start of interval");

	std::vector<double> vecBasin(BasinCount);
	std::vector<std::string> vecBasinNames(BasinCount);
	for (int b = 0; b < BasinCount; b++) {
		vecBasin[b] = static_cast<double>(b);
		vecBasinNames[b] = BasinName(b);
	}
	NcVar * varBasin = AddNcCoordinateVar(ncOut, dimBasin, vecBasin);
	varBasin->add_att("long_name",
		STLStringHelper::ConcatenateStringVector(vecBasinNames, " ").c_str());

	AddNcCoordinateVar(ncOut, dimRho, grid.GetLevels(), "kg m-3");
	AddNcCoordinateVar(ncOut, dimLat, vecLat, "degrees_north");
	AddNcCoordinateVar(ncOut, dimLon, vecLon, "degrees_east");

	std::vector<NcDim *> vecZonalDims;
	vecZonalDims.push_back(dimTime);
	vecZonalDims.push_back(dimBasin);
	vecZonalDims.push_back(dimRho);
	vecZonalDims.push_back(dimLat);

	out.varDepth = AddNcFillVar(ncOut, "isondepth", ncFloat, vecZonalDims,
		"Depth of isopycnal", "m");
	out.varThick = AddNcFillVar(ncOut, "isonthick", ncFloat, vecZonalDims,
		"Thickness of isopycnal", "m");
	out.varVolume = AddNcFillVar(ncOut, "isonvol", ncFloat, vecZonalDims,
		"Volume of isopycnal", "1.e12 m3");
	out.varTheta = AddNcFillVar(ncOut, "isonthetao", ncFloat, vecZonalDims,
		"Potential temperature on isopycnal", "degrees_C");
	out.varSalt = AddNcFillVar(ncOut, "isonso", ncFloat, vecZonalDims,
		"Salinity on isopycnal", "psu");
	out.varPersist = AddNcFillVar(ncOut, "isonpers", ncFloat, vecZonalDims,
		"Persistence of isopycnal bins", "% of time");

	std::vector<NcDim *> vecBowlDims;
	vecBowlDims.push_back(dimTime);
	vecBowlDims.push_back(dimBasin);
	vecBowlDims.push_back(dimLat);

	out.varBowlDepth = AddNcFillVar(ncOut, "ptopdepth", ncFloat, vecBowlDims,
		"Depth of shallowest persistent ocean", "m");
	out.varBowlSigma = AddNcFillVar(ncOut, "ptopsigma", ncFloat, vecBowlDims,
		"Density of shallowest persistent ocean", "kg m-3");
	out.varBowlTheta = AddNcFillVar(ncOut, "ptopthetao", ncFloat, vecBowlDims,
		"Temperature of shallowest persistent ocean", "degrees_C");
	out.varBowlSalt = AddNcFillVar(ncOut, "ptopso", ncFloat, vecBowlDims,
		"Salinity of shallowest persistent ocean", "psu");

	std::vector<NcDim *> vecMapDims;
	vecMapDims.push_back(dimTime);
	vecMapDims.push_back(dimLat);
	vecMapDims.push_back(dimLon);

	out.varBowlDepthMap = AddNcFillVar(ncOut, "ptopdepthxy", ncFloat, vecMapDims,
		"Depth of shallowest persistent ocean", "m");
	out.varBowlSigmaMap = AddNcFillVar(ncOut, "ptopsigmaxy", ncFloat, vecMapDims,
		"Density of shallowest persistent ocean", "kg m-3");
	out.varBowlThetaMap = AddNcFillVar(ncOut, "ptopthetaoxy", ncFloat, vecMapDims,
		"Temperature of shallowest persistent ocean", "degrees_C");
	out.varBowlSaltMap = AddNcFillVar(ncOut, "ptopsoxy", ncFloat, vecMapDims,
		"Salinity of shallowest persistent ocean", "psu");
	out.varPersistentFraction = AddNcFillVar(ncOut, "persim", ncFloat, vecMapDims,
		"Persistence weighted by isopycnal thickness", "% of time");
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Regrid one year of annual fields, reduce them zonally per basin and
///		write them to the annual file.
///	</summary>
void WriteAnnualYear(
	const AnnualFields & annual,
	const RegridMap & map,
	const BasinMask & mask,
	const ZonalAverager & zonal,
	int iYear,
	AnnualOutput & out
) {
	const size_t nTarget = map.GetTargetSize();
	const size_t nLat = mask.GetLatitudes();
	const size_t nLon = mask.GetLongitudes();

	// Regrid
	FunctionTimer timerRegrid("regrid");

	DataArray2D<float> dDepth;
	DataArray2D<float> dThick;
	DataArray2D<float> dTheta;
	DataArray2D<float> dSalt;
	DataArray2D<float> dPersist;

	map.Apply(annual.dDepth, dDepth);
	map.Apply(annual.dThick, dThick);
	map.Apply(annual.dTheta, dTheta);
	map.Apply(annual.dSalt, dSalt);
	map.Apply(annual.dPersist, dPersist);

	DataArray1D<float> dBowlDepth(nTarget);
	DataArray1D<float> dBowlSigma(nTarget);
	DataArray1D<float> dBowlTheta(nTarget);
	DataArray1D<float> dBowlSalt(nTarget);
	DataArray1D<float> dPersistentFraction(nTarget);

	map.Apply(annual.dBowlDepth.GetData(), dBowlDepth.GetData());
	map.Apply(annual.dBowlSigma.GetData(), dBowlSigma.GetData());
	map.Apply(annual.dBowlTheta.GetData(), dBowlTheta.GetData());
	map.Apply(annual.dBowlSalt.GetData(), dBowlSalt.GetData());
	map.Apply(annual.dPersistentFraction.GetData(), dPersistentFraction.GetData());

	MaskLand(mask, dBowlDepth.GetData());
	MaskLand(mask, dBowlSigma.GetData());
	MaskLand(mask, dBowlTheta.GetData());
	MaskLand(mask, dBowlSalt.GetData());
	MaskLand(mask, dPersistentFraction.GetData());

	Announce(1, "Regridding: %1.3f s", timerRegrid.StopTimeSeconds());

	// Zonal means
	FunctionTimer timerZonal("zonal");

	DataArray3D<float> dZonalDepth;
	DataArray3D<float> dZonalThick;
	DataArray3D<float> dZonalVolume;
	DataArray3D<float> dZonalTheta;
	DataArray3D<float> dZonalSalt;

	zonal.ZonalMean(dDepth, dZonalDepth);
	zonal.ZonalMean(dThick, dZonalThick);
	zonal.ZonalMean(dTheta, dZonalTheta);
	zonal.ZonalMean(dSalt, dZonalSalt);
	zonal.ZonalVolume(dZonalThick, dZonalVolume);

	DataArray2D<float> dZonalBowlDepth;
	DataArray2D<float> dZonalBowlSigma;
	DataArray2D<float> dZonalBowlTheta;
	DataArray2D<float> dZonalBowlSalt;

	zonal.ZonalMean(dBowlDepth, dZonalBowlDepth);
	zonal.ZonalMean(dBowlSigma, dZonalBowlSigma);
	zonal.ZonalMean(dBowlTheta, dZonalBowlTheta);
	zonal.ZonalMean(dBowlSalt, dZonalBowlSalt);

	Announce(1, "Zonal mean: %1.3f s", timerZonal.StopTimeSeconds());

	FunctionTimer timerPersist("persistence");

	DataArray3D<float> dZonalPersist;
	zonal.ZonalMean(dPersist, dZonalPersist);

	Announce(1, "Persistence: %1.3f s", timerPersist.StopTimeSeconds());

	// Write
	const long nLevels = static_cast<long>(dDepth.GetSize(0));

	std::vector<long> vecZonalOffset(4, 0);
	std::vector<long> vecZonalCount(4);
	vecZonalOffset[0] = iYear;
	vecZonalCount[0] = 1;
	vecZonalCount[1] = BasinCount;
	vecZonalCount[2] = nLevels;
	vecZonalCount[3] = static_cast<long>(nLat);

	NcWriteSlab(out.varDepth, vecZonalOffset, vecZonalCount, dZonalDepth.GetData());
	NcWriteSlab(out.varThick, vecZonalOffset, vecZonalCount, dZonalThick.GetData());
	NcWriteSlab(out.varVolume, vecZonalOffset, vecZonalCount, dZonalVolume.GetData());
	NcWriteSlab(out.varTheta, vecZonalOffset, vecZonalCount, dZonalTheta.GetData());
	NcWriteSlab(out.varSalt, vecZonalOffset, vecZonalCount, dZonalSalt.GetData());
	NcWriteSlab(out.varPersist, vecZonalOffset, vecZonalCount, dZonalPersist.GetData());

	std::vector<long> vecBowlOffset(3, 0);
	std::vector<long> vecBowlCount(3);
	vecBowlOffset[0] = iYear;
	vecBowlCount[0] = 1;
	vecBowlCount[1] = BasinCount;
	vecBowlCount[2] = static_cast<long>(nLat);

	NcWriteSlab(out.varBowlDepth, vecBowlOffset, vecBowlCount, dZonalBowlDepth.GetData());
	NcWriteSlab(out.varBowlSigma, vecBowlOffset, vecBowlCount, dZonalBowlSigma.GetData());
	NcWriteSlab(out.varBowlTheta, vecBowlOffset, vecBowlCount, dZonalBowlTheta.GetData());
	NcWriteSlab(out.varBowlSalt, vecBowlOffset, vecBowlCount, dZonalBowlSalt.GetData());

	std::vector<long> vecMapOffset(3, 0);
	std::vector<long> vecMapCount(3);
	vecMapOffset[0] = iYear;
	vecMapCount[0] = 1;
	vecMapCount[1] = static_cast<long>(nLat);
	vecMapCount[2] = static_cast<long>(nLon);

	NcWriteSlab(out.varBowlDepthMap, vecMapOffset, vecMapCount, dBowlDepth.GetData());
	NcWriteSlab(out.varBowlSigmaMap, vecMapOffset, vecMapCount, dBowlSigma.GetData());
	NcWriteSlab(out.varBowlThetaMap, vecMapOffset, vecMapCount, dBowlTheta.GetData());
	NcWriteSlab(out.varBowlSaltMap, vecMapOffset, vecMapCount, dBowlSalt.GetData());
	NcWriteSlab(out.varPersistentFraction, vecMapOffset, vecMapCount,
		dPersistentFraction.GetData());
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
		_EXCEPTIONT("At present BinDensity only supports serial execution.");
	}
#endif

	// Input temperature file
	std::string strThetaFile;

	// Input salinity file
	std::string strSaltFile;

	// Temperature variable
	std::string strThetaVar;

	// Salinity variable
	std::string strSaltVar;

	// Cell area file on the source grid
	std::string strAreaFile;

	// Basin mask file on the target grid
	std::string strBasinFile;

	// Basin mask variable
	std::string strBasinVar;

	// Offline regrid map from source to target grid
	std::string strMapFile;

	// Output file
	std::string strOutputFile;

	// Time interval
	std::string strTimeInterval;

	// Density grid
	DensityGridParameters paramGrid;

	// Write monthly binned fields
	bool fMonthlyOutput;

	// Debug output
	bool fDebug;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strThetaFile, "thetao", "");
		CommandLineString(strSaltFile, "so", "");
		CommandLineString(strThetaVar, "tempvar", "thetao");
		CommandLineString(strSaltVar, "saltvar", "so");
		CommandLineString(strAreaFile, "areacello", "");
		CommandLineString(strBasinFile, "basinmask", "");
		CommandLineString(strBasinVar, "basinvar", "basinmask3");
		CommandLineString(strMapFile, "map", "");
		CommandLineString(strOutputFile, "out", "");
		CommandLineStringD(strTimeInterval, "timeint", "all", "[all|start,count]");
		CommandLineDouble(paramGrid.dMin, "rhomin", 19.0);
		CommandLineDouble(paramGrid.dIntermediate, "rhoint", 26.0);
		CommandLineDouble(paramGrid.dMax, "rhomax", 28.5);
		CommandLineDouble(paramGrid.dDeltaFine, "delfine", 0.2);
		CommandLineDouble(paramGrid.dDeltaCoarse, "delcoarse", 0.1);
		CommandLineBool(fMonthlyOutput, "mthout");
		CommandLineBool(fDebug, "debug");

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	if (fDebug) {
		AnnounceSetVerbosityLevel(1);
	}

	// Validate arguments
	if (strThetaFile.length() == 0) {
		_EXCEPTIONT("No temperature file (--thetao) specified");
	}
	if (strSaltFile.length() == 0) {
		_EXCEPTIONT("No salinity file (--so) specified");
	}
	if (strBasinFile.length() == 0) {
		_EXCEPTIONT("No basin mask file (--basinmask) specified");
	}
	if (strOutputFile.length() == 0) {
		_EXCEPTIONT("No output file (--out) specified");
	}
	if (fMonthlyOutput && (strAreaFile.length() == 0)) {
		_EXCEPTIONT("Monthly output (--mthout) requires a cell area file (--areacello)");
	}

	paramGrid.Validate();

	// Density grid
	DensityGrid grid(paramGrid);

	BinningParameters paramBinning;
	paramBinning.dStratificationThreshold = paramGrid.dDeltaFine;

	IsopycnalBinner binner(grid, paramBinning);
	AnnualAggregator aggregator(grid);

	Announce("Density grid has %lu levels from %1.2f to %1.2f",
		grid.size(), grid[0], grid[grid.size()-1]);

	// Open input files
	AnnounceStartBlock("Loading source grid");

	NcFile ncTheta(strThetaFile.c_str(), NcFile::ReadOnly);
	if (!ncTheta.is_valid()) {
		_EXCEPTION1("Unable to open temperature file \"%s\"", strThetaFile.c_str());
	}
	NcFile ncSalt(strSaltFile.c_str(), NcFile::ReadOnly);
	if (!ncSalt.is_valid()) {
		_EXCEPTION1("Unable to open salinity file \"%s\"", strSaltFile.c_str());
	}

	NcVar * varTheta = NcGetVariable(ncTheta, strThetaVar, strThetaFile);
	NcVar * varSalt = NcGetVariable(ncSalt, strSaltVar, strSaltFile);

	if (varTheta->num_dims() != 4) {
		_EXCEPTION1("Temperature variable \"%s\" must have dimensions (time, lev, j, i)",
			strThetaVar.c_str());
	}
	if (varSalt->num_dims() != 4) {
		_EXCEPTION1("Salinity variable \"%s\" must have dimensions (time, lev, j, i)",
			strSaltVar.c_str());
	}
	for (int d = 0; d < 4; d++) {
		if (varTheta->get_dim(d)->size() != varSalt->get_dim(d)->size()) {
			_EXCEPTION4("Dimension %i of \"%s\" (%li) and \"%s\" differ",
				d, strThetaVar.c_str(), varTheta->get_dim(d)->size(),
				strSaltVar.c_str());
		}
	}

	const int nTimes = static_cast<int>(varTheta->get_dim(0)->size());
	const long lDepth = varTheta->get_dim(1)->size();
	const long lSourceJ = varTheta->get_dim(2)->size();
	const long lSourceI = varTheta->get_dim(3)->size();
	const size_t sSourceCells = static_cast<size_t>(lSourceJ * lSourceI);

	VerticalAxis axis;
	ReadVerticalAxis(ncTheta, varTheta, strThetaFile, axis);

	Announce("Source grid has %li depth levels and %li x %li cells",
		lDepth, lSourceJ, lSourceI);

	int iTimeStart;
	int nTimeCount;
	ParseTimeInterval(strTimeInterval, nTimes, iTimeStart, nTimeCount);

	const int nYears = nTimeCount / MonthsPerYear;
	if (nYears == 0) {
		_EXCEPTION1("Time interval of %i months does not contain a whole year",
			nTimeCount);
	}
	if (nTimeCount % MonthsPerYear != 0) {
		Announce("WARNING: Trailing %i months do not form a whole year "
			"and are excluded from annual output", nTimeCount % MonthsPerYear);
	}

	// Cell area of the source grid
	DataArray2D<float> dSourceArea;
	if (strAreaFile.length() != 0) {
		NcFile ncArea(strAreaFile.c_str(), NcFile::ReadOnly);
		if (!ncArea.is_valid()) {
			_EXCEPTION1("Unable to open area file \"%s\"", strAreaFile.c_str());
		}
		NcVar * varArea = NcGetVariable(ncArea, "areacello", strAreaFile);
		if ((varArea->num_dims() != 2) ||
		    (varArea->get_dim(0)->size() != lSourceJ) ||
		    (varArea->get_dim(1)->size() != lSourceI)
		) {
			_EXCEPTION3("Cell area in \"%s\" does not match the source grid (%li x %li)",
				strAreaFile.c_str(), lSourceJ, lSourceI);
		}
		dSourceArea.Allocate(lSourceJ, lSourceI);

		std::vector<long> vecOffset(2, 0);
		std::vector<long> vecCount(2);
		vecCount[0] = lSourceJ;
		vecCount[1] = lSourceI;
		NcReadNormalised(varArea, vecOffset, vecCount, dSourceArea.GetData());
	}

	AnnounceEndBlock("Done");

	// Target grid and basins
	AnnounceStartBlock("Loading target grid");

	NcFile ncBasin(strBasinFile.c_str(), NcFile::ReadOnly);
	if (!ncBasin.is_valid()) {
		_EXCEPTION1("Unable to open basin mask file \"%s\"", strBasinFile.c_str());
	}
	NcVar * varBasin = NcGetVariable(ncBasin, strBasinVar, strBasinFile);
	if (varBasin->num_dims() != 2) {
		_EXCEPTION1("Basin mask \"%s\" must have dimensions (lat, lon)",
			strBasinVar.c_str());
	}

	std::vector<double> vecTargetLat;
	std::vector<double> vecTargetLon;
	NcReadCoordinate(
		NcGetVariable(ncBasin, varBasin->get_dim(0)->name(), strBasinFile),
		vecTargetLat);
	NcReadCoordinate(
		NcGetVariable(ncBasin, varBasin->get_dim(1)->name(), strBasinFile),
		vecTargetLon);

	const size_t nTargetLat = vecTargetLat.size();
	const size_t nTargetLon = vecTargetLon.size();

	RegridMap map;
	if (strMapFile.length() != 0) {
		map.Read(strMapFile);
		if ((map.GetTargetLatitudes().size() != nTargetLat) ||
		    (map.GetTargetLongitudes().size() != nTargetLon)
		) {
			_EXCEPTION4("Map target grid (%lu x %lu) does not match basin mask (%lu x %lu)",
				map.GetTargetLatitudes().size(), map.GetTargetLongitudes().size(),
				nTargetLat, nTargetLon);
		}
		if (map.GetSourceSize() != sSourceCells) {
			_EXCEPTION2("Map source grid (%lu) does not match input grid (%lu)",
				map.GetSourceSize(), sSourceCells);
		}
	} else {
		if (nTargetLat * nTargetLon != sSourceCells) {
			_EXCEPTION2("No map (--map) given and target grid (%lu) differs "
				"from source grid (%lu)", nTargetLat * nTargetLon, sSourceCells);
		}
		map.InitializeIdentity(vecTargetLat, vecTargetLon);
	}

	std::vector<float> vecBasinCodes(nTargetLat * nTargetLon);
	{
		std::vector<long> vecOffset(2, 0);
		std::vector<long> vecCount(2);
		vecCount[0] = static_cast<long>(nTargetLat);
		vecCount[1] = static_cast<long>(nTargetLon);
		NcReadNormalised(varBasin, vecOffset, vecCount, &(vecBasinCodes[0]));
	}

	BasinMask mask;
	mask.Initialize(&(vecBasinCodes[0]), nTargetLat, nTargetLon);

	DataArray2D<double> dTargetArea;
	ComputeCellArea(vecTargetLon, vecTargetLat, dTargetArea);

	ZonalAverager zonal(mask, dTargetArea);

	Announce("Target grid has %lu x %lu cells", nTargetLat, nTargetLon);

	AnnounceEndBlock("Done");

	// Output files
	AnnounceStartBlock("Initializing output");

	const std::string strCommandLine = GetCommandLineAsString(argc, argv);

	NcFile ncOut(strOutputFile.c_str(), NcFile::Replace);
	if (!ncOut.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"", strOutputFile.c_str());
	}

	AnnualOutput out;
	DefineAnnualOutput(ncOut, nYears, grid, vecTargetLat, vecTargetLon, out);
	NcAddHistory(ncOut, strCommandLine);

	NcFile * pncMonthly = NULL;
	NcVar * varMonthlyDepth = NULL;
	NcVar * varMonthlyThick = NULL;
	NcVar * varMonthlyTheta = NULL;
	NcVar * varMonthlySalt = NULL;

	if (fMonthlyOutput) {
		std::string strMonthlyFile = strOutputFile;
		if ((strMonthlyFile.length() > 3) &&
		    (strMonthlyFile.substr(strMonthlyFile.length()-3) == ".nc")
		) {
			strMonthlyFile = strMonthlyFile.substr(0, strMonthlyFile.length()-3);
		}
		strMonthlyFile += "_monthly.nc";

		pncMonthly = new NcFile(strMonthlyFile.c_str(), NcFile::Replace);
		if (!pncMonthly->is_valid()) {
			delete pncMonthly;
			_EXCEPTION1("Unable to open monthly output file \"%s\"",
				strMonthlyFile.c_str());
		}

		NcDim * dimTime = pncMonthly->add_dim("time", nTimeCount);
		NcDim * dimRho = pncMonthly->add_dim("rho",
			static_cast<long>(grid.GetAxis().size()));
		NcDim * dimJ = pncMonthly->add_dim(varTheta->get_dim(2)->name(), lSourceJ);
		NcDim * dimI = pncMonthly->add_dim(varTheta->get_dim(3)->name(), lSourceI);

		// Source time axis over the interval
		NcVar * varTimeIn = NcGetTimeVariable(ncTheta);
		if (varTimeIn != NULL) {
			std::vector<double> vecTime(nTimeCount);
			varTimeIn->set_cur(static_cast<long>(iTimeStart));
			if (!varTimeIn->get(&(vecTime[0]), nTimeCount)) {
				_EXCEPTIONT("Error reading time variable");
			}
			NcVar * varTimeOut = AddNcCoordinateVar(*pncMonthly, dimTime, vecTime);
			CopyNcVarAttributes(varTimeIn, varTimeOut);
		}

		AddNcCoordinateVar(*pncMonthly, dimRho, grid.GetAxis(), "kg m-3");

		std::vector<NcDim *> vecDims;
		vecDims.push_back(dimTime);
		vecDims.push_back(dimRho);
		vecDims.push_back(dimJ);
		vecDims.push_back(dimI);

		varMonthlyDepth = AddNcFillVar(*pncMonthly, "depth", ncFloat, vecDims,
			"Depth of isopycnal", "m");
		varMonthlyThick = AddNcFillVar(*pncMonthly, "thick", ncFloat, vecDims,
			"Thickness of isopycnal", "m");
		varMonthlyTheta = AddNcFillVar(*pncMonthly, "thetao", ncFloat, vecDims,
			"Potential temperature on isopycnal", "degrees_C");
		varMonthlySalt = AddNcFillVar(*pncMonthly, "so", ncFloat, vecDims,
			"Salinity on isopycnal", "psu");

		std::vector<NcDim *> vecAreaDims;
		vecAreaDims.push_back(dimJ);
		vecAreaDims.push_back(dimI);
		NcVar * varArea = AddNcFillVar(*pncMonthly, "area", ncFloat, vecAreaDims,
			"Cell area", "m2");

		std::vector<long> vecAreaOffset(2, 0);
		std::vector<long> vecAreaCount(2);
		vecAreaCount[0] = lSourceJ;
		vecAreaCount[1] = lSourceI;
		NcWriteSlab(varArea, vecAreaOffset, vecAreaCount, dSourceArea.GetData());

		NcAddHistory(*pncMonthly, strCommandLine);

		Announce("Monthly output in \"%s\"", strMonthlyFile.c_str());
	}

	AnnounceEndBlock("Done");

	// Process in chunks of whole years
	const int nChunkMonths =
		ComputeChunkMonths(sSourceCells * static_cast<size_t>(lDepth), nTimeCount);

	Announce("Processing %i months in chunks of %i months", nTimeCount, nChunkMonths);

	DataArray3D<float> dTheta;
	DataArray3D<float> dSalt;
	BinnedChunk chunk;
	AnnualFields annual;

	bool fTemperatureCorrected = false;
	bool fSalinityCorrected = false;

	for (int iChunk = 0; iChunk < nTimeCount; iChunk += nChunkMonths) {
		int nMonths = nChunkMonths;
		if (iChunk + nMonths > nTimeCount) {
			nMonths = nTimeCount - iChunk;
		}

		AnnounceStartBlock("Months %i to %i", iChunk + 1, iChunk + nMonths);

		// Read
		dTheta.Allocate(nMonths, lDepth, sSourceCells);
		dSalt.Allocate(nMonths, lDepth, sSourceCells);

		std::vector<long> vecOffset(4, 0);
		std::vector<long> vecCount(4);
		vecOffset[0] = iTimeStart + iChunk;
		vecCount[0] = nMonths;
		vecCount[1] = lDepth;
		vecCount[2] = lSourceJ;
		vecCount[3] = lSourceI;

		NcReadNormalised(varTheta, vecOffset, vecCount, dTheta.GetData());
		NcReadNormalised(varSalt, vecOffset, vecCount, dSalt.GetData());

		if (CorrectTemperatureUnits(dTheta.GetData(), dTheta.GetTotalSize())) {
			if (!fTemperatureCorrected) {
				Announce("Temperature in Kelvin converted to Celsius");
			}
			fTemperatureCorrected = true;
		}
		if (CorrectSalinityUnits(dSalt.GetData(), dSalt.GetTotalSize())) {
			if (!fSalinityCorrected) {
				Announce("Salinity fraction converted to psu");
			}
			fSalinityCorrected = true;
		}

		if (iChunk == 0) {
			AnnounceTestColumn(axis, binner, dTheta, dSalt, sSourceCells / 2);
		}

		// Bin
		FunctionTimer timerBin("binning");
		binner.BinChunk(axis, dTheta, dSalt, chunk);
		Announce(1, "Binning: %1.3f s", timerBin.StopTimeSeconds());

		if (pncMonthly != NULL) {
			std::vector<long> vecOutOffset(4, 0);
			std::vector<long> vecOutCount(4);
			vecOutOffset[0] = iChunk;
			vecOutCount[0] = nMonths;
			vecOutCount[1] = static_cast<long>(grid.size() + 1);
			vecOutCount[2] = lSourceJ;
			vecOutCount[3] = lSourceI;

			NcWriteSlab(varMonthlyDepth, vecOutOffset, vecOutCount, chunk.dDepth.GetData());
			NcWriteSlab(varMonthlyThick, vecOutOffset, vecOutCount, chunk.dThick.GetData());
			NcWriteSlab(varMonthlyTheta, vecOutOffset, vecOutCount, chunk.dTheta.GetData());
			NcWriteSlab(varMonthlySalt, vecOutOffset, vecOutCount, chunk.dSalt.GetData());
		}

		// Annual statistics
		const int nChunkYears = nMonths / MonthsPerYear;
		for (int y = 0; y < nChunkYears; y++) {
			FunctionTimer timerAnnual("annual");
			aggregator.Aggregate(chunk, y, annual);
			Announce(1, "Annual mean: %1.3f s", timerAnnual.StopTimeSeconds());

			WriteAnnualYear(annual, map, mask, zonal,
				iChunk / MonthsPerYear + y, out);
		}

		AnnounceEndBlock("Done");
	}

	if (pncMonthly != NULL) {
		pncMonthly->close();
		delete pncMonthly;
	}
	ncOut.close();

	AnnounceStartBlock(1, "Total time");
	Announce(1, "Binning: %1.3f s", FunctionTimer::GetTotalGroupSeconds("binning"));
	Announce(1, "Annual mean: %1.3f s", FunctionTimer::GetTotalGroupSeconds("annual"));
	Announce(1, "Regridding: %1.3f s", FunctionTimer::GetTotalGroupSeconds("regrid"));
	Announce(1, "Zonal mean: %1.3f s", FunctionTimer::GetTotalGroupSeconds("zonal"));
	Announce(1, "Persistence: %1.3f s", FunctionTimer::GetTotalGroupSeconds("persistence"));
	AnnounceEndBlock(1, NULL);

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

