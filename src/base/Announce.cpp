///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
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

#ifdef ISOBIN_MPIOMP
#include <mpi.h>
#endif

#include "Announce.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Verbosity level.
///	</summary>
int g_iVerbosityLevel = 0;

///	<summary>
///		Output buffer.
///	</summary>
FILE * g_fpAnnounceOutput = stdout;

///	<summary>
///		Only output on rank 0.
///	</summary>
bool g_fOnlyOutputOnRankZero = false;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Maximum announcement buffer size.
///	</summary>
static const int AnnouncementBufferSize = 1024;

///	<summary>
///		Maximum indentation level.
///	</summary>
static const int MaximumIndentationLevel = 16;

///	<summary>
///		Banner size.
///	</summary>
static const int BannerSize = 60;

///	<summary>
///		Current indentation level.
///	</summary>
static int s_nIndentationLevel = 0;

///	<summary>
///		Flag indicating whether a start block is still dangling.
///	</summary>
static bool s_fBlockFlag = false;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Returns true if this process should not write announcements.
///	</summary>
static bool IsSilentRank() {
#ifdef ISOBIN_MPIOMP
	if (g_fOnlyOutputOnRankZero) {
		int nRank;
		MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
		if (nRank > 0) {
			return true;
		}
	}
#endif
	return false;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Format a message into a buffer of AnnouncementBufferSize, marking
///		truncated messages with an ellipsis.
///	</summary>
static void FormatAnnouncement(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc > AnnouncementBufferSize-2) {
		szBuffer[AnnouncementBufferSize-4] = '.';
		szBuffer[AnnouncementBufferSize-3] = '.';
		szBuffer[AnnouncementBufferSize-2] = '.';
		szBuffer[AnnouncementBufferSize-1] = '\0';
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write an indented line, closing any dangling block first.
///	</summary>
static void WriteIndentedLine(const char * szBuffer) {
	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
		s_fBlockFlag = false;
	}
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(g_fpAnnounceOutput, "..");
	}
	fprintf(g_fpAnnounceOutput, "%s\n", szBuffer);
	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	g_iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOnlyOutputOnRankZero() {
	g_fOnlyOutputOnRankZero = true;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	// Do not start a block at maximum indentation level
	if (s_nIndentationLevel == MaximumIndentationLevel) {
		return;
	}
	if ((szText == NULL) || IsSilentRank()) {
		return;
	}

	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(g_fpAnnounceOutput, "..");
	}
	fprintf(g_fpAnnounceOutput, "%s", szBuffer);

	s_fBlockFlag = true;
	s_nIndentationLevel++;

	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	AnnounceStartBlock("%s", szText);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	// Do not remove a block at minimum indentation level
	if (s_nIndentationLevel == 0) {
		return;
	}
	if (IsSilentRank()) {
		return;
	}

	if (szText != NULL) {
		char szBuffer[AnnouncementBufferSize];
		va_list arguments;
		va_start(arguments, szText);
		FormatAnnouncement(szBuffer, szText, arguments);
		va_end(arguments);

		// A dangling block is closed on the same line
		if (s_fBlockFlag) {
			s_fBlockFlag = false;
			fprintf(g_fpAnnounceOutput, ".. %s\n", szBuffer);
			fflush(g_fpAnnounceOutput);

		} else {
			WriteIndentedLine(szBuffer);
		}

	} else if (s_fBlockFlag) {
		s_fBlockFlag = false;
		fprintf(g_fpAnnounceOutput, "\n");
		fflush(g_fpAnnounceOutput);
	}

	s_nIndentationLevel--;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	if (szText == NULL) {
		AnnounceEndBlock(NULL);
	} else {
		AnnounceEndBlock("%s", szText);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {
	if (IsSilentRank()) {
		return;
	}

	if (szText == NULL) {
		if (s_fBlockFlag) {
			fprintf(g_fpAnnounceOutput, "\n");
			s_fBlockFlag = false;
		}
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}
	if ((szText == NULL) || IsSilentRank()) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {
	if (IsSilentRank()) {
		return;
	}

	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
		s_fBlockFlag = false;
	}

	// No text in banner
	if (szText == NULL) {
		for (int i = 0; i < BannerSize; i++) {
			fprintf(g_fpAnnounceOutput, "-");
		}
		fprintf(g_fpAnnounceOutput, "\n");
		fflush(g_fpAnnounceOutput);
		return;
	}

	// Text in banner
	int nLen = static_cast<int>(strlen(szText)) + 2;
	fprintf(g_fpAnnounceOutput, "--");
	if (nLen > BannerSize - 2) {
		fprintf(g_fpAnnounceOutput, "%s--", szText);
	} else {
		fprintf(g_fpAnnounceOutput, " %s ", szText);
		for (int i = 0; i < BannerSize - nLen - 2; i++) {
			fprintf(g_fpAnnounceOutput, "-");
		}
	}
	fprintf(g_fpAnnounceOutput, "\n");
	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

