///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.h
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

#ifndef _FUNCTIONTIMER_H_
#define _FUNCTIONTIMER_H_

///////////////////////////////////////////////////////////////////////////////

#include <string>
#include <map>
#include <sys/time.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Wall-clock timer for a stage of processing.  Timers with a group
///		name add their elapsed time to a record shared by all timers of
///		that group, so per-chunk stages can be totalled over a run.
///	</summary>
class FunctionTimer {

public:
	///	<summary>
	///		Microseconds per second.
	///	</summary>
	static const unsigned long long MICROSECONDS_PER_SECOND = 1000000;

public:
	///	<summary>
	///		Accumulated time of a group.
	///	</summary>
	struct TimerGroupData {
		unsigned long long iTotalTime;
	};

	typedef std::map<std::string, TimerGroupData> GroupDataMap;

public:
	///	<summary>
	///		Constructor; the timer starts immediately.
	///	</summary>
	FunctionTimer(const char * szGroup = NULL);

	///	<summary>
	///		Destructor; stops the timer if still running.
	///	</summary>
	virtual ~FunctionTimer() {
		StopTime();
	}

	///	<summary>
	///		Elapsed time in microseconds.  If fDone is set the timer is
	///		stopped and the time is added to its group.
	///	</summary>
	unsigned long long Time(bool fDone = false);

	///	<summary>
	///		Stop the timer and return the elapsed time in microseconds.
	///	</summary>
	unsigned long long StopTime();

	///	<summary>
	///		Stop the timer and return the elapsed time in seconds.
	///	</summary>
	double StopTimeSeconds() {
		return static_cast<double>(StopTime())
			/ static_cast<double>(MICROSECONDS_PER_SECOND);
	}

public:
	///	<summary>
	///		Total time recorded by a group in seconds, zero if the group
	///		has no record.
	///	</summary>
	static double GetTotalGroupSeconds(const char * szName);

private:
	///	<summary>
	///		Time records of all groups.
	///	</summary>
	static GroupDataMap m_mapGroupData;

private:
	bool m_fStopped;

	unsigned long long m_iElapsed;

	timeval m_tvStartTime;

	std::string m_strGroup;
};

///////////////////////////////////////////////////////////////////////////////

#endif

