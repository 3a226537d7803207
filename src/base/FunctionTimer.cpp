///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.cpp
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

#include "FunctionTimer.h"

///////////////////////////////////////////////////////////////////////////////

FunctionTimer::GroupDataMap FunctionTimer::m_mapGroupData;

///////////////////////////////////////////////////////////////////////////////

FunctionTimer::FunctionTimer(const char * szGroup) :
	m_fStopped(false),
	m_iElapsed(0)
{
	if (szGroup != NULL) {
		m_strGroup = szGroup;
	}
	gettimeofday(&m_tvStartTime, NULL);
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::Time(bool fDone) {
	if (m_fStopped) {
		return m_iElapsed;
	}

	timeval tvNow;
	gettimeofday(&tvNow, NULL);

	m_iElapsed =
	    MICROSECONDS_PER_SECOND * (tvNow.tv_sec - m_tvStartTime.tv_sec)
	    + (tvNow.tv_usec - m_tvStartTime.tv_usec);

	if (!fDone) {
		return m_iElapsed;
	}

	m_fStopped = true;

	if (m_strGroup == "") {
		return m_iElapsed;
	}

	GroupDataMap::iterator iter = m_mapGroupData.find(m_strGroup);
	if (iter != m_mapGroupData.end()) {
		iter->second.iTotalTime += m_iElapsed;

	} else {
		TimerGroupData tgd;
		tgd.iTotalTime = m_iElapsed;
		m_mapGroupData.insert(GroupDataMap::value_type(m_strGroup, tgd));
	}

	return m_iElapsed;
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::StopTime() {
	return Time(true);
}

///////////////////////////////////////////////////////////////////////////////

double FunctionTimer::GetTotalGroupSeconds(const char * szName) {
	GroupDataMap::const_iterator iter = m_mapGroupData.find(szName);
	if (iter == m_mapGroupData.end()) {
		return 0.0;
	}
	return static_cast<double>(iter->second.iTotalTime)
		/ static_cast<double>(MICROSECONDS_PER_SECOND);
}

///////////////////////////////////////////////////////////////////////////////

