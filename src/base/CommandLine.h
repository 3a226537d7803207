///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "STLStringHelper.h"
#include "Announce.h"
#include "Exception.h"

#include <vector>
#include <string>
#include <cstdlib>
#include <cstring>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line option of the form --name [value].
///	</summary>
class CommandLineArgument {
public:
	///	<summary>
	///		Constructor.
	///	</summary>
	CommandLineArgument(
		const std::string & strName,
		const std::string & strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription),
		m_fSeen(false)
	{ }

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		True if this option consumes a value.
	///	</summary>
	virtual bool TakesValue() const = 0;

	///	<summary>
	///		Print the usage line of this option.
	///	</summary>
	virtual void PrintUsage() const = 0;

	///	<summary>
	///		Activate a flag option.
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Set the value of this option from a string.
	///	</summary>
	virtual void SetValue(
		const std::string & strValue
	) {
		_EXCEPTION1("Option %s does not take a value", m_strName.c_str());
	}

public:
	///	<summary>
	///		Name of this option, including the leading dashes.
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description printed with the usage.
	///	</summary>
	std::string m_strDescription;

	///	<summary>
	///		Set once the option has appeared on the command line.
	///	</summary>
	bool m_fSeen;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A boolean flag, false unless present.
///	</summary>
class CommandLineArgumentBool : public CommandLineArgument {
public:
	CommandLineArgumentBool(
		bool & ref,
		const std::string & strName,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_fValue(ref)
	{
		m_fValue = false;
	}

	virtual bool TakesValue() const {
		return false;
	}

	virtual void PrintUsage() const {
		Announce("  %s <bool> [%s] %s",
			m_strName.c_str(),
			(m_fValue)?("true"):("false"),
			m_strDescription.c_str());
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A string option (file names, lists and ranges).
///	</summary>
class CommandLineArgumentString : public CommandLineArgument {
public:
	CommandLineArgumentString(
		std::string & ref,
		const std::string & strName,
		const std::string & strDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_strValue(ref)
	{
		m_strValue = strDefaultValue;
	}

	virtual bool TakesValue() const {
		return true;
	}

	virtual void PrintUsage() const {
		Announce("  %s <string> [\"%s\"] %s",
			m_strName.c_str(),
			m_strValue.c_str(),
			m_strDescription.c_str());
	}

	virtual void SetValue(
		const std::string & strValue
	) {
		m_strValue = strValue;
	}

public:
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A floating point option.
///	</summary>
class CommandLineArgumentDouble : public CommandLineArgument {
public:
	CommandLineArgumentDouble(
		double & ref,
		const std::string & strName,
		double dDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_dValue(ref)
	{
		m_dValue = dDefaultValue;
	}

	virtual bool TakesValue() const {
		return true;
	}

	virtual void PrintUsage() const {
		if (fabs(m_dValue) < 1.0e6) {
			Announce("  %s <double> [%f] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		} else {
			Announce("  %s <double> [%e] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		}
	}

	virtual void SetValue(
		const std::string & strValue
	) {
		if (!STLStringHelper::IsFloat(strValue)) {
			_EXCEPTION2("Invalid floating point value \"%s\" for option %s",
				strValue.c_str(), m_strName.c_str());
		}
		m_dValue = atof(strValue.c_str());
	}

public:
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Apply argv to the registered options.  Problems are announced and
///		reported through the return value so that all of them are listed
///		before the usage.
///	</summary>
inline bool ParseCommandLineArguments(
	int argc,
	char ** argv,
	std::vector<CommandLineArgument *> & vecArguments
) {
	bool fValid = true;

	for (int c = 1; c < argc; c++) {
		CommandLineArgument * pArg = NULL;
		for (size_t p = 0; p < vecArguments.size(); p++) {
			if (vecArguments[p]->m_strName == argv[c]) {
				pArg = vecArguments[p];
				break;
			}
		}
		if (pArg == NULL) {
			Announce("ERROR: Invalid argument \"%s\"", argv[c]);
			fValid = false;
			continue;
		}
		if (pArg->m_fSeen) {
			Announce("ERROR: Option %s given more than once", argv[c]);
			fValid = false;
		}
		pArg->m_fSeen = true;

		if (!pArg->TakesValue()) {
			pArg->Activate();
			continue;
		}

		// Values may begin with a single dash (negative numbers)
		if ((c + 1 >= argc) ||
		    ((strlen(argv[c+1]) > 2) &&
		     (argv[c+1][0] == '-') &&
		     (argv[c+1][1] == '-'))
		) {
			Announce("ERROR: Insufficient values for option %s", argv[c]);
			fValid = false;
			continue;
		}
		c++;
		pArg->SetValue(argv[c]);
	}

	return fValid;
}

///	<summary>
///		Print usage information for all registered options.
///	</summary>
inline void PrintCommandLineUsage(
	const char * szProgram,
	const std::vector<CommandLineArgument *> & vecArguments,
	bool fValid
) {
	if (!fValid) {
		Announce("\nUsage: %s <Argument List>", szProgram);
	}
	Announce("Arguments:");
	for (size_t p = 0; p < vecArguments.size(); p++) {
		vecArguments[p]->PrintUsage();
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line parameters.
///	</summary>
#define BeginCommandLine() \
	{ bool _validCommandLine = true; \
	  std::vector<CommandLineArgument*> _vecArguments;

///	<summary>
///		Define a boolean flag.
///	</summary>
#define CommandLineBool(ref, name) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, ""));

///	<summary>
///		Define a string parameter.
///	</summary>
#define CommandLineString(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, ""));

///	<summary>
///		Define a string parameter with a description of its format.
///	</summary>
#define CommandLineStringD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, desc));

///	<summary>
///		Define a floating point parameter.
///	</summary>
#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

///	<summary>
///		Parse argv against the parameters defined so far.
///	</summary>
#define ParseCommandLine(argc, argv) \
	try { \
		_validCommandLine = \
			ParseCommandLineArguments(argc, argv, _vecArguments); \
	} catch(Exception & _e) { \
		Announce(_e.ToString().c_str()); \
		_validCommandLine = false; \
	}

///	<summary>
///		End the definition of command line parameters.  An invalid command
///		line throws after the usage has been printed.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv[0], _vecArguments, _validCommandLine); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
		if (!_validCommandLine) { \
			_EXCEPTIONT("Invalid command line"); \
		} \
	}

///	<summary>
///		Concatenate the command line into a string.
///	</summary>
inline std::string GetCommandLineAsString(int argc, char ** argv) {
	std::string strCommandLine;
	for (int i = 0; i < argc; i++) {
		strCommandLine += argv[i];
		if (i != argc-1) {
			strCommandLine += " ";
		}
	}
	return strCommandLine;
}

///////////////////////////////////////////////////////////////////////////////

#endif

