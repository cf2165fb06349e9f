#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include "App.h"
#include <wx/config.h>
#include <wx/log.h>

#include <iostream>

wxIMPLEMENT_APP_CONSOLE(App);

bool App::OnInit()
{
	SetAppName("PdfMergeUtility");

	// Initialize the configuration system so stored defaults apply before the command line is parsed
	wxConfigBase::Set(new wxConfig(GetAppName()));
	m_settings = MergerLogic::loadSettings(wxConfigBase::Get());

	wxLog::DisableTimestamp();

	if (!wxAppConsole::OnInit())
	{
		delete wxConfigBase::Set(nullptr);
		return false;
	}
	return true;
}

void App::OnInitCmdLine(wxCmdLineParser &parser)
{
	DescribeCommandLine(parser, m_settings);
}

bool App::OnCmdLineParsed(wxCmdLineParser &parser)
{
	m_arguments = ReadCommandLine(parser, m_settings);
	return true;
}

// Prints usage and lets OnRun finish successfully instead of failing OnInit
bool App::OnCmdLineHelp(wxCmdLineParser &parser)
{
	parser.Usage();
	m_helpShown = true;
	return true;
}

int App::OnRun()
{
	if (m_helpShown)
	{
		return static_cast<int>(MergeExitCode::Success);
	}

	wxLog::SetVerbose(m_arguments.verbose);
	return static_cast<int>(MergerLogic::runMerge(m_arguments.inputFiles, m_arguments.outFile,
												  m_arguments.maxRenameAttempts, m_settings, std::cout));
}
