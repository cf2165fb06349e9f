#ifndef APP_H
#define APP_H

#include <wx/app.h>
#include <wx/cmdline.h>

#include "CommandLine.h"
#include "MergerLogic.h"

class App : public wxAppConsole
{
public:
	bool OnInit() override;
	int OnRun() override;

	void OnInitCmdLine(wxCmdLineParser &parser) override;
	bool OnCmdLineParsed(wxCmdLineParser &parser) override;
	bool OnCmdLineHelp(wxCmdLineParser &parser) override;

private:
	MergeSettings m_settings;
	CommandLineArguments m_arguments;
	bool m_helpShown = false; // Usage was printed, nothing to merge
};

wxDECLARE_APP(App);

#endif // APP_H
