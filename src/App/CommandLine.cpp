#include "CommandLine.h"

#include <wx/string.h>

// Declares the merger's options; defaults shown in the help come from the loaded settings
void DescribeCommandLine(wxCmdLineParser &parser, const MergeSettings &settings)
{
	parser.AddSwitch("h", "help", "show this help message and exit", wxCMD_LINE_OPTION_HELP);
	parser.AddOption("o", "outfile",
					 wxString::Format("output file or directory of PDF merge, default='%s'", settings.defaultFileName.c_str()),
					 wxCMD_LINE_VAL_STRING);
	parser.AddOption("n", "max-attempts",
					 wxString::Format("numbered names to try when the output exists, default=%d", settings.maxRenameAttempts),
					 wxCMD_LINE_VAL_NUMBER);
	parser.AddSwitch("v", "verbose", "log every merge step");
	parser.AddParam("input PDF files to merge", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_MULTIPLE);
}

// Collects the parsed values, falling back to the settings where an option is absent
CommandLineArguments ReadCommandLine(const wxCmdLineParser &parser, const MergeSettings &settings)
{
	CommandLineArguments arguments;
	for (size_t i = 0; i < parser.GetParamCount(); ++i)
	{
		arguments.inputFiles.push_back(std::string(parser.GetParam(i).utf8_str()));
	}

	wxString outFile;
	arguments.outFile = parser.Found("o", &outFile) ? std::string(outFile.utf8_str()) : settings.defaultFileName;

	long maxAttempts = 0;
	if (parser.Found("n", &maxAttempts))
	{
		arguments.maxRenameAttempts = maxAttempts;
	}

	arguments.verbose = settings.verbose || parser.Found("v");
	return arguments;
}
