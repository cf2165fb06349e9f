#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <wx/cmdline.h>

#include <optional>
#include <string>
#include <vector>

#include "MergerLogic.h"

// Values taken from the command line; range and path checks happen in MergerLogic::runMerge
struct CommandLineArguments
{
	std::vector<std::string> inputFiles;
	std::string outFile;
	std::optional<long> maxRenameAttempts;
	bool verbose = false;
};

void DescribeCommandLine(wxCmdLineParser &parser, const MergeSettings &settings);
CommandLineArguments ReadCommandLine(const wxCmdLineParser &parser, const MergeSettings &settings);

#endif // COMMANDLINE_H
