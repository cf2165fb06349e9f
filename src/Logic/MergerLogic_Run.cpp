#include "MergerLogic.h"

#include <wx/log.h>

#include <filesystem>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Runs one command-line merge: validates the arguments, echoes them to 'details',
// resolves a free output path and merges; the returned code is the process exit code
MergeExitCode MergerLogic::runMerge(const std::vector<std::string> &inputFiles, const std::string &outFile,
									const std::optional<long> &maxAttemptsOverride, const MergeSettings &settings,
									std::ostream &details)
{
	std::vector<std::string> argumentErrors;

	int maxAttempts = settings.maxRenameAttempts;
	if (maxAttemptsOverride)
	{
		const long requested = *maxAttemptsOverride;
		if (requested < 0)
		{
			argumentErrors.push_back("argument -n/--max-attempts: must not be negative (" + std::to_string(requested) + ")");
		}
		else if (requested > std::numeric_limits<int>::max())
		{
			argumentErrors.push_back("argument -n/--max-attempts: must not exceed " +
									 std::to_string(std::numeric_limits<int>::max()) + " (" + std::to_string(requested) + ")");
		}
		else
		{
			maxAttempts = static_cast<int>(requested);
		}
	}

	if (inputFiles.empty())
	{
		argumentErrors.push_back("argument inputfiles: at least one input file is required");
	}
	for (const auto &input : inputFiles)
	{
		if (auto problem = ValidateFilePath(input))
		{
			argumentErrors.push_back("argument inputfiles: '" + input + "': " + *problem);
		}
	}
	if (auto problem = ValidateFilePath(outFile))
	{
		argumentErrors.push_back("argument -o/--outfile: '" + outFile + "': " + *problem);
	}

	if (!argumentErrors.empty())
	{
		for (const auto &message : argumentErrors)
		{
			wxLogError("%s", message.c_str());
		}
		return MergeExitCode::InvalidArguments;
	}

	details << FormatArgumentDetails(inputFiles, outFile);
	details.flush();

	fs::path resolvedOutFile;
	try
	{
		resolvedOutFile = resolveOutputPath(fs::u8path(outFile), settings.defaultFileName, maxAttempts);
	}
	catch (const TooManyRenameAttemptsError &error)
	{
		// The merge is not attempted when no free output name exists
		wxLogError("%s", error.what());
		return MergeExitCode::TooManyRenameAttempts;
	}

	std::vector<fs::path> inputPaths;
	inputPaths.reserve(inputFiles.size());
	for (const auto &input : inputFiles)
	{
		inputPaths.push_back(fs::u8path(input));
	}

	MergeResult result = performMerge(resolvedOutFile, inputPaths);
	if (!result.success)
	{
		wxLogError("%s", result.errorMessage.c_str());
		wxLogError("Merge aborted, no output was written.");
		return MergeExitCode::MergeFailed;
	}

	wxLogMessage("Merged %lu file(s) with %d page(s) into '%s'", static_cast<unsigned long>(inputPaths.size()),
				 result.totalPages, resolvedOutFile.string().c_str());
	return MergeExitCode::Success;
}
