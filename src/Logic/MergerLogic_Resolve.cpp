#include "MergerLogic.h"

#include <wx/log.h> // For wxLogVerbose when a numbered name is chosen

#include <filesystem>
#include <string>
#include <vector>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

namespace // Anonymous namespace for internal linkage helper functions
{
// Treats a status error as an existing file so the resolver never hands out a path it could not check
bool PathIsTaken(const fs::path &path)
{
	std::error_code ec;
	bool exists = fs::exists(path, ec);
	return exists || ec;
}

// Rebuilds "<first><attempt>.<rest...>" in the same directory
fs::path BuildNumberedCandidate(const fs::path &directory, const std::string &firstSegment,
								const std::vector<std::string> &restSegments, int attempt)
{
	std::string candidateName = firstSegment + std::to_string(attempt);
	for (const auto &segment : restSegments)
	{
		candidateName += '.';
		candidateName += segment;
	}
	return directory.empty() ? fs::path(candidateName) : directory / candidateName;
}
} // namespace

// Turns a requested output path (file or directory) into a concrete path that does not exist yet,
// inserting an increasing number after the first dot-delimited segment of the file name on collision
// Throws TooManyRenameAttemptsError once maxAttempts numbered candidates are all taken
fs::path MergerLogic::resolveOutputPath(const fs::path &requestedPath, const std::string &defaultFileName, int maxAttempts)
{
	if (maxAttempts < 0)
	{
		maxAttempts = 0;
	}

	fs::path workingPath = requestedPath;

	// "out/" or an existing directory means "write the default file into this directory"
	std::error_code dirEc;
	if (!workingPath.has_filename() || fs::is_directory(workingPath, dirEc))
	{
		workingPath /= defaultFileName;
	}

	if (!PathIsTaken(workingPath))
	{
		return workingPath;
	}

	const fs::path directory = workingPath.parent_path();
	const auto [firstSegment, restSegments] = SplitFileName(workingPath.filename().string());

	int attempt = 0;
	fs::path candidate = workingPath;
	while (PathIsTaken(candidate))
	{
		++attempt;
		if (attempt > maxAttempts)
		{
			throw TooManyRenameAttemptsError(attempt, maxAttempts, requestedPath.string());
		}
		candidate = BuildNumberedCandidate(directory, firstSegment, restSegments, attempt);
	}

	wxLogVerbose("Output '%s' already exists, using '%s' instead", workingPath.string().c_str(), candidate.string().c_str());
	return candidate;
}
