#include "MergerLogic.h"

#include <wx/config.h>
#include <wx/log.h>

#include <limits>
#include <string>

// Loads merge defaults from config; missing or unusable entries keep the built-in defaults
MergeSettings MergerLogic::loadSettings(const wxConfigBase *cfg)
{
	MergeSettings settings;
	settings.defaultFileName = DefaultOutputFileName;
	settings.maxRenameAttempts = DefaultMaxRenameAttempts;

	if (!cfg)
		return settings; // Nothing to read if config system is unavailable

	wxString fileName = cfg->Read("/Merge/DefaultFileName", wxString::FromUTF8(DefaultOutputFileName.c_str()));
	fileName.Trim().Trim(false);
	if (fileName.IsEmpty())
	{
		wxLogWarning("Ignoring empty /Merge/DefaultFileName, using '%s'", DefaultOutputFileName.c_str());
	}
	else
	{
		settings.defaultFileName = std::string(fileName.utf8_str());
	}

	long maxAttempts = cfg->ReadLong("/Merge/MaxRenameAttempts", DefaultMaxRenameAttempts);
	if (maxAttempts < 0 || maxAttempts > std::numeric_limits<int>::max())
	{
		wxLogWarning("Ignoring out-of-range /Merge/MaxRenameAttempts (%ld), using %d", maxAttempts, DefaultMaxRenameAttempts);
	}
	else
	{
		settings.maxRenameAttempts = static_cast<int>(maxAttempts);
	}

	settings.verbose = cfg->ReadBool("/Merge/Verbose", false);
	return settings;
}
