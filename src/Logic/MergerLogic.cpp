#include "MergerLogic.h"

#include <string>

// Output file name used when the requested output path is a directory
const std::string MergerLogic::DefaultOutputFileName = "merged.pdf";

// Number of numbered candidates tried before the resolver gives up
const int MergerLogic::DefaultMaxRenameAttempts = 20;

#ifdef _WIN32
const PathPlatform MergerLogic::NativePathPlatform = PathPlatform::Windows;
#else
const PathPlatform MergerLogic::NativePathPlatform = PathPlatform::Posix;
#endif

TooManyRenameAttemptsError::TooManyRenameAttemptsError(int attempts, int maxAttempts, const std::string &fileName)
	: std::runtime_error("maximum number of renaming attempts (" + std::to_string(maxAttempts) + ") for '" + fileName +
						 "' has been exceeded."),
	  m_attempts(attempts),
	  m_maxAttempts(maxAttempts),
	  m_fileName(fileName)
{
}
