#ifndef MERGERLOGIC_H
#define MERGERLOGIC_H

#include <vector>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <optional>
#include <utility>
#include <ostream>

#include <fpdfview.h>

class wxConfigBase;

namespace fs = std::filesystem;

// Raised by the output path resolver when every numbered candidate is taken
class TooManyRenameAttemptsError : public std::runtime_error
{
public:
	TooManyRenameAttemptsError(int attempts, int maxAttempts, const std::string &fileName);

	int attempts() const { return m_attempts; }
	int maxAttempts() const { return m_maxAttempts; }
	const std::string &fileName() const { return m_fileName; }

private:
	int m_attempts;
	int m_maxAttempts;
	std::string m_fileName;
};

// Process exit codes reported by the command-line merger
enum class MergeExitCode
{
	Success = 0,
	MergeFailed = 1,
	InvalidArguments = 2,
	TooManyRenameAttempts = 3
};

// Rule set used to decide whether a path is syntactically legal
enum class PathPlatform
{
	Posix,
	Windows
};

struct MergeSettings
{
	std::string defaultFileName = "merged.pdf";
	int maxRenameAttempts = 20;
	bool verbose = false;
};

struct MergeResult
{
	bool success = false;
	std::string errorMessage;
	fs::path failedInput; // Input that could not be opened or imported, if any
	int totalPages = 0;
	std::vector<int> pagesPerInput;
};

// Keeps PDFium initialised while at least one scope is alive
class PdfiumLibraryScope
{
public:
	PdfiumLibraryScope();
	~PdfiumLibraryScope();

	PdfiumLibraryScope(const PdfiumLibraryScope &) = delete;
	PdfiumLibraryScope &operator=(const PdfiumLibraryScope &) = delete;

private:
	static int s_activeScopes;
};

class MergerLogic
{
public:
	static std::pair<std::string, std::vector<std::string>> SplitFileName(const std::string &fileName);
	static std::optional<std::string> ValidateFilePath(const std::string &path, PathPlatform platform = NativePathPlatform);
	static std::string DescribePdfError(unsigned long errorCode);
	static std::string FormatArgumentDetails(const std::vector<std::string> &inputFiles, const std::string &outFile);

	static bool WriteDocument(FPDF_DOCUMENT document, const fs::path &outputPath, std::string &errorMessage);
	static std::optional<int> CountPages(const fs::path &path);

	static fs::path resolveOutputPath(const fs::path &requestedPath, const std::string &defaultFileName, int maxAttempts);
	static MergeResult performMerge(const fs::path &outputPath, const std::vector<fs::path> &inputPaths);
	static MergeSettings loadSettings(const wxConfigBase *cfg);
	static MergeExitCode runMerge(const std::vector<std::string> &inputFiles, const std::string &outFile,
								  const std::optional<long> &maxAttemptsOverride, const MergeSettings &settings,
								  std::ostream &details);

	static const std::string DefaultOutputFileName;
	static const int DefaultMaxRenameAttempts;
	static const PathPlatform NativePathPlatform;
};

#endif // MERGERLOGIC_H
