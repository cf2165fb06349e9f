#include "MergerLogic.h"

#include <wx/log.h> // For wxLogVerbose progress output

#include <fpdfview.h>
#include <fpdf_edit.h> // For FPDF_CreateNewDocument
#include <fpdf_ppo.h>  // For FPDF_ImportPages
#include <fpdf_save.h> // For FPDF_SaveAsCopy and FPDF_FILEWRITE
#include <cpp/fpdf_scopers.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

int PdfiumLibraryScope::s_activeScopes = 0;

PdfiumLibraryScope::PdfiumLibraryScope()
{
	if (s_activeScopes++ == 0)
	{
		FPDF_InitLibrary();
	}
}

PdfiumLibraryScope::~PdfiumLibraryScope()
{
	if (--s_activeScopes == 0)
	{
		FPDF_DestroyLibrary();
	}
}

namespace
{
// Adapts an std::ofstream to PDFium's block writer callback
struct StreamFileWrite : FPDF_FILEWRITE
{
	std::ofstream *stream = nullptr;
};

int WriteBlockToStream(FPDF_FILEWRITE *pThis, const void *pData, unsigned long size)
{
	auto *writer = static_cast<StreamFileWrite *>(pThis);
	writer->stream->write(static_cast<const char *>(pData), static_cast<std::streamsize>(size));
	return writer->stream->good() ? 1 : 0;
}
} // namespace

// Saves 'document' in full to 'outputPath'; a partially written file is removed on failure
bool MergerLogic::WriteDocument(FPDF_DOCUMENT document, const fs::path &outputPath, std::string &errorMessage)
{
	std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
	if (!out.is_open())
	{
		errorMessage = "Failed to open output file for writing: " + outputPath.string();
		return false;
	}

	StreamFileWrite writer;
	writer.version = 1;
	writer.WriteBlock = &WriteBlockToStream;
	writer.stream = &out;

	bool saved = FPDF_SaveAsCopy(document, &writer, FPDF_NO_INCREMENTAL);
	out.close();
	if (saved && !out.fail())
	{
		return true;
	}

	errorMessage = "Failed to write merged document: " + outputPath.string();
	std::error_code removeEc;
	fs::remove(outputPath, removeEc);
	if (removeEc)
	{
		wxLogWarning("Could not remove incomplete output '%s': %s", outputPath.string().c_str(), removeEc.message().c_str());
	}
	return false;
}

// Returns the page count of the document at 'path', or nullopt if it cannot be opened
std::optional<int> MergerLogic::CountPages(const fs::path &path)
{
	PdfiumLibraryScope pdfium;
	ScopedFPDFDocument document(FPDF_LoadDocument(path.string().c_str(), nullptr));
	if (!document)
	{
		return std::nullopt;
	}
	return FPDF_GetPageCount(document.get());
}

// Appends every page of every input, in order, to a new document and writes it to outputPath
// Nothing is written unless all inputs were opened and imported
MergeResult MergerLogic::performMerge(const fs::path &outputPath, const std::vector<fs::path> &inputPaths)
{
	MergeResult result;
	result.success = false;

	if (inputPaths.empty())
	{
		result.errorMessage = "No input documents to merge.";
		return result;
	}

	try
	{
		// Declared first so it outlives every document handle below
		PdfiumLibraryScope pdfium;

		ScopedFPDFDocument merged(FPDF_CreateNewDocument());
		if (!merged)
		{
			result.errorMessage = "Failed to create the result document.";
			return result;
		}

		for (const auto &inputPath : inputPaths)
		{
			ScopedFPDFDocument source(FPDF_LoadDocument(inputPath.string().c_str(), nullptr));
			if (!source)
			{
				result.failedInput = inputPath;
				result.errorMessage = "Cannot open '" + inputPath.string() + "': " + DescribePdfError(FPDF_GetLastError());
				return result;
			}

			int pageCount = FPDF_GetPageCount(source.get());
			// PDFium refuses an import with an empty page set, so empty documents are skipped
			if (pageCount > 0)
			{
				int insertIndex = FPDF_GetPageCount(merged.get());
				if (!FPDF_ImportPages(merged.get(), source.get(), nullptr, insertIndex))
				{
					result.failedInput = inputPath;
					result.errorMessage = "Failed to append pages from '" + inputPath.string() + "'.";
					return result;
				}
			}

			result.pagesPerInput.push_back(pageCount);
			result.totalPages += pageCount;
			wxLogVerbose("Appended %d page(s) from '%s'", pageCount, inputPath.string().c_str());
		}

		// An output path without a directory component is written to the current directory
		fs::path outputDir = outputPath.parent_path();
		if (outputDir.empty())
		{
			outputDir = ".";
		}
		std::error_code dirEc;
		fs::create_directories(outputDir, dirEc);
		if (dirEc)
		{
			result.errorMessage = "Failed to create output directory '" + outputDir.string() + "': " + dirEc.message();
			return result;
		}

		if (!WriteDocument(merged.get(), outputPath, result.errorMessage))
		{
			return result;
		}

		wxLogVerbose("Wrote %d page(s) to '%s'", result.totalPages, outputPath.string().c_str());
	}
	catch (const fs::filesystem_error &ex)
	{
		result.errorMessage = "Filesystem Exception: " + std::string(ex.what());
		return result;
	}
	catch (const std::exception &ex)
	{
		result.errorMessage = "General Exception: " + std::string(ex.what());
		return result;
	}

	result.success = true;
	return result;
}
