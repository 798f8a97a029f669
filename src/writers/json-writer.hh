#pragma once

#include <string>

namespace covmerge
{
	class IWriter;
	class Report;

	/**
	 * The per-file index with totals, the sessions and the report totals.
	 */
	std::string getJsonSummary(const Report &report);

	/**
	 * One chunk of line data per file, in the order of the summary index.
	 */
	std::string getChunks(const Report &report);

	IWriter &createJsonWriter(const std::string &summaryFile, const std::string &chunksFile);
}
