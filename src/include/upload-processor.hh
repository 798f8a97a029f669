#pragma once

#include <report.hh>
#include <report-builder.hh>
#include <path-resolver.hh>

#include <string>
#include <vector>

namespace covmerge
{
	class IFilter;
	class IPathResolver;
	class MergeContext;
	class PathTree;
	class UploadMergeEngine;

	// One uploaded coverage file
	class RawUpload
	{
	public:
		RawUpload(const std::string &filename, const std::string &contents) :
			m_filename(filename), m_contents(contents)
		{
		}

		std::string m_filename;
		std::string m_contents;
	};

	typedef std::vector<RawUpload> RawUploadList_t;

	enum ProcessingResult
	{
		PROCESS_OK,
		PROCESS_NO_DECODER,
		PROCESS_CORRUPT,
		PROCESS_EXPIRED,
		PROCESS_EMPTY,
	};

	/**
	 * Decodes the files of one upload and hands the resulting per-file
	 * reports to a merge transaction.
	 */
	class UploadProcessor
	{
	public:
		/**
		 * @param ctx the merge context
		 * @param toc the table of contents of the commit, may be empty
		 * @param flags the flags of the upload, which select the flag
		 *        scoped path rules
		 */
		UploadProcessor(MergeContext &ctx, const PathTree &toc, const FlagList_t &flags);

		~UploadProcessor();

		/**
		 * Decode one file and append it to @a engine. Errors only affect
		 * this file.
		 */
		enum ProcessingResult processFile(UploadMergeEngine &engine, const RawUpload &upload);

		/**
		 * Process all files of an upload.
		 *
		 * @return the number of files appended to @a engine
		 */
		unsigned int processUpload(UploadMergeEngine &engine, const RawUploadList_t &uploads);

		/**
		 * Set the lines the uploader declared as ignored. The paths are
		 * raw and resolved like the paths of the coverage files.
		 */
		void setIgnoredLines(const IgnoredLinesMap_t &rawIgnored);

		/**
		 * Resolved path to raw paths, over all processed files. Rejected
		 * paths are kept under the empty string.
		 */
		const IPathResolver::CalculatedPaths_t &getCalculatedPaths() const
		{
			return m_calculatedPaths;
		}

		/**
		 * Paths which resolved differently relative to the uploaded file.
		 */
		const IPathResolver::DisagreementList_t &getDisagreements() const
		{
			return m_disagreements;
		}

	private:
		void collectDiagnostics(const std::string &filename, IPathResolver &resolver);

		MergeContext &m_ctx;
		IFilter &m_filter;
		IPathResolver &m_resolver;

		IgnoredLinesMap_t m_ignoredLines;
		IPathResolver::CalculatedPaths_t m_calculatedPaths;
		IPathResolver::DisagreementList_t m_disagreements;
	};
}
