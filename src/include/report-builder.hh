#pragma once

#include <report.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace covmerge
{
	class IPathResolver;

	/**
	 * A test label as reported by a decoder: either an id from the
	 * decoder's own label table, or the label text. The empty text is
	 * the placeholder.
	 */
	class LabelHint
	{
	public:
		LabelHint(unsigned int id) :
			m_isId(true), m_id(id)
		{
		}

		LabelHint(const std::string &label) :
			m_isId(false), m_id(0), m_label(label)
		{
		}

		LabelHint(const char *label) :
			m_isId(false), m_id(0), m_label(label)
		{
		}

		bool m_isId;
		unsigned int m_id;
		std::string m_label;
	};

	// The labels of one test execution
	typedef std::vector<LabelHint> LabelHintGroup_t;
	typedef std::vector<LabelHintGroup_t> LabelHintList_t;

	/**
	 * Lines the uploader declared as not being code in one file, e.g.,
	 * blank lines and comments. With a non-zero m_eof, every line after
	 * it is ignored as well.
	 */
	class IgnoredLines
	{
	public:
		IgnoredLines() :
			m_eof(0)
		{
		}

		bool isIgnored(unsigned int lineNr) const
		{
			if (m_eof != 0 && lineNr > m_eof)
				return true;

			return m_lines.find(lineNr) != m_lines.end();
		}

		unsigned int m_eof;
		std::set<unsigned int> m_lines;
	};

	// Canonical or raw path -> ignored lines
	typedef std::map<std::string, IgnoredLines> IgnoredLinesMap_t;

	class BuilderSession;

	/**
	 * Lines of one resolved source file.
	 */
	class FileHandle
	{
	public:
		const std::string &getName() const
		{
			return m_file.m_name;
		}

		/**
		 * Add coverage for a line. Adding the same line again merges with
		 * what is already there. Ignored lines are dropped.
		 *
		 * @param lineNr the line number, starting at 1
		 * @param coverage the line value
		 * @param type line, branch or method
		 * @param partials column spans, may be empty
		 * @param missingBranches the missed branch ids, NULL if unknown
		 * @param complexity the complexity, if any
		 * @param labels one group of label hints per test execution
		 */
		void append(unsigned int lineNr, const Coverage &coverage,
				enum CoverageType type = COVERAGE_TYPE_LINE,
				const PartialList_t &partials = PartialList_t(),
				const BranchList_t *missingBranches = NULL,
				const Complexity &complexity = Complexity(),
				const LabelHintList_t &labels = LabelHintList_t());

	private:
		friend class BuilderSession;

		FileHandle(BuilderSession &session, const std::string &name);

		BuilderSession &m_session;
		ReportFile m_file;
	};

	/**
	 * Turns the decoded observations of one uploaded file into a report
	 * with a single session.
	 */
	class BuilderSession
	{
	public:
		/**
		 * @param resolver path resolution for this uploaded file
		 * @param sessionId the session all lines are attributed to
		 * @param supportsLabels keep per-label datapoints
		 * @param uploadName the uploaded file, for error reporting
		 */
		BuilderSession(IPathResolver &resolver, unsigned int sessionId,
				bool supportsLabels, const std::string &uploadName);

		~BuilderSession();

		/**
		 * Resolve a raw path and return the file to add lines to.
		 *
		 * @return the file, or NULL if the path was rejected. The handle
		 * is owned by the session.
		 */
		FileHandle *createFile(const std::string &rawPath);

		/**
		 * Register an entry of the decoder's label table, referenced by
		 * id from later label hints.
		 */
		void setLabel(unsigned int id, const std::string &label);

		/**
		 * Set the ignored lines, keyed by canonical path.
		 */
		void setIgnoredLines(const IgnoredLinesMap_t &ignored);

		unsigned int getSessionId() const
		{
			return m_sessionId;
		}

		bool supportsLabels() const
		{
			return m_supportsLabels;
		}

		const std::string &getUploadName() const
		{
			return m_uploadName;
		}

		/**
		 * Return the report of all files with lines. When labels are
		 * supported it carries this session's labels index.
		 */
		Report finish();

	private:
		friend class FileHandle;

		typedef std::map<std::string, FileHandle *> FileHandleMap_t;
		typedef std::map<unsigned int, unsigned int> DecoderIdMap_t;

		LabelIdSet_t encodeLabels(const LabelHintGroup_t &group);

		bool isIgnored(const std::string &path, unsigned int lineNr) const;

		IPathResolver &m_resolver;
		unsigned int m_sessionId;
		bool m_supportsLabels;
		std::string m_uploadName;

		FileHandleMap_t m_files;
		LabelsIndex m_labels;
		DecoderIdMap_t m_decoderIds;
		LabelIdSet_t m_presentLabels;
		IgnoredLinesMap_t m_ignoredLines;
	};
}
