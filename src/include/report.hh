#pragma once

#include <coverage.hh>
#include <labels.hh>

#include <stddef.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace covmerge
{
	enum CoverageType
	{
		COVERAGE_TYPE_LINE   = 0,
		COVERAGE_TYPE_BRANCH = 1,
		COVERAGE_TYPE_METHOD = 2,
	};

	/**
	 * Branch wins over method, which wins over a plain line.
	 */
	enum CoverageType mergeCoverageType(enum CoverageType a, enum CoverageType b);

	typedef std::set<unsigned int> SessionIdSet_t;
	typedef std::vector<std::string> BranchList_t;
	typedef std::vector<std::string> FlagList_t;

	/**
	 * Cyclomatic complexity, either a plain value (m_total == 0) or a
	 * covered/total pair.
	 */
	class Complexity
	{
	public:
		Complexity() :
			m_valid(false), m_covered(0), m_total(0)
		{
		}

		Complexity(unsigned int covered, unsigned int total) :
			m_valid(true), m_covered(covered), m_total(total)
		{
		}

		bool operator==(const Complexity &other) const
		{
			return m_valid == other.m_valid && m_covered == other.m_covered &&
					m_total == other.m_total;
		}

		std::string toString() const;

		bool m_valid;
		unsigned int m_covered;
		unsigned int m_total;
	};

	Complexity mergeComplexity(const Complexity &a, const Complexity &b);

	/**
	 * One session's contribution to a line.
	 */
	class LineSession
	{
	public:
		LineSession() :
			m_id(0), m_hasMissingBranches(false)
		{
		}

		LineSession(unsigned int id, const Coverage &coverage) :
			m_id(id), m_coverage(coverage), m_hasMissingBranches(false)
		{
		}

		/**
		 * Merge another observation from the same session. Missing
		 * branches are unioned, partial spans combined.
		 */
		void merge(const LineSession &other);

		void setMissingBranches(const BranchList_t &branches);

		bool operator==(const LineSession &other) const;

		unsigned int m_id;
		Coverage m_coverage;
		bool m_hasMissingBranches;
		BranchList_t m_missingBranches; // Sorted and unique
		PartialList_t m_partials;
		Complexity m_complexity;
	};

	/**
	 * Coverage of a line by one session under one set of test labels.
	 */
	class CoverageDatapoint
	{
	public:
		CoverageDatapoint() :
			m_sessionId(0), m_type(COVERAGE_TYPE_LINE)
		{
		}

		CoverageDatapoint(unsigned int sessionId, const Coverage &coverage,
				enum CoverageType type, const LabelIdSet_t &labelIds) :
			m_sessionId(sessionId), m_coverage(coverage), m_type(type), m_labelIds(labelIds)
		{
		}

		// Ordered by session, coverage, type and labels
		bool operator<(const CoverageDatapoint &other) const;

		bool operator==(const CoverageDatapoint &other) const;

		unsigned int m_sessionId;
		Coverage m_coverage;
		enum CoverageType m_type;
		LabelIdSet_t m_labelIds;
	};

	typedef std::vector<LineSession> LineSessionList_t;
	typedef std::vector<CoverageDatapoint> DatapointList_t;

	class Line
	{
	public:
		Line() :
			m_type(COVERAGE_TYPE_LINE), m_hasDatapoints(false)
		{
		}

		/**
		 * Merge another line into this one. Sessions present in both are
		 * merged as duplicate observations, the line value is then
		 * recalculated across sessions.
		 */
		void merge(const Line &other);

		/**
		 * Recalculate the line value and complexity from the sessions.
		 */
		void recalculate();

		/**
		 * Drop everything a session contributed.
		 *
		 * @return true if the line changed
		 */
		bool removeSession(unsigned int id);

		const LineSession *getSession(unsigned int id) const;

		bool operator==(const Line &other) const;

		Coverage m_coverage;
		enum CoverageType m_type;
		LineSessionList_t m_sessions; // Sorted by session id
		// Absent and empty are different: absent means no label support
		bool m_hasDatapoints;
		DatapointList_t m_datapoints; // Sorted
		Complexity m_complexity;
	};

	class ReportTotals
	{
	public:
		ReportTotals() :
			m_files(0), m_lines(0), m_hits(0), m_misses(0), m_partials(0),
			m_branches(0), m_methods(0), m_sessions(0), m_complexity(0),
			m_complexityTotal(0)
		{
		}

		void add(const ReportTotals &other);

		/**
		 * Coverage in percent with up to five decimals, or an empty
		 * string when there are no lines.
		 */
		std::string getCoverage() const;

		bool operator==(const ReportTotals &other) const;

		unsigned int m_files;
		unsigned int m_lines;
		unsigned int m_hits;
		unsigned int m_misses;
		unsigned int m_partials;
		unsigned int m_branches;
		unsigned int m_methods;
		unsigned int m_sessions;
		unsigned int m_complexity;
		unsigned int m_complexityTotal;
	};

	class ReportFile
	{
	public:
		typedef std::map<unsigned int, Line> LineMap_t;

		ReportFile()
		{
		}

		ReportFile(const std::string &name) :
			m_name(name)
		{
		}

		/**
		 * Add a line, merging with the line already there.
		 */
		void append(unsigned int lineNr, const Line &line);

		const Line *getLine(unsigned int lineNr) const;

		void merge(const ReportFile &other);

		// Drop lines without sessions
		void removeEmptyLines();

		bool isEmpty() const;

		ReportTotals getTotals() const;

		std::string m_name;
		LineMap_t m_lines;
	};

	class Session
	{
	public:
		enum SessionType
		{
			SESSION_UPLOADED       = 0,
			SESSION_CARRIEDFORWARD = 1,
		};

		typedef std::map<std::string, std::string> EnvMap_t;

		Session() :
			m_id(0), m_type(SESSION_UPLOADED)
		{
		}

		bool hasFlag(const std::string &flag) const;

		unsigned int m_id;
		FlagList_t m_flags;
		enum SessionType m_type;
		std::string m_name;
		std::string m_provider;
		std::string m_buildCode;
		std::string m_jobCode;
		std::string m_buildUrl;
		EnvMap_t m_env;
		ReportTotals m_totals;
	};

	/**
	 * A coverage report: files, the sessions that contributed to them and
	 * an optional labels index.
	 *
	 * Reports are values. Copying one and replacing the original with
	 * the modified copy is how merge transactions avoid leaving a half
	 * updated report behind.
	 */
	class Report
	{
	public:
		typedef std::map<std::string, ReportFile> FileMap_t;
		typedef std::map<unsigned int, Session> SessionMap_t;
		typedef std::map<unsigned int, unsigned int> LabelIdMap_t;

		Report();

		const ReportFile *getFile(const std::string &name) const;

		const FileMap_t &getFiles() const;

		/**
		 * Merge a file into the report.
		 */
		void append(const ReportFile &file);

		/**
		 * Merge the files of another report. Sessions and labels index
		 * are not touched.
		 */
		void merge(const Report &other);

		/**
		 * Reserve a session id. Ids are never handed out twice, even when
		 * sessions are deleted.
		 */
		unsigned int allocateSessionId();

		unsigned int getNextSessionId() const;

		// Add a session with an id from allocateSessionId
		void addSession(const Session &session);

		const Session *getSession(unsigned int id) const;

		const SessionMap_t &getSessions() const;

		Session *getSession(unsigned int id);

		/**
		 * Remove a session and all its line contributions.
		 */
		bool deleteSession(unsigned int id);

		void deleteMultipleSessions(const SessionIdSet_t &ids);

		/**
		 * Remove the datapoints of the sessions in @a sessionIds whose
		 * labels are all in @a labels. A session which loses all its
		 * datapoints on a line no longer contributes to that line.
		 */
		void deleteLabels(const SessionIdSet_t &sessionIds, const LabelIdSet_t &labels);

		/**
		 * Labels a session contributes, without the placeholder.
		 */
		LabelIdSet_t getLabelsForSession(unsigned int id) const;

		/**
		 * All labels used by any datapoint, including the placeholder.
		 */
		LabelIdSet_t getAllLabels() const;

		/**
		 * Rewrite label ids in all datapoints. Ids not in @a mapping are
		 * left alone.
		 */
		void remapLabels(const LabelIdMap_t &mapping);

		bool hasLabelsIndex() const;

		const LabelsIndex &getLabelsIndex() const;

		LabelsIndex &getLabelsIndex();

		void setLabelsIndex(const LabelsIndex &index);

		void clearLabelsIndex();

		// No files with lines
		bool isEmpty() const;

		ReportTotals getTotals() const;

		/**
		 * Serialize the report to a binary blob, free() it when done.
		 */
		void *marshal(size_t *szOut) const;

		/**
		 * Load a blob from marshal().
		 *
		 * @return false if the data is corrupt or of the wrong version
		 */
		bool unMarshal(const void *data, size_t sz);

	private:
		void removeEmptyFiles();

		FileMap_t m_files;
		SessionMap_t m_sessions;
		bool m_hasLabelsIndex;
		LabelsIndex m_labelsIndex;
		unsigned int m_nextSessionId;
	};
}
