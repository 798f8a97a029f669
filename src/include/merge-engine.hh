#pragma once

#include <report.hh>

#include <vector>

namespace covmerge
{
	class MergeContext;

	typedef std::vector<unsigned int> SessionIdList_t;

	/**
	 * What carryforward cleanup did to the sessions of the previous
	 * report. Both lists are sorted.
	 */
	class SessionAdjustmentResult
	{
	public:
		SessionIdList_t m_fullyDeleted;
		SessionIdList_t m_partiallyModified;
	};

	class MergeResult
	{
	public:
		Report m_report;
		Session m_session;
		SessionAdjustmentResult m_adjustment;
	};

	/**
	 * One merge transaction: the per-file reports of an upload are
	 * merged into a copy of the previous report, which is only returned
	 * when everything succeeded.
	 *
	 * Usage:
	 *   engine.start(previous, session);
	 *   engine.appendReport(fileReport); // Any number of times
	 *   MergeResult res = engine.finalize();
	 */
	class UploadMergeEngine
	{
	public:
		UploadMergeEngine(MergeContext &ctx);

		/**
		 * Begin a transaction. The session gets a new id, above all ids
		 * ever used in @a previous.
		 *
		 * @param previous the report to merge into, possibly empty
		 * @param session flags and metadata of the upload
		 */
		void start(const Report &previous, const Session &session);

		unsigned int getSessionId() const;

		const Session &getSession() const;

		// Reports built for one uploaded file each, in any order
		void appendReport(const Report &fileReport);

		/**
		 * Merge everything appended so far. Throws EmptyUploadError if
		 * no file had any lines.
		 */
		MergeResult finalize();

	private:
		typedef std::vector<Report> ReportList_t;

		void encodeLabels(Report &temporary);

		void reconcileLabels(Report &temporary);

		SessionAdjustmentResult adjustSessions(const Report &temporary);

		MergeContext &m_ctx;
		bool m_started;
		Report m_report;
		Session m_session;
		ReportList_t m_reports;
	};
}
