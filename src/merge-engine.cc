#include <merge-engine.hh>
#include <merge-context.hh>
#include <flag-configuration.hh>
#include <errors.hh>
#include <utils.hh>

#include <algorithm>
#include <iterator>
#include <set>
#include <string>

using namespace covmerge;

UploadMergeEngine::UploadMergeEngine(MergeContext &ctx) :
	m_ctx(ctx),
	m_started(false)
{
}

void UploadMergeEngine::start(const Report &previous, const Session &session)
{
	m_report = previous;
	m_session = session;
	m_session.m_id = m_report.allocateSessionId();
	m_reports.clear();
	m_started = true;

	covmerge_debug(STATUS_MSG, "Starting session %u\n", m_session.m_id);
}

unsigned int UploadMergeEngine::getSessionId() const
{
	return m_session.m_id;
}

const Session &UploadMergeEngine::getSession() const
{
	return m_session;
}

void UploadMergeEngine::appendReport(const Report &fileReport)
{
	panic_if(!m_started, "report appended outside a merge transaction");

	m_reports.push_back(fileReport);
}

MergeResult UploadMergeEngine::finalize()
{
	panic_if(!m_started, "finalize without start");
	m_started = false;

	Report temporary;

	encodeLabels(temporary);

	if (temporary.isEmpty()) {
		m_reports.clear();
		throw EmptyUploadError();
	}

	if (temporary.hasLabelsIndex() && temporary.getLabelsIndex().isOnlyPlaceholder()) {
		// Could have had labels, but nothing contributed any
		covmerge_debug(LABEL_MSG, "session %u: no labels besides the placeholder, dropping index\n",
				m_session.m_id);
		temporary.clearLabelsIndex();
	}

	reconcileLabels(temporary);

	MergeResult out;

	out.m_adjustment = adjustSessions(temporary);

	m_session.m_totals = temporary.getTotals();
	m_report.addSession(m_session);
	m_report.merge(temporary);

	out.m_session = m_session;
	out.m_report = m_report;

	m_reports.clear();

	return out;
}

// Give the labels of all uploaded files ids in one index. Labels are
// numbered in sorted order, so the file order does not matter.
void UploadMergeEngine::encodeLabels(Report &temporary)
{
	std::set<std::string> labels;
	bool anyIndex = false;

	for (ReportList_t::const_iterator it = m_reports.begin();
			it != m_reports.end();
			++it) {
		LabelIdSet_t used = it->getAllLabels();

		if (!it->hasLabelsIndex()) {
			panic_if(!used.empty(), "LabelIndexInconsistency: datapoints with labels but no index");
			continue;
		}
		anyIndex = true;

		for (LabelIdSet_t::const_iterator id = used.begin();
				id != used.end();
				++id) {
			std::string label;

			panic_if(!it->getLabelsIndex().lookupLabel(*id, label),
					"LabelIndexInconsistency: label id %u not in the file index", *id);
			if (*id != PLACEHOLDER_LABEL_ID)
				labels.insert(label);
		}
	}

	LabelsIndex index;

	for (std::set<std::string>::const_iterator it = labels.begin();
			it != labels.end();
			++it)
		index.getOrAdd(*it);

	for (ReportList_t::iterator it = m_reports.begin();
			it != m_reports.end();
			++it) {
		if (it->hasLabelsIndex()) {
			const LabelsIndex::IdMap_t &entries = it->getLabelsIndex().getEntries();
			Report::LabelIdMap_t mapping;

			for (LabelsIndex::IdMap_t::const_iterator entry = entries.begin();
					entry != entries.end();
					++entry) {
				unsigned int to;

				if (entry->first == PLACEHOLDER_LABEL_ID)
					to = PLACEHOLDER_LABEL_ID;
				else if (!index.lookupId(entry->second, to))
					continue; // Not used by any datapoint

				mapping[entry->first] = to;
			}
			it->remapLabels(mapping);
		}

		temporary.merge(*it);
	}

	if (anyIndex)
		temporary.setLabelsIndex(index);
}

// Move the labels of the upload to the ids of the report merged into
void UploadMergeEngine::reconcileLabels(Report &temporary)
{
	if (!temporary.hasLabelsIndex())
		return;

	if (!m_report.hasLabelsIndex()) {
		covmerge_debug(LABEL_MSG, "creating labels index for the report\n");
		m_report.setLabelsIndex(LabelsIndex());
	}

	LabelsIndex &target = m_report.getLabelsIndex();
	const LabelsIndex::IdMap_t &entries = temporary.getLabelsIndex().getEntries();
	Report::LabelIdMap_t mapping;

	// In id order, i.e., new labels keep their sorted order
	for (LabelsIndex::IdMap_t::const_iterator it = entries.begin();
			it != entries.end();
			++it) {
		unsigned int to = it->first == PLACEHOLDER_LABEL_ID ?
				PLACEHOLDER_LABEL_ID : target.getOrAdd(it->second);

		if (to != it->first)
			covmerge_debug(LABEL_MSG, "label %s: %u -> %u\n", it->second.c_str(), it->first, to);
		mapping[it->first] = to;
	}
	temporary.remapLabels(mapping);
	temporary.setLabelsIndex(target);

	LabelIdSet_t used = temporary.getAllLabels();

	for (LabelIdSet_t::const_iterator it = used.begin();
			it != used.end();
			++it)
		panic_if(!target.hasId(*it),
				"LabelIndexInconsistency: label id %u missing after reconciliation", *it);
}

// Drop carried forward sessions replaced by this upload. Runs after the
// upload's labels are known, but before it is merged into the report.
SessionAdjustmentResult UploadMergeEngine::adjustSessions(const Report &temporary)
{
	IFlagConfiguration &flagConf = m_ctx.getFlagConfiguration();
	MergeStatistics &stats = m_ctx.getStatistics();
	FlagList_t fullFlags;
	FlagList_t labelFlags;
	SessionIdSet_t toDelete;
	SessionIdSet_t toPartiallyDelete;
	SessionIdSet_t deleted;
	SessionAdjustmentResult out;

	for (FlagList_t::const_iterator it = m_session.m_flags.begin();
			it != m_session.m_flags.end();
			++it) {
		if (!flagConf.hasCarryforward(*it))
			continue;

		if (flagConf.getCarryforwardMode(*it) == CARRYFORWARD_LABELS)
			labelFlags.push_back(*it);
		else
			fullFlags.push_back(*it);
	}

	if (fullFlags.empty() && labelFlags.empty())
		return out;

	const Report::SessionMap_t &sessions = m_report.getSessions();

	for (Report::SessionMap_t::const_iterator it = sessions.begin();
			it != sessions.end();
			++it) {
		const Session &cur = it->second;

		if (cur.m_type != Session::SESSION_CARRIEDFORWARD || cur.m_id == m_session.m_id)
			continue;

		for (FlagList_t::const_iterator flag = fullFlags.begin();
				flag != fullFlags.end();
				++flag) {
			if (cur.hasFlag(*flag))
				toDelete.insert(cur.m_id);
		}
		for (FlagList_t::const_iterator flag = labelFlags.begin();
				flag != labelFlags.end();
				++flag) {
			if (cur.hasFlag(*flag))
				toPartiallyDelete.insert(cur.m_id);
		}
	}

	if (!toDelete.empty()) {
		covmerge_debug(STATUS_MSG, "Deleting %zu carried forward sessions\n", toDelete.size());
		m_report.deleteMultipleSessions(toDelete);
		deleted = toDelete;
	}

	if (!toPartiallyDelete.empty()) {
		covmerge_debug(STATUS_MSG, "Removing labels from %zu carried forward sessions\n",
				toPartiallyDelete.size());
		LabelIdSet_t replaced = temporary.getAllLabels();

		// Placeholder coverage is not tied to a test, so it never replaces anything
		replaced.erase(PLACEHOLDER_LABEL_ID);
		m_report.deleteLabels(toPartiallyDelete, replaced);

		for (SessionIdSet_t::const_iterator it = toPartiallyDelete.begin();
				it != toPartiallyDelete.end();
				++it) {
			if (deleted.find(*it) != deleted.end())
				continue;
			if (!m_report.getLabelsForSession(*it).empty())
				continue;

			covmerge_debug(STATUS_MSG, "Session %u has no labels left, deleting it\n", *it);
			m_report.deleteSession(*it);
			deleted.insert(*it);
		}
	}

	out.m_fullyDeleted.assign(deleted.begin(), deleted.end());
	std::set_difference(toPartiallyDelete.begin(), toPartiallyDelete.end(),
			deleted.begin(), deleted.end(),
			std::back_inserter(out.m_partiallyModified));

	stats.m_sessionsDeleted += out.m_fullyDeleted.size();
	stats.m_sessionsPartiallyModified += out.m_partiallyModified.size();

	return out;
}
