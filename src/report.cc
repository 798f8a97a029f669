#include <report.hh>
#include <utils.hh>

#include <algorithm>
#include <iterator>

using namespace covmerge;

enum CoverageType covmerge::mergeCoverageType(enum CoverageType a, enum CoverageType b)
{
	if (a == COVERAGE_TYPE_BRANCH || b == COVERAGE_TYPE_BRANCH)
		return COVERAGE_TYPE_BRANCH;
	if (a == COVERAGE_TYPE_METHOD || b == COVERAGE_TYPE_METHOD)
		return COVERAGE_TYPE_METHOD;

	return COVERAGE_TYPE_LINE;
}


std::string Complexity::toString() const
{
	if (!m_valid)
		return "null";
	if (m_total == 0)
		return fmt("%u", m_covered);

	return fmt("[%u, %u]", m_covered, m_total);
}

Complexity covmerge::mergeComplexity(const Complexity &a, const Complexity &b)
{
	if (!a.m_valid)
		return b;
	if (!b.m_valid)
		return a;

	return Complexity(std::max(a.m_covered, b.m_covered), std::max(a.m_total, b.m_total));
}


static BranchList_t sortedUnique(const BranchList_t &in)
{
	BranchList_t out = in;

	std::sort(out.begin(), out.end());
	out.erase(std::unique(out.begin(), out.end()), out.end());

	return out;
}

void LineSession::setMissingBranches(const BranchList_t &branches)
{
	m_hasMissingBranches = true;
	m_missingBranches = sortedUnique(branches);
}

void LineSession::merge(const LineSession &other)
{
	if (m_hasMissingBranches && other.m_hasMissingBranches &&
			m_coverage.m_kind == Coverage::COVERAGE_BRANCH &&
			other.m_coverage.m_kind == Coverage::COVERAGE_BRANCH) {
		BranchList_t all = m_missingBranches;

		all.insert(all.end(), other.m_missingBranches.begin(), other.m_missingBranches.end());
		setMissingBranches(all);

		unsigned int total = std::max(m_coverage.m_total, other.m_coverage.m_total);
		unsigned int missing = m_missingBranches.size();

		m_coverage = Coverage::branch(missing > total ? 0 : total - missing, total);
	} else {
		m_coverage = mergeSameSession(m_coverage, other.m_coverage);

		if (m_hasMissingBranches && other.m_hasMissingBranches) {
			BranchList_t all = m_missingBranches;

			all.insert(all.end(), other.m_missingBranches.begin(), other.m_missingBranches.end());
			setMissingBranches(all);
		} else {
			// Unknown for one of them, so unknown for both
			m_hasMissingBranches = false;
			m_missingBranches.clear();
		}
	}

	if (!other.m_partials.empty()) {
		PartialList_t all = m_partials;
		PartialList_t combined;

		all.insert(all.end(), other.m_partials.begin(), other.m_partials.end());
		combinePartials(all, combined);
		m_partials = combined;
	}

	m_complexity = mergeComplexity(m_complexity, other.m_complexity);
}

bool LineSession::operator==(const LineSession &other) const
{
	return m_id == other.m_id &&
			m_coverage == other.m_coverage &&
			m_hasMissingBranches == other.m_hasMissingBranches &&
			m_missingBranches == other.m_missingBranches &&
			m_partials == other.m_partials &&
			m_complexity == other.m_complexity;
}


bool CoverageDatapoint::operator<(const CoverageDatapoint &other) const
{
	if (m_sessionId != other.m_sessionId)
		return m_sessionId < other.m_sessionId;
	if (m_coverage != other.m_coverage)
		return m_coverage < other.m_coverage;
	if (m_type != other.m_type)
		return m_type < other.m_type;

	return m_labelIds < other.m_labelIds;
}

bool CoverageDatapoint::operator==(const CoverageDatapoint &other) const
{
	return m_sessionId == other.m_sessionId &&
			m_coverage == other.m_coverage &&
			m_type == other.m_type &&
			m_labelIds == other.m_labelIds;
}


static bool sessionIdLess(const LineSession &a, const LineSession &b)
{
	return a.m_id < b.m_id;
}

void Line::merge(const Line &other)
{
	m_type = mergeCoverageType(m_type, other.m_type);

	for (LineSessionList_t::const_iterator it = other.m_sessions.begin();
			it != other.m_sessions.end();
			++it) {
		LineSessionList_t::iterator found = m_sessions.end();

		for (LineSessionList_t::iterator cur = m_sessions.begin();
				cur != m_sessions.end();
				++cur) {
			if (cur->m_id == it->m_id) {
				found = cur;
				break;
			}
		}

		if (found == m_sessions.end())
			m_sessions.push_back(*it);
		else
			found->merge(*it);
	}
	std::sort(m_sessions.begin(), m_sessions.end(), sessionIdLess);

	if (other.m_hasDatapoints) {
		m_hasDatapoints = true;

		// Same session and labels: one datapoint
		for (DatapointList_t::const_iterator it = other.m_datapoints.begin();
				it != other.m_datapoints.end();
				++it) {
			DatapointList_t::iterator found = m_datapoints.end();

			for (DatapointList_t::iterator cur = m_datapoints.begin();
					cur != m_datapoints.end();
					++cur) {
				if (cur->m_sessionId == it->m_sessionId && cur->m_labelIds == it->m_labelIds) {
					found = cur;
					break;
				}
			}

			if (found == m_datapoints.end()) {
				m_datapoints.push_back(*it);
			} else {
				found->m_coverage = mergeSameSession(found->m_coverage, it->m_coverage);
				found->m_type = mergeCoverageType(found->m_type, it->m_type);
			}
		}
		std::sort(m_datapoints.begin(), m_datapoints.end());
	}

	recalculate();
}

void Line::recalculate()
{
	Coverage coverage;
	Complexity complexity;
	bool allBranchesKnown = !m_sessions.empty();

	for (LineSessionList_t::const_iterator it = m_sessions.begin();
			it != m_sessions.end();
			++it) {
		coverage = mergeAcrossSessions(coverage, it->m_coverage);
		complexity = mergeComplexity(complexity, it->m_complexity);

		if (!it->m_hasMissingBranches || it->m_coverage.m_kind != Coverage::COVERAGE_BRANCH)
			allBranchesKnown = false;
	}

	// A branch is missed only if every session missed it
	if (allBranchesKnown) {
		BranchList_t missing = m_sessions[0].m_missingBranches;

		for (LineSessionList_t::const_iterator it = m_sessions.begin() + 1;
				it != m_sessions.end();
				++it) {
			BranchList_t both;

			std::set_intersection(missing.begin(), missing.end(),
					it->m_missingBranches.begin(), it->m_missingBranches.end(),
					std::back_inserter(both));
			missing = both;
		}

		unsigned int total = coverage.m_total;
		coverage = Coverage::branch(missing.size() > total ? 0 : total - missing.size(), total);
	}

	m_coverage = coverage;
	m_complexity = complexity;
}

bool Line::removeSession(unsigned int id)
{
	bool changed = false;

	for (LineSessionList_t::iterator it = m_sessions.begin();
			it != m_sessions.end();) {
		if (it->m_id == id) {
			it = m_sessions.erase(it);
			changed = true;
		} else {
			++it;
		}
	}

	for (DatapointList_t::iterator it = m_datapoints.begin();
			it != m_datapoints.end();) {
		if (it->m_sessionId == id) {
			it = m_datapoints.erase(it);
			changed = true;
		} else {
			++it;
		}
	}

	if (changed)
		recalculate();

	return changed;
}

const LineSession *Line::getSession(unsigned int id) const
{
	for (LineSessionList_t::const_iterator it = m_sessions.begin();
			it != m_sessions.end();
			++it) {
		if (it->m_id == id)
			return &(*it);
	}

	return NULL;
}

bool Line::operator==(const Line &other) const
{
	return m_coverage == other.m_coverage &&
			m_type == other.m_type &&
			m_sessions == other.m_sessions &&
			m_hasDatapoints == other.m_hasDatapoints &&
			m_datapoints == other.m_datapoints &&
			m_complexity == other.m_complexity;
}


void ReportTotals::add(const ReportTotals &other)
{
	m_files += other.m_files;
	m_lines += other.m_lines;
	m_hits += other.m_hits;
	m_misses += other.m_misses;
	m_partials += other.m_partials;
	m_branches += other.m_branches;
	m_methods += other.m_methods;
	m_complexity += other.m_complexity;
	m_complexityTotal += other.m_complexityTotal;
}

std::string ReportTotals::getCoverage() const
{
	if (m_lines == 0)
		return "";
	if (m_hits == m_lines)
		return "100";

	std::string out = fmt("%.5f", (m_hits * 100.0) / m_lines);

	// 50.00000 -> 50
	while (out[out.size() - 1] == '0')
		out = out.substr(0, out.size() - 1);
	if (out[out.size() - 1] == '.')
		out = out.substr(0, out.size() - 1);

	return out;
}

bool ReportTotals::operator==(const ReportTotals &other) const
{
	return m_files == other.m_files &&
			m_lines == other.m_lines &&
			m_hits == other.m_hits &&
			m_misses == other.m_misses &&
			m_partials == other.m_partials &&
			m_branches == other.m_branches &&
			m_methods == other.m_methods &&
			m_sessions == other.m_sessions &&
			m_complexity == other.m_complexity &&
			m_complexityTotal == other.m_complexityTotal;
}


void ReportFile::append(unsigned int lineNr, const Line &line)
{
	LineMap_t::iterator it = m_lines.find(lineNr);

	if (it == m_lines.end()) {
		Line &cur = m_lines[lineNr];

		cur = line;
		cur.recalculate();
		return;
	}

	covmerge_debug(MERGE_MSG, "merging line %s:%u\n", m_name.c_str(), lineNr);
	it->second.merge(line);
}

const Line *ReportFile::getLine(unsigned int lineNr) const
{
	LineMap_t::const_iterator it = m_lines.find(lineNr);

	if (it == m_lines.end())
		return NULL;

	return &it->second;
}

void ReportFile::merge(const ReportFile &other)
{
	for (LineMap_t::const_iterator it = other.m_lines.begin();
			it != other.m_lines.end();
			++it)
		append(it->first, it->second);
}

void ReportFile::removeEmptyLines()
{
	for (LineMap_t::iterator it = m_lines.begin();
			it != m_lines.end();) {
		if (it->second.m_sessions.empty())
			m_lines.erase(it++);
		else
			++it;
	}
}

bool ReportFile::isEmpty() const
{
	return m_lines.empty();
}

ReportTotals ReportFile::getTotals() const
{
	ReportTotals out;

	out.m_files = 1;
	for (LineMap_t::const_iterator it = m_lines.begin();
			it != m_lines.end();
			++it) {
		const Line &line = it->second;

		out.m_lines++;
		switch (line.m_coverage.getState()) {
		case Coverage::LINE_HIT:
			out.m_hits++;
			break;
		case Coverage::LINE_PARTIAL:
			out.m_partials++;
			break;
		default:
			out.m_misses++;
			break;
		}

		if (line.m_type == COVERAGE_TYPE_BRANCH)
			out.m_branches++;
		else if (line.m_type == COVERAGE_TYPE_METHOD)
			out.m_methods++;

		if (line.m_complexity.m_valid) {
			out.m_complexity += line.m_complexity.m_covered;
			out.m_complexityTotal += line.m_complexity.m_total;
		}
	}

	return out;
}


bool Session::hasFlag(const std::string &flag) const
{
	return std::find(m_flags.begin(), m_flags.end(), flag) != m_flags.end();
}


Report::Report() :
	m_hasLabelsIndex(false),
	m_nextSessionId(0)
{
}

const ReportFile *Report::getFile(const std::string &name) const
{
	FileMap_t::const_iterator it = m_files.find(name);

	if (it == m_files.end())
		return NULL;

	return &it->second;
}

const Report::FileMap_t &Report::getFiles() const
{
	return m_files;
}

void Report::append(const ReportFile &file)
{
	if (file.isEmpty())
		return;

	FileMap_t::iterator it = m_files.find(file.m_name);

	if (it == m_files.end()) {
		m_files[file.m_name] = file;
		return;
	}

	it->second.merge(file);
}

void Report::merge(const Report &other)
{
	for (FileMap_t::const_iterator it = other.m_files.begin();
			it != other.m_files.end();
			++it)
		append(it->second);
}

unsigned int Report::allocateSessionId()
{
	// Also skip past ids of sessions loaded without a high-water mark
	if (!m_sessions.empty() && m_sessions.rbegin()->first >= m_nextSessionId)
		m_nextSessionId = m_sessions.rbegin()->first + 1;

	return m_nextSessionId++;
}

unsigned int Report::getNextSessionId() const
{
	return m_nextSessionId;
}

void Report::addSession(const Session &session)
{
	panic_if(m_sessions.find(session.m_id) != m_sessions.end(),
			"session %u already in report", session.m_id);

	m_sessions[session.m_id] = session;
	if (session.m_id >= m_nextSessionId)
		m_nextSessionId = session.m_id + 1;
}

const Session *Report::getSession(unsigned int id) const
{
	SessionMap_t::const_iterator it = m_sessions.find(id);

	if (it == m_sessions.end())
		return NULL;

	return &it->second;
}

Session *Report::getSession(unsigned int id)
{
	SessionMap_t::iterator it = m_sessions.find(id);

	if (it == m_sessions.end())
		return NULL;

	return &it->second;
}

const Report::SessionMap_t &Report::getSessions() const
{
	return m_sessions;
}

bool Report::deleteSession(unsigned int id)
{
	SessionIdSet_t ids;

	ids.insert(id);
	bool found = m_sessions.find(id) != m_sessions.end();

	deleteMultipleSessions(ids);

	return found;
}

void Report::deleteMultipleSessions(const SessionIdSet_t &ids)
{
	for (FileMap_t::iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		ReportFile &file = it->second;

		for (ReportFile::LineMap_t::iterator lineIt = file.m_lines.begin();
				lineIt != file.m_lines.end();
				++lineIt) {
			for (SessionIdSet_t::const_iterator id = ids.begin();
					id != ids.end();
					++id)
				lineIt->second.removeSession(*id);
		}
		file.removeEmptyLines();
	}

	for (SessionIdSet_t::const_iterator id = ids.begin();
			id != ids.end();
			++id) {
		covmerge_debug(MERGE_MSG, "deleting session %u\n", *id);
		m_sessions.erase(*id);
	}

	removeEmptyFiles();
}

void Report::deleteLabels(const SessionIdSet_t &sessionIds, const LabelIdSet_t &labels)
{
	for (FileMap_t::iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		ReportFile &file = it->second;

		for (ReportFile::LineMap_t::iterator lineIt = file.m_lines.begin();
				lineIt != file.m_lines.end();
				++lineIt) {
			Line &line = lineIt->second;
			SessionIdSet_t hadDatapoints;
			SessionIdSet_t hasDatapoints;

			for (DatapointList_t::iterator dp = line.m_datapoints.begin();
					dp != line.m_datapoints.end();) {
				if (sessionIds.find(dp->m_sessionId) == sessionIds.end()) {
					++dp;
					continue;
				}

				hadDatapoints.insert(dp->m_sessionId);
				if (std::includes(labels.begin(), labels.end(),
						dp->m_labelIds.begin(), dp->m_labelIds.end())) {
					dp = line.m_datapoints.erase(dp);
					continue;
				}

				hasDatapoints.insert(dp->m_sessionId);
				++dp;
			}

			// Sessions left without datapoints are gone from the line
			for (SessionIdSet_t::const_iterator id = hadDatapoints.begin();
					id != hadDatapoints.end();
					++id) {
				if (hasDatapoints.find(*id) == hasDatapoints.end())
					line.removeSession(*id);
			}
		}
		file.removeEmptyLines();
	}

	removeEmptyFiles();
}

LabelIdSet_t Report::getLabelsForSession(unsigned int id) const
{
	LabelIdSet_t out;

	for (FileMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		for (ReportFile::LineMap_t::const_iterator lineIt = it->second.m_lines.begin();
				lineIt != it->second.m_lines.end();
				++lineIt) {
			const DatapointList_t &datapoints = lineIt->second.m_datapoints;

			for (DatapointList_t::const_iterator dp = datapoints.begin();
					dp != datapoints.end();
					++dp) {
				if (dp->m_sessionId == id)
					out.insert(dp->m_labelIds.begin(), dp->m_labelIds.end());
			}
		}
	}
	out.erase(PLACEHOLDER_LABEL_ID);

	return out;
}

LabelIdSet_t Report::getAllLabels() const
{
	LabelIdSet_t out;

	for (FileMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		for (ReportFile::LineMap_t::const_iterator lineIt = it->second.m_lines.begin();
				lineIt != it->second.m_lines.end();
				++lineIt) {
			const DatapointList_t &datapoints = lineIt->second.m_datapoints;

			for (DatapointList_t::const_iterator dp = datapoints.begin();
					dp != datapoints.end();
					++dp)
				out.insert(dp->m_labelIds.begin(), dp->m_labelIds.end());
		}
	}

	return out;
}

void Report::remapLabels(const LabelIdMap_t &mapping)
{
	for (FileMap_t::iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		for (ReportFile::LineMap_t::iterator lineIt = it->second.m_lines.begin();
				lineIt != it->second.m_lines.end();
				++lineIt) {
			DatapointList_t &datapoints = lineIt->second.m_datapoints;

			for (DatapointList_t::iterator dp = datapoints.begin();
					dp != datapoints.end();
					++dp) {
				LabelIdSet_t ids;

				for (LabelIdSet_t::const_iterator id = dp->m_labelIds.begin();
						id != dp->m_labelIds.end();
						++id) {
					LabelIdMap_t::const_iterator to = mapping.find(*id);

					ids.insert(to == mapping.end() ? *id : to->second);
				}
				dp->m_labelIds = ids;
			}
			std::sort(datapoints.begin(), datapoints.end());
		}
	}
}

bool Report::hasLabelsIndex() const
{
	return m_hasLabelsIndex;
}

const LabelsIndex &Report::getLabelsIndex() const
{
	return m_labelsIndex;
}

LabelsIndex &Report::getLabelsIndex()
{
	return m_labelsIndex;
}

void Report::setLabelsIndex(const LabelsIndex &index)
{
	m_labelsIndex = index;
	m_hasLabelsIndex = true;
}

void Report::clearLabelsIndex()
{
	m_labelsIndex = LabelsIndex();
	m_hasLabelsIndex = false;
}

bool Report::isEmpty() const
{
	for (FileMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		if (!it->second.isEmpty())
			return false;
	}

	return true;
}

ReportTotals Report::getTotals() const
{
	ReportTotals out;

	for (FileMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it)
		out.add(it->second.getTotals());
	out.m_sessions = m_sessions.size();

	return out;
}

void Report::removeEmptyFiles()
{
	for (FileMap_t::iterator it = m_files.begin();
			it != m_files.end();) {
		if (it->second.isEmpty())
			m_files.erase(it++);
		else
			++it;
	}
}
