#include <coverage.hh>
#include <utils.hh>

#include <limits.h>

#include <map>
#include <set>

using namespace covmerge;

Coverage Coverage::hits(unsigned int hits)
{
	Coverage out;

	out.m_kind = COVERAGE_HITS;
	out.m_hits = hits;

	return out;
}

Coverage Coverage::boolean(bool covered)
{
	Coverage out;

	out.m_kind = COVERAGE_BOOL;
	out.m_hits = covered ? 1 : 0;

	return out;
}

Coverage Coverage::branch(unsigned int hits, unsigned int total)
{
	Coverage out;

	out.m_kind = COVERAGE_BRANCH;
	out.m_hits = hits > total ? total : hits;
	out.m_total = total;

	return out;
}

// Plain decimal digits which fit a hit count
static bool parseCount(const std::string &str, unsigned int &out)
{
	if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
		return false;
	if (!string_is_integer(str, 10))
		return false;

	int64_t val = string_to_integer(str, 10);

	if (val < 0 || val > UINT_MAX)
		return false;
	out = (unsigned int)val;

	return true;
}

bool Coverage::parse(const std::string &strIn, Coverage &out)
{
	std::string str = trim_string(strIn);

	if (str == "true" || str == "false") {
		out = boolean(str == "true");
		return true;
	}

	size_t slash = str.find('/');
	if (slash != std::string::npos) {
		unsigned int hits;
		unsigned int total;

		if (!parseCount(str.substr(0, slash), hits) ||
				!parseCount(str.substr(slash + 1), total))
			return false;

		if (hits > total)
			return false;

		out = branch(hits, total);
		return true;
	}

	unsigned int hits;

	if (!parseCount(str, hits))
		return false;

	out = Coverage::hits(hits);

	return true;
}

enum Coverage::LineState Coverage::getState() const
{
	switch (m_kind) {
	case COVERAGE_HITS:
	case COVERAGE_BOOL:
		return m_hits > 0 ? LINE_HIT : LINE_MISS;
	case COVERAGE_BRANCH:
		if (m_hits == 0 && m_total > 0)
			return LINE_MISS;
		if (m_hits >= m_total)
			return LINE_HIT;
		return LINE_PARTIAL;
	default:
		break;
	}

	return LINE_MISS;
}

std::string Coverage::toString() const
{
	switch (m_kind) {
	case COVERAGE_HITS:
		return fmt("%u", m_hits);
	case COVERAGE_BOOL:
		return m_hits ? "true" : "false";
	case COVERAGE_BRANCH:
		return fmt("%u/%u", m_hits, m_total);
	default:
		break;
	}

	return "null";
}

bool Coverage::operator==(const Coverage &other) const
{
	return m_kind == other.m_kind && m_hits == other.m_hits &&
			m_total == other.m_total;
}

bool Coverage::operator<(const Coverage &other) const
{
	if (m_kind != other.m_kind)
		return m_kind < other.m_kind;
	if (m_hits != other.m_hits)
		return m_hits < other.m_hits;

	return m_total < other.m_total;
}

// Branch against a count or boolean: covered means all branches taken
static Coverage mergeBranchScalar(const Coverage &branch, const Coverage &scalar)
{
	if (scalar.m_hits > 0)
		return Coverage::branch(branch.m_total, branch.m_total);

	return branch;
}

static bool mergeTrivial(const Coverage &a, const Coverage &b, Coverage &out)
{
	if (a.isNone()) {
		out = b;
		return true;
	}
	if (b.isNone()) {
		out = a;
		return true;
	}

	if (a.m_kind == Coverage::COVERAGE_BRANCH && b.m_kind != Coverage::COVERAGE_BRANCH) {
		out = mergeBranchScalar(a, b);
		return true;
	}
	if (b.m_kind == Coverage::COVERAGE_BRANCH && a.m_kind != Coverage::COVERAGE_BRANCH) {
		out = mergeBranchScalar(b, a);
		return true;
	}

	return false;
}

Coverage covmerge::mergeSameSession(const Coverage &a, const Coverage &b)
{
	Coverage out;

	if (mergeTrivial(a, b, out))
		return out;

	if (a.m_kind == Coverage::COVERAGE_BRANCH) {
		unsigned int total = a.m_total > b.m_total ? a.m_total : b.m_total;
		unsigned int hits = a.m_hits > b.m_hits ? a.m_hits : b.m_hits;

		return Coverage::branch(hits, total);
	}

	if (a.m_kind == Coverage::COVERAGE_BOOL && b.m_kind == Coverage::COVERAGE_BOOL)
		return Coverage::boolean(a.m_hits || b.m_hits);

	return Coverage::hits(a.m_hits > b.m_hits ? a.m_hits : b.m_hits);
}

Coverage covmerge::mergeAcrossSessions(const Coverage &a, const Coverage &b)
{
	Coverage out;

	if (mergeTrivial(a, b, out))
		return out;

	if (a.m_kind == Coverage::COVERAGE_BRANCH)
		return mergeSameSession(a, b);

	if (a.m_kind == Coverage::COVERAGE_BOOL && b.m_kind == Coverage::COVERAGE_BOOL)
		return Coverage::boolean(a.m_hits || b.m_hits);

	return Coverage::hits(a.m_hits + b.m_hits);
}


bool covmerge::combinePartials(const PartialList_t &partials, PartialList_t &out)
{
	out.clear();

	if (partials.empty())
		return false;

	typedef std::map<int, Coverage> ColumnMap_t;
	ColumnMap_t columns;
	std::set<int> closedColumns;
	int lastColumn = -1;

	// Closed spans
	for (PartialList_t::const_iterator it = partials.begin();
			it != partials.end();
			++it) {
		if (it->m_end == PARTIAL_NONE)
			continue;

		int start = it->m_start == PARTIAL_NONE ? 0 : it->m_start;

		for (int c = start; c < it->m_end; c++) {
			ColumnMap_t::iterator col = columns.find(c);

			if (col == columns.end())
				columns[c] = it->m_coverage;
			else
				col->second = mergeSameSession(col->second, it->m_coverage);
			closedColumns.insert(c);

			if (c > lastColumn)
				lastColumn = c;
		}
	}

	bool haveOpen = false;
	int firstOpenStart = 0;
	Coverage endOfLine;

	for (PartialList_t::const_iterator it = partials.begin();
			it != partials.end();
			++it) {
		if (it->m_end != PARTIAL_NONE)
			continue;

		int start = it->m_start == PARTIAL_NONE ? 0 : it->m_start;

		if (start > lastColumn)
			lastColumn = start;
		if (!haveOpen || it->m_start < firstOpenStart)
			firstOpenStart = it->m_start;

		haveOpen = true;
		endOfLine = mergeSameSession(endOfLine, it->m_coverage);
	}

	int lineLength = lastColumn + 1;

	// Open spans cover everything from their start up to the line length
	for (PartialList_t::const_iterator it = partials.begin();
			it != partials.end();
			++it) {
		if (it->m_end != PARTIAL_NONE)
			continue;

		int start = it->m_start == PARTIAL_NONE ? 0 : it->m_start;

		for (int c = start; c < lineLength; c++) {
			ColumnMap_t::iterator col = columns.find(c);

			if (col == columns.end())
				columns[c] = it->m_coverage;
			else
				col->second = mergeSameSession(col->second, it->m_coverage);
		}
	}

	// Run-length encode, a gap or a new value starts a new span
	for (ColumnMap_t::const_iterator it = columns.begin();
			it != columns.end();
			++it) {
		if (!out.empty() && out.back().m_end == it->first &&
				out.back().m_coverage == it->second) {
			out.back().m_end = it->first + 1;
			continue;
		}

		out.push_back(Partial(it->first, it->first + 1, it->second));
	}

	if (!out.empty() && out.front().m_start == 0 && out.front().m_end == 1 &&
			closedColumns.find(0) == closedColumns.end() && haveOpen)
		out.erase(out.begin());

	if (haveOpen) {
		if (!out.empty() && out.back().m_end == lineLength &&
				out.back().m_coverage == endOfLine)
			out.back().m_end = PARTIAL_NONE;
		else if (out.empty())
			out.push_back(Partial(firstOpenStart, PARTIAL_NONE, endOfLine));
		else
			out.push_back(Partial(lineLength, PARTIAL_NONE, endOfLine));
	}

	return !out.empty();
}
