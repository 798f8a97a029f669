#include <report.hh>
#include <utils.hh>
#include <swap-endian.hh>

#include <string.h>

#include <string>

using namespace covmerge;

#define COVMERGE_MAGIC      0x636d7267 /* "cmrg" */
#define COVMERGE_DB_VERSION 1

struct marshalHeaderStruct
{
	uint32_t magic;
	uint32_t db_version;
	uint32_t checksum;
	uint32_t payload_size;
};

class MarshalBuffer
{
public:
	MarshalBuffer() :
		m_data(NULL), m_size(0), m_capacity(0)
	{
		// Header is filled in last
		reserve(sizeof(struct marshalHeaderStruct));
		m_size = sizeof(struct marshalHeaderStruct);
	}

	void putU32(uint32_t v)
	{
		uint32_t be = to_be<uint32_t>(v);

		put(&be, sizeof(be));
	}

	void putString(const std::string &s)
	{
		putU32(s.size());
		put(s.data(), s.size());
	}

	void putCoverage(const Coverage &coverage)
	{
		putU32(coverage.m_kind);
		putU32(coverage.m_hits);
		putU32(coverage.m_total);
	}

	void putComplexity(const Complexity &complexity)
	{
		putU32(complexity.m_valid);
		putU32(complexity.m_covered);
		putU32(complexity.m_total);
	}

	void putTotals(const ReportTotals &totals)
	{
		putU32(totals.m_files);
		putU32(totals.m_lines);
		putU32(totals.m_hits);
		putU32(totals.m_misses);
		putU32(totals.m_partials);
		putU32(totals.m_branches);
		putU32(totals.m_methods);
		putU32(totals.m_sessions);
		putU32(totals.m_complexity);
		putU32(totals.m_complexityTotal);
	}

	void *finish(size_t *szOut)
	{
		struct marshalHeaderStruct *hdr = (struct marshalHeaderStruct *)m_data;
		const uint8_t *payload = m_data + sizeof(struct marshalHeaderStruct);
		size_t payloadSize = m_size - sizeof(struct marshalHeaderStruct);

		hdr->magic = to_be<uint32_t>(COVMERGE_MAGIC);
		hdr->db_version = to_be<uint32_t>(COVMERGE_DB_VERSION);
		hdr->checksum = to_be<uint32_t>(hash_block(payload, payloadSize));
		hdr->payload_size = to_be<uint32_t>(payloadSize);

		*szOut = m_size;

		return m_data;
	}

private:
	void reserve(size_t sz)
	{
		if (m_size + sz <= m_capacity)
			return;

		while (m_capacity < m_size + sz)
			m_capacity = m_capacity ? m_capacity * 2 : 1024;
		m_data = (uint8_t *)xrealloc(m_data, m_capacity);
	}

	void put(const void *p, size_t sz)
	{
		reserve(sz);
		memcpy(m_data + m_size, p, sz);
		m_size += sz;
	}

	uint8_t *m_data;
	size_t m_size;
	size_t m_capacity;
};

class UnMarshalBuffer
{
public:
	UnMarshalBuffer(const uint8_t *p, size_t sz) :
		m_p(p), m_left(sz), m_ok(true)
	{
	}

	uint32_t getU32()
	{
		uint32_t be;

		if (!get(&be, sizeof(be)))
			return 0;

		return be_to_host<uint32_t>(be);
	}

	std::string getString()
	{
		uint32_t sz = getU32();

		if (!m_ok || sz > m_left) {
			m_ok = false;
			return "";
		}

		std::string out((const char *)m_p, sz);

		m_p += sz;
		m_left -= sz;

		return out;
	}

	Coverage getCoverage()
	{
		Coverage out;
		uint32_t kind = getU32();

		if (kind > Coverage::COVERAGE_BRANCH)
			m_ok = false;

		out.m_kind = (enum Coverage::Kind)kind;
		out.m_hits = getU32();
		out.m_total = getU32();

		return out;
	}

	Complexity getComplexity()
	{
		Complexity out;

		out.m_valid = getU32() != 0;
		out.m_covered = getU32();
		out.m_total = getU32();

		return out;
	}

	ReportTotals getTotals()
	{
		ReportTotals out;

		out.m_files = getU32();
		out.m_lines = getU32();
		out.m_hits = getU32();
		out.m_misses = getU32();
		out.m_partials = getU32();
		out.m_branches = getU32();
		out.m_methods = getU32();
		out.m_sessions = getU32();
		out.m_complexity = getU32();
		out.m_complexityTotal = getU32();

		return out;
	}

	enum CoverageType getType()
	{
		uint32_t type = getU32();

		if (type > COVERAGE_TYPE_METHOD)
			m_ok = false;

		return (enum CoverageType)type;
	}

	// Counts are bounded by what is left, to not allocate for garbage
	uint32_t getCount()
	{
		uint32_t n = getU32();

		if (n > m_left)
			m_ok = false;

		return m_ok ? n : 0;
	}

	bool ok() const
	{
		return m_ok;
	}

	bool atEnd() const
	{
		return m_left == 0;
	}

private:
	bool get(void *out, size_t sz)
	{
		if (!m_ok || sz > m_left) {
			m_ok = false;
			memset(out, 0, sz);
			return false;
		}

		memcpy(out, m_p, sz);
		m_p += sz;
		m_left -= sz;

		return true;
	}

	const uint8_t *m_p;
	size_t m_left;
	bool m_ok;
};


void *Report::marshal(size_t *szOut) const
{
	MarshalBuffer buf;

	buf.putU32(m_nextSessionId);

	buf.putU32(m_sessions.size());
	for (SessionMap_t::const_iterator it = m_sessions.begin();
			it != m_sessions.end();
			++it) {
		const Session &session = it->second;

		buf.putU32(session.m_id);
		buf.putU32(session.m_type);
		buf.putU32(session.m_flags.size());
		for (FlagList_t::const_iterator flag = session.m_flags.begin();
				flag != session.m_flags.end();
				++flag)
			buf.putString(*flag);
		buf.putString(session.m_name);
		buf.putString(session.m_provider);
		buf.putString(session.m_buildCode);
		buf.putString(session.m_jobCode);
		buf.putString(session.m_buildUrl);
		buf.putU32(session.m_env.size());
		for (Session::EnvMap_t::const_iterator env = session.m_env.begin();
				env != session.m_env.end();
				++env) {
			buf.putString(env->first);
			buf.putString(env->second);
		}
		buf.putTotals(session.m_totals);
	}

	buf.putU32(m_hasLabelsIndex);
	if (m_hasLabelsIndex) {
		const LabelsIndex::IdMap_t &entries = m_labelsIndex.getEntries();

		buf.putU32(entries.size());
		for (LabelsIndex::IdMap_t::const_iterator it = entries.begin();
				it != entries.end();
				++it) {
			buf.putU32(it->first);
			buf.putString(it->second);
		}
	}

	buf.putU32(m_files.size());
	for (FileMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it) {
		const ReportFile &file = it->second;

		buf.putString(file.m_name);
		buf.putU32(file.m_lines.size());
		for (ReportFile::LineMap_t::const_iterator lineIt = file.m_lines.begin();
				lineIt != file.m_lines.end();
				++lineIt) {
			const Line &line = lineIt->second;

			buf.putU32(lineIt->first);
			buf.putU32(line.m_type);

			buf.putU32(line.m_sessions.size());
			for (LineSessionList_t::const_iterator ls = line.m_sessions.begin();
					ls != line.m_sessions.end();
					++ls) {
				buf.putU32(ls->m_id);
				buf.putCoverage(ls->m_coverage);
				buf.putU32(ls->m_hasMissingBranches);
				buf.putU32(ls->m_missingBranches.size());
				for (BranchList_t::const_iterator b = ls->m_missingBranches.begin();
						b != ls->m_missingBranches.end();
						++b)
					buf.putString(*b);
				buf.putU32(ls->m_partials.size());
				for (PartialList_t::const_iterator p = ls->m_partials.begin();
						p != ls->m_partials.end();
						++p) {
					buf.putU32((uint32_t)p->m_start);
					buf.putU32((uint32_t)p->m_end);
					buf.putCoverage(p->m_coverage);
				}
				buf.putComplexity(ls->m_complexity);
			}

			buf.putU32(line.m_hasDatapoints);
			buf.putU32(line.m_datapoints.size());
			for (DatapointList_t::const_iterator dp = line.m_datapoints.begin();
					dp != line.m_datapoints.end();
					++dp) {
				buf.putU32(dp->m_sessionId);
				buf.putCoverage(dp->m_coverage);
				buf.putU32(dp->m_type);
				buf.putU32(dp->m_labelIds.size());
				for (LabelIdSet_t::const_iterator id = dp->m_labelIds.begin();
						id != dp->m_labelIds.end();
						++id)
					buf.putU32(*id);
			}
		}
	}

	return buf.finish(szOut);
}

bool Report::unMarshal(const void *data, size_t sz)
{
	const uint8_t *p = (const uint8_t *)data;

	if (sz < sizeof(struct marshalHeaderStruct))
		return false;

	struct marshalHeaderStruct hdr;

	memcpy(&hdr, p, sizeof(hdr));
	if (be_to_host<uint32_t>(hdr.magic) != COVMERGE_MAGIC)
		return false;
	if (be_to_host<uint32_t>(hdr.db_version) != COVMERGE_DB_VERSION)
		return false;

	p += sizeof(struct marshalHeaderStruct);
	sz -= sizeof(struct marshalHeaderStruct);

	if (be_to_host<uint32_t>(hdr.payload_size) != sz)
		return false;
	if (be_to_host<uint32_t>(hdr.checksum) != hash_block(p, sz)) {
		warning("Report checksum mismatch");
		return false;
	}

	UnMarshalBuffer buf(p, sz);
	Report out;

	out.m_nextSessionId = buf.getU32();

	uint32_t nSessions = buf.getCount();
	for (uint32_t i = 0; i < nSessions && buf.ok(); i++) {
		Session session;

		session.m_id = buf.getU32();
		session.m_type = buf.getU32() ? Session::SESSION_CARRIEDFORWARD : Session::SESSION_UPLOADED;

		uint32_t nFlags = buf.getCount();
		for (uint32_t f = 0; f < nFlags && buf.ok(); f++)
			session.m_flags.push_back(buf.getString());
		session.m_name = buf.getString();
		session.m_provider = buf.getString();
		session.m_buildCode = buf.getString();
		session.m_jobCode = buf.getString();
		session.m_buildUrl = buf.getString();

		uint32_t nEnv = buf.getCount();
		for (uint32_t e = 0; e < nEnv && buf.ok(); e++) {
			std::string key = buf.getString();

			session.m_env[key] = buf.getString();
		}
		session.m_totals = buf.getTotals();

		if (out.m_sessions.find(session.m_id) != out.m_sessions.end())
			return false;
		out.m_sessions[session.m_id] = session;
	}

	if (buf.getU32()) {
		LabelsIndex index;
		uint32_t nLabels = buf.getCount();

		for (uint32_t i = 0; i < nLabels && buf.ok(); i++) {
			uint32_t id = buf.getU32();
			std::string label = buf.getString();

			if (!index.insert(id, label))
				return false;
		}
		out.setLabelsIndex(index);
	}

	uint32_t nFiles = buf.getCount();
	for (uint32_t i = 0; i < nFiles && buf.ok(); i++) {
		ReportFile file(buf.getString());
		uint32_t nLines = buf.getCount();

		for (uint32_t l = 0; l < nLines && buf.ok(); l++) {
			unsigned int lineNr = buf.getU32();
			Line line;

			line.m_type = buf.getType();

			uint32_t nLineSessions = buf.getCount();
			for (uint32_t s = 0; s < nLineSessions && buf.ok(); s++) {
				LineSession ls;

				ls.m_id = buf.getU32();
				ls.m_coverage = buf.getCoverage();
				ls.m_hasMissingBranches = buf.getU32() != 0;

				uint32_t nBranches = buf.getCount();
				for (uint32_t b = 0; b < nBranches && buf.ok(); b++)
					ls.m_missingBranches.push_back(buf.getString());

				uint32_t nPartials = buf.getCount();
				for (uint32_t pi = 0; pi < nPartials && buf.ok(); pi++) {
					Partial partial;

					partial.m_start = (int)buf.getU32();
					partial.m_end = (int)buf.getU32();
					partial.m_coverage = buf.getCoverage();
					ls.m_partials.push_back(partial);
				}
				ls.m_complexity = buf.getComplexity();
				line.m_sessions.push_back(ls);
			}

			line.m_hasDatapoints = buf.getU32() != 0;

			uint32_t nDatapoints = buf.getCount();
			for (uint32_t d = 0; d < nDatapoints && buf.ok(); d++) {
				CoverageDatapoint dp;

				dp.m_sessionId = buf.getU32();
				dp.m_coverage = buf.getCoverage();
				dp.m_type = buf.getType();

				uint32_t nIds = buf.getCount();
				for (uint32_t id = 0; id < nIds && buf.ok(); id++)
					dp.m_labelIds.insert(buf.getU32());
				line.m_datapoints.push_back(dp);
			}

			line.recalculate();
			file.m_lines[lineNr] = line;
		}

		out.m_files[file.m_name] = file;
	}

	if (!buf.ok() || !buf.atEnd())
		return false;

	*this = out;

	return true;
}
