#include <report.hh>
#include <writer.hh>
#include <utils.hh>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "json-writer.hh"

using namespace covmerge;

#define END_OF_CHUNK "<<<<< end_of_chunk >>>>>"

static std::string coverageToJson(const Coverage &coverage)
{
	if (coverage.m_kind == Coverage::COVERAGE_BRANCH)
		return "\"" + coverage.toString() + "\"";

	return coverage.toString();
}

static std::string typeToJson(enum CoverageType type)
{
	if (type == COVERAGE_TYPE_BRANCH)
		return "\"b\"";
	if (type == COVERAGE_TYPE_METHOD)
		return "\"m\"";

	return "null";
}

static std::string partialColumn(int column)
{
	if (column == PARTIAL_NONE)
		return "null";

	return fmt("%d", column);
}

// [a, b, null, null] -> [a, b]
static std::string toArray(std::vector<std::string> entries)
{
	std::string out = "[";

	while (!entries.empty() && entries.back() == "null")
		entries.pop_back();

	for (std::vector<std::string>::const_iterator it = entries.begin();
			it != entries.end();
			++it) {
		if (it != entries.begin())
			out += ", ";
		out += *it;
	}

	return out + "]";
}

static std::string totalsToJson(const ReportTotals &totals)
{
	std::string coverage = totals.getCoverage();

	return fmt("[%u, %u, %u, %u, %u, %s, %u, %u, 0, %u, %u, %u, 0]",
			totals.m_files, totals.m_lines, totals.m_hits, totals.m_misses,
			totals.m_partials,
			coverage == "" ? "null" : ("\"" + coverage + "\"").c_str(),
			totals.m_branches, totals.m_methods, totals.m_sessions,
			totals.m_complexity, totals.m_complexityTotal);
}

static std::string lineSessionToJson(const LineSession &ls)
{
	std::vector<std::string> entries;

	entries.push_back(fmt("%u", ls.m_id));
	entries.push_back(coverageToJson(ls.m_coverage));

	if (ls.m_hasMissingBranches) {
		std::vector<std::string> branches;

		for (BranchList_t::const_iterator it = ls.m_missingBranches.begin();
				it != ls.m_missingBranches.end();
				++it)
			branches.push_back("\"" + escape_json(*it) + "\"");
		entries.push_back(toArray(branches));
	} else {
		entries.push_back("null");
	}

	if (!ls.m_partials.empty()) {
		std::vector<std::string> partials;

		for (PartialList_t::const_iterator it = ls.m_partials.begin();
				it != ls.m_partials.end();
				++it)
			partials.push_back(fmt("[%s, %s, %s]", partialColumn(it->m_start).c_str(),
					partialColumn(it->m_end).c_str(), coverageToJson(it->m_coverage).c_str()));
		entries.push_back(toArray(partials));
	} else {
		entries.push_back("null");
	}

	entries.push_back(ls.m_complexity.toString());

	return toArray(entries);
}

static std::string lineToJson(const Line &line)
{
	std::vector<std::string> entries;
	std::vector<std::string> sessions;

	for (LineSessionList_t::const_iterator it = line.m_sessions.begin();
			it != line.m_sessions.end();
			++it)
		sessions.push_back(lineSessionToJson(*it));

	entries.push_back(coverageToJson(line.m_coverage));
	entries.push_back(typeToJson(line.m_type));
	entries.push_back(toArray(sessions));
	entries.push_back("null"); // Messages
	entries.push_back(line.m_complexity.toString());

	if (line.m_hasDatapoints) {
		std::vector<std::string> datapoints;

		for (DatapointList_t::const_iterator it = line.m_datapoints.begin();
				it != line.m_datapoints.end();
				++it) {
			std::vector<std::string> labels;

			for (LabelIdSet_t::const_iterator id = it->m_labelIds.begin();
					id != it->m_labelIds.end();
					++id)
				labels.push_back(fmt("%u", *id));

			datapoints.push_back(fmt("[%u, %s, %s, %s]", it->m_sessionId,
					coverageToJson(it->m_coverage).c_str(), typeToJson(it->m_type).c_str(),
					toArray(labels).c_str()));
		}
		entries.push_back(toArray(datapoints));
	}

	return toArray(entries);
}

static std::string sessionToJson(const Session &session)
{
	std::stringstream out;
	std::vector<std::string> flags;
	bool first = true;

	for (FlagList_t::const_iterator it = session.m_flags.begin();
			it != session.m_flags.end();
			++it)
		flags.push_back("\"" + escape_json(*it) + "\"");

	out << "{\"t\": " << totalsToJson(session.m_totals);
	out << ", \"f\": " << toArray(flags);
	out << ", \"n\": \"" << escape_json(session.m_name) << "\"";
	out << ", \"p\": \"" << escape_json(session.m_provider) << "\"";
	out << ", \"b\": \"" << escape_json(session.m_buildCode) << "\"";
	out << ", \"j\": \"" << escape_json(session.m_jobCode) << "\"";
	out << ", \"u\": \"" << escape_json(session.m_buildUrl) << "\"";
	out << ", \"e\": {";
	for (Session::EnvMap_t::const_iterator it = session.m_env.begin();
			it != session.m_env.end();
			++it) {
		if (!first)
			out << ", ";
		out << "\"" << escape_json(it->first) << "\": \"" << escape_json(it->second) << "\"";
		first = false;
	}
	out << "}";
	out << ", \"st\": \"" <<
			(session.m_type == Session::SESSION_CARRIEDFORWARD ? "carriedforward" : "uploaded") << "\"}";

	return out.str();
}

std::string covmerge::getJsonSummary(const Report &report)
{
	const Report::FileMap_t &files = report.getFiles();
	const Report::SessionMap_t &sessions = report.getSessions();
	std::stringstream out;
	unsigned int index = 0;

	out << "{\n  \"files\": {";
	for (Report::FileMap_t::const_iterator it = files.begin();
			it != files.end();
			++it) {
		out << (index == 0 ? "\n" : ",\n");
		out << fmt("    \"%s\": [%u, %s]", escape_json(it->first).c_str(), index,
				totalsToJson(it->second.getTotals()).c_str());
		index++;
	}
	out << "\n  },\n";

	out << "  \"sessions\": {";
	for (Report::SessionMap_t::const_iterator it = sessions.begin();
			it != sessions.end();
			++it) {
		out << (it == sessions.begin() ? "\n" : ",\n");
		out << fmt("    \"%u\": %s", it->first, sessionToJson(it->second).c_str());
	}
	out << "\n  },\n";

	if (report.hasLabelsIndex()) {
		const LabelsIndex::IdMap_t &labels = report.getLabelsIndex().getEntries();

		out << "  \"labels_index\": {";
		for (LabelsIndex::IdMap_t::const_iterator it = labels.begin();
				it != labels.end();
				++it) {
			out << (it == labels.begin() ? "" : ", ");
			out << fmt("\"%u\": \"%s\"", it->first, escape_json(it->second).c_str());
		}
		out << "},\n";
	}

	out << "  \"totals\": " << totalsToJson(report.getTotals()) << "\n}\n";

	return out.str();
}

std::string covmerge::getChunks(const Report &report)
{
	const Report::FileMap_t &files = report.getFiles();
	std::stringstream out;

	for (Report::FileMap_t::const_iterator it = files.begin();
			it != files.end();
			++it) {
		const ReportFile::LineMap_t &lines = it->second.m_lines;
		SessionIdSet_t present;
		unsigned int lineNr = 1;

		if (it != files.begin())
			out << "\n" << END_OF_CHUNK << "\n";

		for (ReportFile::LineMap_t::const_iterator line = lines.begin();
				line != lines.end();
				++line) {
			for (LineSessionList_t::const_iterator ls = line->second.m_sessions.begin();
					ls != line->second.m_sessions.end();
					++ls)
				present.insert(ls->m_id);
		}

		std::vector<std::string> ids;

		for (SessionIdSet_t::const_iterator id = present.begin();
				id != present.end();
				++id)
			ids.push_back(fmt("%u", *id));
		out << "{\"present_sessions\": " << toArray(ids) << "}";

		// One row per line number, empty for lines without data
		for (ReportFile::LineMap_t::const_iterator line = lines.begin();
				line != lines.end();
				++line) {
			for (; lineNr < line->first; lineNr++)
				out << "\n";
			out << "\n" << lineToJson(line->second);
			lineNr++;
		}
	}

	return out.str();
}


class JsonWriter : public IWriter
{
public:
	JsonWriter(const std::string &summaryFile, const std::string &chunksFile) :
		m_summaryFile(summaryFile), m_chunksFile(chunksFile)
	{
	}

	bool write(const Report &report)
	{
		std::ofstream summary(m_summaryFile.c_str());
		std::ofstream chunks(m_chunksFile.c_str());

		// Output directory not writable?
		if (!summary.is_open() || !chunks.is_open()) {
			error("Can't write %s or %s", m_summaryFile.c_str(), m_chunksFile.c_str());
			return false;
		}

		summary << getJsonSummary(report);
		chunks << getChunks(report);

		return summary.good() && chunks.good();
	}

private:
	std::string m_summaryFile;
	std::string m_chunksFile;
};

IWriter &covmerge::createJsonWriter(const std::string &summaryFile, const std::string &chunksFile)
{
	return *new JsonWriter(summaryFile, chunksFile);
}
