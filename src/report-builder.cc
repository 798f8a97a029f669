#include <report-builder.hh>
#include <path-resolver.hh>
#include <errors.hh>
#include <utils.hh>

#include <algorithm>
#include <set>

using namespace covmerge;

FileHandle::FileHandle(BuilderSession &session, const std::string &name) :
	m_session(session), m_file(name)
{
}

void FileHandle::append(unsigned int lineNr, const Coverage &coverage,
		enum CoverageType type, const PartialList_t &partials,
		const BranchList_t *missingBranches, const Complexity &complexity,
		const LabelHintList_t &labels)
{
	if (lineNr == 0)
		throw CorruptInputError(m_session.getUploadName(),
				fmt("line number 0 in %s", m_file.m_name.c_str()));
	if (coverage.isNone())
		return;
	if (m_session.isIgnored(m_file.m_name, lineNr)) {
		covmerge_debug(MERGE_MSG, "%s:%u is ignored\n", m_file.m_name.c_str(), lineNr);
		return;
	}

	LineSession ls(m_session.getSessionId(), coverage);
	Line line;

	if (missingBranches)
		ls.setMissingBranches(*missingBranches);
	if (!partials.empty()) {
		PartialList_t combined;

		if (combinePartials(partials, combined))
			ls.m_partials = combined;
	}
	ls.m_complexity = complexity;

	line.m_type = type;
	line.m_sessions.push_back(ls);

	if (m_session.supportsLabels()) {
		std::set<LabelIdSet_t> seen;

		line.m_hasDatapoints = true;
		for (LabelHintList_t::const_iterator it = labels.begin();
				it != labels.end();
				++it) {
			LabelIdSet_t ids = m_session.encodeLabels(*it);

			// No datapoints without labels
			if (ids.empty() || !seen.insert(ids).second)
				continue;

			line.m_datapoints.push_back(CoverageDatapoint(m_session.getSessionId(),
					coverage, type, ids));
		}
		std::sort(line.m_datapoints.begin(), line.m_datapoints.end());
	}

	m_file.append(lineNr, line);
}


BuilderSession::BuilderSession(IPathResolver &resolver, unsigned int sessionId,
		bool supportsLabels, const std::string &uploadName) :
	m_resolver(resolver),
	m_sessionId(sessionId),
	m_supportsLabels(supportsLabels),
	m_uploadName(uploadName)
{
}

BuilderSession::~BuilderSession()
{
	for (FileHandleMap_t::iterator it = m_files.begin();
			it != m_files.end();
			++it)
		delete it->second;
}

FileHandle *BuilderSession::createFile(const std::string &rawPath)
{
	std::string path = m_resolver.resolve(rawPath);

	if (path == "") {
		covmerge_debug(PATH_MSG, "%s: skipping %s\n", m_uploadName.c_str(), rawPath.c_str());
		return NULL;
	}

	FileHandleMap_t::iterator it = m_files.find(path);

	if (it != m_files.end())
		return it->second;

	FileHandle *out = new FileHandle(*this, path);

	m_files[path] = out;

	return out;
}

void BuilderSession::setLabel(unsigned int id, const std::string &label)
{
	unsigned int localId = label == "" ? PLACEHOLDER_LABEL_ID : m_labels.getOrAdd(label);

	m_decoderIds[id] = localId;
}

void BuilderSession::setIgnoredLines(const IgnoredLinesMap_t &ignored)
{
	m_ignoredLines = ignored;
}

bool BuilderSession::isIgnored(const std::string &path, unsigned int lineNr) const
{
	IgnoredLinesMap_t::const_iterator it = m_ignoredLines.find(path);

	if (it == m_ignoredLines.end())
		return false;

	return it->second.isIgnored(lineNr);
}

LabelIdSet_t BuilderSession::encodeLabels(const LabelHintGroup_t &group)
{
	LabelIdSet_t out;

	for (LabelHintGroup_t::const_iterator it = group.begin();
			it != group.end();
			++it) {
		unsigned int id;

		if (it->m_isId) {
			DecoderIdMap_t::const_iterator found = m_decoderIds.find(it->m_id);

			if (found == m_decoderIds.end())
				throw CorruptInputError(m_uploadName,
						fmt("label id %u is not in the label table", it->m_id));
			id = found->second;
		} else if (it->m_label == "") {
			id = PLACEHOLDER_LABEL_ID;
		} else {
			id = m_labels.getOrAdd(it->m_label);
		}

		out.insert(id);
		m_presentLabels.insert(id);
	}

	return out;
}

Report BuilderSession::finish()
{
	Report out;

	for (FileHandleMap_t::const_iterator it = m_files.begin();
			it != m_files.end();
			++it)
		out.append(it->second->m_file);

	if (m_supportsLabels) {
		if (m_presentLabels.size() == 1 && *m_presentLabels.begin() == PLACEHOLDER_LABEL_ID)
			covmerge_debug(LABEL_MSG, "%s: only the placeholder label, not generated with test contexts?\n",
					m_uploadName.c_str());

		out.setLabelsIndex(m_labels);
	}

	return out;
}
