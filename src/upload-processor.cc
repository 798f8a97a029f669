#include <upload-processor.hh>
#include <configuration.hh>
#include <decoder.hh>
#include <errors.hh>
#include <filter.hh>
#include <flag-configuration.hh>
#include <merge-context.hh>
#include <merge-engine.hh>
#include <path-resolver.hh>
#include <path-tree.hh>
#include <report-builder.hh>
#include <utils.hh>

#include <map>
#include <set>

using namespace covmerge;

class DecoderListener : public ICoverageDecoder::IListener
{
public:
	DecoderListener(MergeContext &ctx, BuilderSession &session) :
		m_ctx(ctx), m_session(session)
	{
	}

	void onTimestamp(uint64_t timestamp)
	{
		int maxAge = m_ctx.getConfiguration().keyAsInt("max-report-age");
		uint64_t now = get_timestamp();

		if (maxAge <= 0 || timestamp >= now)
			return;

		if (now - timestamp > (uint64_t)maxAge)
			throw ReportExpiredError(timestamp, m_session.getUploadName());
	}

	void onLabel(unsigned int id, const std::string &label)
	{
		m_session.setLabel(id, label);
	}

	void onLine(const LineEvent &event)
	{
		FileHandleMap_t::iterator it = m_files.find(event.m_path);
		FileHandle *file;

		if (it == m_files.end()) {
			file = m_session.createFile(event.m_path);
			if (!file)
				m_ctx.getStatistics().m_pathsRejected++;
			m_files[event.m_path] = file;
		} else {
			file = it->second;
		}

		if (!file)
			return;

		file->append(event.m_lineNr, event.m_coverage, event.m_type, event.m_partials,
				event.m_hasMissingBranches ? &event.m_missingBranches : NULL,
				event.m_complexity, event.m_labels);
		m_ctx.getStatistics().m_linesAppended++;
	}

private:
	typedef std::map<std::string, FileHandle *> FileHandleMap_t;

	MergeContext &m_ctx;
	BuilderSession &m_session;
	FileHandleMap_t m_files;
};


static IFilter::RuleList_t getPatterns(MergeContext &ctx, const FlagList_t &flags)
{
	IConfiguration &conf = ctx.getConfiguration();
	IFilter::RuleList_t out = conf.keyAsList("paths");
	const IConfiguration::StringList_t &ignore = conf.keyAsList("ignore");

	for (IConfiguration::StringList_t::const_iterator it = ignore.begin();
			it != ignore.end();
			++it)
		out.push_back(IFilter::invertPattern(*it));

	for (FlagList_t::const_iterator it = flags.begin();
			it != flags.end();
			++it) {
		std::vector<std::string> scoped = ctx.getFlagConfiguration().getPathPatterns(*it);

		out.insert(out.end(), scoped.begin(), scoped.end());
	}

	return out;
}

UploadProcessor::UploadProcessor(MergeContext &ctx, const PathTree &toc, const FlagList_t &flags) :
	m_ctx(ctx),
	m_filter(IFilter::create(ctx.getConfiguration().keyAsList("fixes"), getPatterns(ctx, flags))),
	m_resolver(IPathResolver::create(m_filter, toc,
			ctx.getConfiguration().keyAsInt("disable-default-path-fixes") != 0))
{
}

UploadProcessor::~UploadProcessor()
{
	delete &m_resolver;
	delete &m_filter;
}

enum ProcessingResult UploadProcessor::processFile(UploadMergeEngine &engine, const RawUpload &upload)
{
	MergeStatistics &stats = m_ctx.getStatistics();
	ICoverageDecoder *decoder = m_ctx.getDecoderManager().matchDecoder(upload.m_contents,
			upload.m_filename);

	if (!decoder) {
		covmerge_debug(STATUS_MSG, "%s: unknown coverage format, skipping\n", upload.m_filename.c_str());
		stats.m_filesFailed++;
		return PROCESS_NO_DECODER;
	}

	IPathResolver &resolver = IPathResolver::createBasePathAware(m_resolver, upload.m_filename);
	BuilderSession session(resolver, engine.getSessionId(),
			m_ctx.getFlagConfiguration().supportsLabels(), upload.m_filename);
	DecoderListener listener(m_ctx, session);
	enum ProcessingResult out = PROCESS_OK;

	session.setIgnoredLines(m_ignoredLines);

	try {
		decoder->decode(upload.m_contents, upload.m_filename, listener);
	} catch (const CorruptInputError &e) {
		error("%s", e.what());
		out = PROCESS_CORRUPT;
	} catch (const ReportExpiredError &e) {
		warning("%s: report from %llu is too old, skipping", e.getFilename().c_str(),
				(unsigned long long)e.getTimestamp());
		out = PROCESS_EXPIRED;
	} catch (...) {
		delete &resolver;
		throw;
	}

	collectDiagnostics(upload.m_filename, resolver);

	if (out == PROCESS_OK) {
		Report report = session.finish();

		if (report.isEmpty()) {
			covmerge_debug(STATUS_MSG, "%s: no coverage for known files\n", upload.m_filename.c_str());
			out = PROCESS_EMPTY;
		} else {
			engine.appendReport(report);
			stats.m_filesProcessed++;
		}
	} else if (out == PROCESS_EXPIRED) {
		stats.m_filesExpired++;
	} else {
		stats.m_filesFailed++;
	}

	delete &resolver;

	return out;
}

void UploadProcessor::setIgnoredLines(const IgnoredLinesMap_t &rawIgnored)
{
	m_ignoredLines.clear();

	for (IgnoredLinesMap_t::const_iterator it = rawIgnored.begin();
			it != rawIgnored.end();
			++it) {
		std::string path = m_resolver.cleanPath(it->first);

		if (path == "")
			continue;

		IgnoredLines &cur = m_ignoredLines[path];

		cur.m_lines.insert(it->second.m_lines.begin(), it->second.m_lines.end());
		if (it->second.m_eof != 0 && (cur.m_eof == 0 || it->second.m_eof < cur.m_eof))
			cur.m_eof = it->second.m_eof;
	}
}

void UploadProcessor::collectDiagnostics(const std::string &filename, IPathResolver &resolver)
{
	const IPathResolver::CalculatedPaths_t &paths = resolver.getCalculatedPaths();
	const IPathResolver::DisagreementList_t &disagreements = resolver.getDisagreements();

	for (IPathResolver::CalculatedPaths_t::const_iterator it = paths.begin();
			it != paths.end();
			++it) {
		if (it->first != "" && it->second.size() > 1)
			covmerge_debug(PATH_MSG, "%s: %zu paths resolve to %s\n", filename.c_str(),
					it->second.size(), it->first.c_str());

		m_calculatedPaths[it->first].insert(it->second.begin(), it->second.end());
	}

	m_disagreements.insert(m_disagreements.end(), disagreements.begin(), disagreements.end());
}

unsigned int UploadProcessor::processUpload(UploadMergeEngine &engine, const RawUploadList_t &uploads)
{
	std::set<std::string> skip;
	unsigned int out = 0;

	// The JSON and lcov output of the same javascript run
	for (RawUploadList_t::const_iterator it = uploads.begin();
			it != uploads.end();
			++it) {
		if (it->m_filename == "coverage/coverage.json")
			skip.insert("coverage/coverage.lcov");
	}

	for (RawUploadList_t::const_iterator it = uploads.begin();
			it != uploads.end();
			++it) {
		if (it->m_contents == "")
			continue;
		if (skip.find(it->m_filename) != skip.end()) {
			covmerge_debug(STATUS_MSG, "Skipping %s\n", it->m_filename.c_str());
			continue;
		}

		if (processFile(engine, *it) == PROCESS_OK)
			out++;
	}

	return out;
}
