#include <path-resolver.hh>
#include <path-tree.hh>
#include <filter.hh>
#include <utils.hh>

#include <regex>

using namespace covmerge;

// CI checkouts, vendored code, toolchains and friends
static const char *knownNoisePrefixes[] =
{
	R"(((home|Users)/travis/build/[^/\n]+/[^/\n]+/))",
	R"(((home|Users)/jenkins/jobs/[^/\n]+/workspace/))",
	R"((Users/distiller/[^/\n]+/))",
	R"((home/[^/\n]+/src/([^/\n]+/){3}))",
	R"(((home|Users)/[^/\n]+/workspace/[^/\n]+/[^/\n]+/))",
	R"((.*/jenkins/workspace/[^/\n]+/))",
	R"(((.+/src/)?github\.com/[^/\n]+/[^/\n]+/))",
	R"((\w:/Repos/[^/\n]+/[^/\n]+/))",
	R"(([\w:/]+projects/[^/\n]+/))",
	R"((\w:/_build/GitHub/[^/\n]+/))",
	R"((build/lib\.[^/\n]+/))",
	R"((home/circleci/code/))",
	R"((home/circleci/repo/))",
	R"((home/runner/work/[^/\n]+/[^/\n]+/))",
	R"((var/lib/buildkite-agent/builds/[^/\n]+/[^/\n]+/[^/\n]+/))",
	R"((opt/atlassian/pipelines/agent/build/))",
	R"((vendor/src/.*))",
	R"((pipeline/source/))",
	R"((var/snap-ci/repo/))",
	R"((home/ubuntu/[^/\n]+/))",
	R"((.*/site-packages/[^/\n]+\.egg/))",
	R"((.*/site-packages/))",
	R"((usr/local/lib/[^/\n]+/dist-packages/))",
	R"((.*/slather/spec/fixtures/[^\n]*))",
	R"((.*/target/generated-sources/[^\n]*))",
	R"((.*/\.phpenv/.*))",
	R"((usr/include/.*))",
	R"((.*/handlebars\.js/dist/.*))",
	R"((node_modules/.*))",
	R"((bower_components/.*))",
	R"((.*/lib/clang/.*))",
	R"((.*[<>].*))",
	R"((\w:/))",
	R"((.*/mac-coverage/build/src/.*))",
	R"((opt/.*/dist-packages/.*))",
	R"((.*/iPhoneSimulator\.platform/Developer/SDKs/.*))",
	R"((Applications/Xcode\.app/Contents/Developer/Toolchains/.*))",
	R"(((.*/)?\.?v?(irtual)?\.?envs?(-[^/\n]+)?/.*/[^/\n]+\.py$))",
	R"((Users/[^/\n]+/Projects/.*/Pods/.*))",
	R"((Users/[^/\n]+/Projects/[^/\n]+/))",
	R"((home/[^/\n]+/[^/\n]+/[^/\n]+/))",
};

static const std::regex &knownNoiseRegex()
{
	static std::regex *re;

	if (!re) {
		std::string alternatives;

		for (unsigned int i = 0; i < sizeof(knownNoisePrefixes) / sizeof(knownNoisePrefixes[0]); i++) {
			if (i != 0)
				alternatives += "|";
			alternatives += knownNoisePrefixes[i];
		}

		re = new std::regex("^(\\.*/)*(" + alternatives + ")?",
				std::regex::ECMAScript | std::regex::icase);
	}

	return *re;
}

std::string IPathResolver::stripKnownNoisePrefixes(const std::string &path)
{
	return std::regex_replace(path, knownNoiseRegex(), "",
			std::regex_constants::format_first_only);
}

// Backslashes to slashes, drop leading ./, ../ and /
static std::string basicClean(const std::string &rawPath)
{
	std::string path = string_replace_all(rawPath, "\\", "/");

	while (1) {
		if (string_starts_with(path, "./"))
			path = path.substr(2);
		else if (string_starts_with(path, "../"))
			path = path.substr(3);
		else if (string_starts_with(path, "/"))
			path = path.substr(1);
		else
			break;
	}

	return PathTree::cleanPath(path);
}

class PathResolver : public IPathResolver
{
public:
	PathResolver(IFilter &filter, const PathTree &tree, bool disableDefaultFixes) :
		m_filter(filter),
		m_tree(tree),
		m_disableDefaultFixes(disableDefaultFixes)
	{
	}

	std::string cleanPath(const std::string &rawPath)
	{
		if (rawPath == "")
			return "";

		std::string path = basicClean(rawPath);

		if (m_filter.hasFixes())
			path = m_filter.mangleSourcePath(path, false);

		if (!m_tree.empty()) {
			if (!m_disableDefaultFixes) {
				path = m_tree.resolve(path, 1);
				if (path == "")
					return "";
			}
		} else {
			path = stripKnownNoisePrefixes(path);
		}

		if (m_filter.hasFixes())
			path = m_filter.mangleSourcePath(path, true);

		if (path == "" || !m_filter.runFilters(path))
			return "";

		return path;
	}

	std::string resolve(const std::string &rawPath)
	{
		std::string out = cleanPath(rawPath);

		record(out, rawPath);

		return out;
	}

	const CalculatedPaths_t &getCalculatedPaths()
	{
		return m_calculatedPaths;
	}

	const DisagreementList_t &getDisagreements()
	{
		return m_disagreements;
	}

private:
	void record(const std::string &out, const std::string &rawPath)
	{
		PathSet_t &cur = m_calculatedPaths[out];

		cur.insert(rawPath);

		if (out == "")
			covmerge_debug(PATH_MSG, "path %s rejected\n", rawPath.c_str());
		else if (cur.size() > 1)
			covmerge_debug(PATH_MSG, "path %s and %zu other paths resolve to %s\n",
					rawPath.c_str(), cur.size() - 1, out.c_str());
	}

	IFilter &m_filter;
	const PathTree &m_tree;
	bool m_disableDefaultFixes;

	CalculatedPaths_t m_calculatedPaths;
	DisagreementList_t m_disagreements;
};

class BasePathAwareResolver : public IPathResolver
{
public:
	BasePathAwareResolver(IPathResolver &resolver, const std::string &uploadedFile,
			const std::vector<std::string> &basesToTry) :
		m_resolver(resolver)
	{
		std::string file = string_replace_all(uploadedFile, "\\", "/");
		std::string dir = split_path(file).first;

		while (dir.size() > 1 && dir[dir.size() - 1] == '/')
			dir = dir.substr(0, dir.size() - 1);

		if (dir != "")
			m_bases.push_back(dir);
		m_bases.insert(m_bases.end(), basesToTry.begin(), basesToTry.end());
	}

	std::string cleanPath(const std::string &rawPath)
	{
		std::string out = m_resolver.cleanPath(rawPath);
		std::string withBase = cleanWithBase(rawPath);

		if (out == "")
			return withBase;

		return out;
	}

	std::string resolve(const std::string &rawPath)
	{
		std::string out = m_resolver.cleanPath(rawPath);
		std::string withBase = cleanWithBase(rawPath);

		// Only logged for now, the plain result is kept
		if (out != "" && withBase != "" && out != withBase) {
			covmerge_debug(PATH_MSG, "path %s resolves to %s, but to %s relative to the upload\n",
					rawPath.c_str(), out.c_str(), withBase.c_str());
			m_disagreements.push_back(Disagreement_t(out, withBase));
		}

		if (out == "")
			out = withBase;

		m_calculatedPaths[out].insert(rawPath);
		if (out == "")
			covmerge_debug(PATH_MSG, "path %s rejected\n", rawPath.c_str());

		return out;
	}

	const CalculatedPaths_t &getCalculatedPaths()
	{
		return m_calculatedPaths;
	}

	const DisagreementList_t &getDisagreements()
	{
		return m_disagreements;
	}

private:
	std::string cleanWithBase(const std::string &rawPath)
	{
		std::string path = string_replace_all(rawPath, "\\", "/");

		if (path == "" || path[0] == '/')
			return "";

		for (std::vector<std::string>::const_iterator it = m_bases.begin();
				it != m_bases.end();
				++it) {
			std::string out = m_resolver.cleanPath(dir_concat(*it, path));

			if (out != "")
				return out;
		}

		return "";
	}

	IPathResolver &m_resolver;
	std::vector<std::string> m_bases;

	CalculatedPaths_t m_calculatedPaths;
	DisagreementList_t m_disagreements;
};


IPathResolver &IPathResolver::create(IFilter &filter, const PathTree &tree,
		bool disableDefaultFixes)
{
	return *new PathResolver(filter, tree, disableDefaultFixes);
}

IPathResolver &IPathResolver::createBasePathAware(IPathResolver &resolver,
		const std::string &uploadedFile,
		const std::vector<std::string> &basesToTry)
{
	return *new BasePathAwareResolver(resolver, uploadedFile, basesToTry);
}
