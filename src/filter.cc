#include <filter.hh>
#include <utils.hh>

#include <regex>
#include <string>
#include <vector>

using namespace covmerge;

// a/**/b => a/.*/b, a/*/b => a/[^/]+/b
static std::string globToRegex(const std::string &pattern)
{
	std::string key = string_replace_all(pattern, "**", ".*");
	std::string out;

	for (size_t i = 0; i < key.size(); i++) {
		if (key[i] == '*' && (i == 0 || key[i - 1] != '.')) {
			out += "[^/\n]+";
			continue;
		}
		out += key[i];
	}

	// No inline flags in ECMAScript, and . never meets a newline in a path
	return string_replace_all(out, "(?s:", "(?:");
}

class Filter : public IFilter
{
public:
	Filter(const RuleList_t &fixes, const RuleList_t &patterns) :
		m_fixHandler(fixes),
		m_patternHandler(patterns)
	{
	}

	bool runFilters(const std::string &path)
	{
		return m_patternHandler.includeFile(path);
	}

	std::string mangleSourcePath(const std::string &path, bool addPrefixes)
	{
		return m_fixHandler.fix(path, addPrefixes);
	}

	bool hasFixes()
	{
		return !m_fixHandler.empty();
	}

private:
	class FixHandler
	{
	public:
		FixHandler(const RuleList_t &fixes)
		{
			for (RuleList_t::const_iterator it = fixes.begin();
					it != fixes.end();
					++it) {
				size_t sep = it->find("::");

				if (sep == std::string::npos) {
					warning("Ignoring path fix without separator: %s", it->c_str());
					continue;
				}

				std::string before = it->substr(0, sep);
				std::string after = it->substr(sep + 2);

				if (before == "") {
					m_prefixes.push_back(after);
					continue;
				}

				std::string key = globToRegex(before);
				while (key.size() > 0 && key[0] == '/')
					key = key.substr(1);

				try
				{
					m_rules.push_back(Rule(std::regex("^(?:" + key + ")"), after));
				}
				catch (std::regex_error &e)
				{
					warning("Ignoring invalid path fix %s: %s", it->c_str(), e.what());
				}
			}
		}

		std::string fix(const std::string &path, bool addPrefixes)
		{
			std::string out = path;

			for (RuleList_t::size_type i = 0; i < m_rules.size(); i++) {
				const Rule &cur = m_rules[i];

				if (!std::regex_search(out, cur.first, std::regex_constants::match_continuous))
					continue;

				out = std::regex_replace(out, cur.first, cur.second,
						std::regex_constants::format_first_only);
				out = cleanSlashes(out);
				break;
			}

			if (addPrefixes) {
				for (RuleList_t::const_iterator it = m_prefixes.begin();
						it != m_prefixes.end();
						++it)
					out = dir_concat(*it, out);
			}

			return out;
		}

		bool empty() const
		{
			return m_rules.empty() && m_prefixes.empty();
		}

	private:
		typedef std::pair<std::regex, std::string> Rule;
		typedef std::vector<Rule> FixRuleList_t;

		std::string cleanSlashes(const std::string &path)
		{
			std::string out = path;

			while (out.find("//") != std::string::npos)
				out = string_replace_all(out, "//", "/");
			while (out.size() > 0 && out[0] == '/')
				out = out.substr(1);

			return out;
		}

		FixRuleList_t m_rules;
		RuleList_t m_prefixes;
	};

	class PatternHandler
	{
	public:
		PatternHandler(const RuleList_t &patterns) :
			m_hasPatterns(!patterns.empty()),
			m_includeAll(false)
		{
			bool haveIncludes = false;
			bool excludeNone = false;

			for (RuleList_t::const_iterator it = patterns.begin();
					it != patterns.end();
					++it) {
				if (*it == ".*")
					m_includeAll = true;
				else if (*it == "!.*")
					excludeNone = true;

				if (it->size() == 0 || (*it)[0] != '!')
					haveIncludes = true;
			}

			if (!haveIncludes)
				m_includeAll = true;

			for (RuleList_t::const_iterator it = patterns.begin();
					it != patterns.end();
					++it) {
				bool exclude = it->size() > 0 && (*it)[0] == '!';

				if (exclude && excludeNone)
					continue;
				if (!exclude && m_includeAll)
					continue;

				std::string pattern = exclude ? it->substr(1) : *it;

				try
				{
					std::regex re(globToRegex(pattern));

					if (exclude)
						m_excludes.push_back(re);
					else
						m_includes.push_back(re);
				}
				catch (std::regex_error &e)
				{
					warning("Ignoring invalid path pattern %s: %s", it->c_str(), e.what());
				}
			}
		}

		bool includeFile(const std::string &file)
		{
			if (!m_hasPatterns)
				return true;

			if (file == "")
				return false;

			if (!m_includeAll && !matchOne(m_includes, file))
				return false;

			return !matchOne(m_excludes, file);
		}

	private:
		typedef std::vector<std::regex> RegexList_t;

		bool matchOne(const RegexList_t &list, const std::string &file)
		{
			for (RegexList_t::const_iterator it = list.begin();
					it != list.end();
					++it) {
				if (std::regex_search(file, *it, std::regex_constants::match_continuous))
					return true;
			}

			return false;
		}

		bool m_hasPatterns;
		bool m_includeAll;
		RegexList_t m_includes;
		RegexList_t m_excludes;
	};

	FixHandler m_fixHandler;
	PatternHandler m_patternHandler;
};

IFilter &IFilter::create(const RuleList_t &fixes, const RuleList_t &patterns)
{
	return *new Filter(fixes, patterns);
}

std::string IFilter::invertPattern(const std::string &pattern)
{
	if (pattern.size() > 0 && pattern[0] == '!')
		return pattern.substr(1);

	return "!" + pattern;
}
