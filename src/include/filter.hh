#pragma once

#include <string>
#include <vector>

namespace covmerge
{
	/**
	 * Class for user path rules.
	 *
	 * Handles the "fixes" (pattern::replacement rewrites) and the
	 * "paths"/"ignore" include and exclude patterns.
	 */
	class IFilter
	{
	public:
		typedef std::vector<std::string> RuleList_t;

		/**
		 * Run the include/exclude patterns on @a path.
		 *
		 * A pattern prefixed with ! excludes. Without include patterns
		 * everything is included, ".*" includes everything and "!.*"
		 * disables exclusion.
		 *
		 * @param path the path to check
		 *
		 * @return true if this path should be included in the report, false otherwise.
		 */
		virtual bool runFilters(const std::string &path) = 0;

		/**
		 * Apply the user fix rules to a path.
		 *
		 * The first rule whose pattern matches the start of the path
		 * rewrites it. Rules with an empty pattern add a prefix, and are
		 * only applied when @a addPrefixes is set.
		 *
		 * @param path the path to mangle
		 * @param addPrefixes whether to apply prefix rules
		 *
		 * @return the mangled path
		 */
		virtual std::string mangleSourcePath(const std::string &path, bool addPrefixes) = 0;

		virtual bool hasFixes() = 0;

		/**
		 * Create a filter.
		 *
		 * @param fixes rules on the form pattern::replacement
		 * @param patterns include patterns, with excludes prefixed by !
		 */
		static IFilter &create(const RuleList_t &fixes, const RuleList_t &patterns);

		/**
		 * Turn an ignore pattern into an exclude pattern and vice versa.
		 */
		static std::string invertPattern(const std::string &pattern);


		virtual ~IFilter() {}
	};
}
