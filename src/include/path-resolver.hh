#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace covmerge
{
	class IFilter;
	class PathTree;

	/**
	 * Turns raw uploaded paths into canonical repository paths.
	 *
	 * The pipeline is: basic cleanup, user fixes, resolution against the
	 * table of contents (or noise prefix stripping when there is none),
	 * user fixes again with prefixes, and finally the include/exclude
	 * patterns. A rejected path resolves to the empty string.
	 */
	class IPathResolver
	{
	public:
		typedef std::set<std::string> PathSet_t;
		typedef std::map<std::string, PathSet_t> CalculatedPaths_t;
		// plain result, base path result
		typedef std::pair<std::string, std::string> Disagreement_t;
		typedef std::vector<Disagreement_t> DisagreementList_t;

		virtual ~IPathResolver()
		{
		}

		/**
		 * Run the resolution pipeline. No side effects.
		 *
		 * @return the canonical path, or the empty string if rejected
		 */
		virtual std::string cleanPath(const std::string &path) = 0;

		/**
		 * Like cleanPath, but also records the outcome for diagnostics.
		 */
		virtual std::string resolve(const std::string &path) = 0;

		/**
		 * Resolved path to raw input paths. Rejected inputs are kept
		 * under the empty string.
		 */
		virtual const CalculatedPaths_t &getCalculatedPaths() = 0;

		virtual const DisagreementList_t &getDisagreements() = 0;


		/**
		 * Create a resolver.
		 *
		 * @param filter the user fixes and patterns
		 * @param tree the table of contents, may be empty
		 * @param disableDefaultFixes skip table of contents resolution.
		 *        Without a table of contents, noise prefixes are
		 *        stripped either way
		 */
		static IPathResolver &create(IFilter &filter, const PathTree &tree,
				bool disableDefaultFixes);

		/**
		 * Create a resolver which, when @a resolver rejects a relative
		 * path, retries with the path joined to the directory of
		 * @a uploadedFile, and then to each of @a basesToTry.
		 */
		static IPathResolver &createBasePathAware(IPathResolver &resolver,
				const std::string &uploadedFile,
				const std::vector<std::string> &basesToTry = std::vector<std::string>());

		/**
		 * Strip well-known CI, vendor and toolchain prefixes.
		 */
		static std::string stripKnownNoisePrefixes(const std::string &path);
	};
}
