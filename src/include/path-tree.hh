#pragma once

#include <stddef.h>

#include <map>
#include <string>
#include <vector>

namespace covmerge
{
	/**
	 * Index over the repository file list (the table of contents).
	 *
	 * Paths are stored by their components in reverse order, so lookups
	 * walk from the filename towards the root. Nodes live in an arena
	 * and refer to each other by index. The tree is read-only once
	 * built, and can be shared between threads resolving paths.
	 */
	class PathTree
	{
	public:
		typedef std::vector<std::string> PathList_t;

		PathTree();

		PathTree(const PathList_t &toc);

		/**
		 * Split a newline separated table of contents.
		 */
		static PathList_t splitToc(const std::string &toc);

		/**
		 * Normalize a raw path: strip CR and surrounding whitespace,
		 * unescape "\ ", turn backslashes into slashes, drop "**" glob
		 * directories and resolve . and .. components.
		 *
		 * clean(clean(p)) == clean(p) for all p.
		 */
		static std::string cleanPath(const std::string &path);

		/**
		 * Check that a match is plausible for a path: they are equal
		 * (case-insensitive), the match is a shorter suffix of the path,
		 * or the match ends with the last @a ancestors + 1 components of
		 * the path.
		 */
		static bool checkAncestors(const std::string &path, const std::string &match,
				unsigned int ancestors);

		void insert(const std::string &path);

		/**
		 * Lookup a cleaned path.
		 *
		 * @return the best matching table of contents entry, or an
		 * empty string if nothing matches
		 */
		std::string lookup(const std::string &path) const;

		/**
		 * Clean and lookup a raw path.
		 *
		 * @param path the uploaded path
		 * @param ancestors the number of ancestors which must be
		 *        shared, 0 to accept any match
		 *
		 * @return the canonical path, or an empty string if the path
		 * is not in the tree
		 */
		std::string resolve(const std::string &path, unsigned int ancestors = 0) const;

		size_t size() const;

		bool empty() const;

	private:
		typedef std::vector<size_t> IndexList_t;
		typedef std::map<std::string, size_t> ChildMap_t;

		struct Node
		{
			IndexList_t m_fullPaths;
			ChildMap_t m_children;
		};

		static std::string cleanPathOnce(const std::string &path);

		const IndexList_t *drill(size_t node) const;

		std::string bestMatch(const std::string &path, const IndexList_t &candidates) const;

		std::vector<Node> m_nodes;
		PathList_t m_paths;
	};
}
