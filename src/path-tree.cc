#include <path-tree.hh>
#include <utils.hh>

using namespace covmerge;

static const size_t ROOT_NODE = 0;

static std::string joinComponents(const std::vector<std::string> &parts, size_t first)
{
	std::string out;

	for (size_t i = first; i < parts.size(); i++) {
		if (i != first)
			out += "/";
		out += parts[i];
	}

	return out;
}

// Like split_string, but keeps a trailing empty component
static std::vector<std::string> splitComponents(const std::string &path)
{
	std::vector<std::string> out;
	size_t last = 0;
	size_t pos;

	while ((pos = path.find('/', last)) != std::string::npos) {
		out.push_back(path.substr(last, pos - last));
		last = pos + 1;
	}
	out.push_back(path.substr(last));

	return out;
}

PathTree::PathTree()
{
	m_nodes.push_back(Node());
}

PathTree::PathTree(const PathList_t &toc)
{
	m_nodes.push_back(Node());

	for (PathList_t::const_iterator it = toc.begin();
			it != toc.end();
			++it)
		insert(*it);
}

PathTree::PathList_t PathTree::splitToc(const std::string &toc)
{
	PathList_t out;
	std::vector<std::string> lines = split_string(toc, "\n");

	for (std::vector<std::string>::const_iterator it = lines.begin();
			it != lines.end();
			++it) {
		std::string cur = trim_string(*it);

		if (cur != "")
			out.push_back(cur);
	}

	return out;
}

std::string PathTree::cleanPathOnce(const std::string &path)
{
	std::string s = trim_string(path);

	s = string_replace_all(s, "**/", "");
	s = string_replace_all(s, "\r", "");
	s = string_replace_all(s, "\\ ", " ");
	s = string_replace_all(s, "\\", "/");

	bool absolute = s.size() > 0 && s[0] == '/';
	std::vector<std::string> parts = split_string(s, "/");
	std::vector<std::string> out;

	for (std::vector<std::string>::const_iterator it = parts.begin();
			it != parts.end();
			++it) {
		const std::string &cur = *it;

		if (cur == "" || cur == ".")
			continue;

		if (cur == "..") {
			if (!out.empty() && out.back() != "..")
				out.pop_back();
			else if (!absolute)
				out.push_back(cur);
			continue;
		}

		out.push_back(cur);
	}

	s = joinComponents(out, 0);
	if (absolute)
		s = "/" + s;

	return trim_string(s);
}

std::string PathTree::cleanPath(const std::string &path)
{
	std::string cur = path;

	// Each step only shrinks or keeps the string, so this terminates
	while (1) {
		std::string next = cleanPathOnce(cur);

		if (next == cur)
			break;
		cur = next;
	}

	return cur;
}

bool PathTree::checkAncestors(const std::string &path, const std::string &match,
		unsigned int ancestors)
{
	std::string pl = string_to_lower(path);
	std::string ml = string_to_lower(match);

	if (pl == ml)
		return true;

	std::vector<std::string> pathParts = splitComponents(pl);
	std::vector<std::string> matchParts = splitComponents(ml);

	if (matchParts.size() < pathParts.size() && string_ends_with(pl, ml))
		return true;

	size_t first = 0;
	if (pathParts.size() > ancestors + 1)
		first = pathParts.size() - (ancestors + 1);

	return string_ends_with(ml, joinComponents(pathParts, first));
}

void PathTree::insert(const std::string &rawPath)
{
	std::string path = cleanPath(rawPath);

	if (path == "")
		return;

	std::vector<std::string> parts = splitComponents(path);
	size_t node = ROOT_NODE;

	for (std::vector<std::string>::const_reverse_iterator it = parts.rbegin();
			it != parts.rend();
			++it) {
		std::string component = string_to_lower(*it);
		ChildMap_t::const_iterator child = m_nodes[node].m_children.find(component);

		if (child == m_nodes[node].m_children.end()) {
			size_t next = m_nodes.size();

			m_nodes.push_back(Node());
			m_nodes[node].m_children[component] = next;
			node = next;
		} else {
			node = child->second;
		}
	}

	// Same path listed twice
	for (IndexList_t::const_iterator it = m_nodes[node].m_fullPaths.begin();
			it != m_nodes[node].m_fullPaths.end();
			++it) {
		if (m_paths[*it] == path)
			return;
	}

	m_nodes[node].m_fullPaths.push_back(m_paths.size());
	m_paths.push_back(path);
}

const PathTree::IndexList_t *PathTree::drill(size_t node) const
{
	while (m_nodes[node].m_children.size() == 1) {
		node = m_nodes[node].m_children.begin()->second;

		if (!m_nodes[node].m_fullPaths.empty())
			return &m_nodes[node].m_fullPaths;
	}

	return NULL;
}

std::string PathTree::bestMatch(const std::string &path, const IndexList_t &candidates) const
{
	std::string lowerPath = string_to_lower(path);
	std::string best;
	bool bestIsSuffix = false;
	size_t bestCommon = 0;
	bool haveBest = false;

	// Last candidate wins ties
	for (IndexList_t::const_reverse_iterator it = candidates.rbegin();
			it != candidates.rend();
			++it) {
		const std::string &cur = m_paths[*it];
		std::string lowerCur = string_to_lower(cur);

		bool isSuffix = lowerCur == lowerPath ||
				string_ends_with(lowerPath, "/" + lowerCur) ||
				string_ends_with(lowerCur, "/" + lowerPath);

		size_t common = 0;
		while (common < cur.size() && common < path.size() &&
				cur[cur.size() - 1 - common] == path[path.size() - 1 - common])
			common++;

		bool better = !haveBest ||
				(isSuffix && !bestIsSuffix) ||
				(isSuffix == bestIsSuffix && common > bestCommon);

		if (better) {
			best = cur;
			bestIsSuffix = isSuffix;
			bestCommon = common;
			haveBest = true;
		}
	}

	return best;
}

std::string PathTree::lookup(const std::string &path) const
{
	std::vector<std::string> parts = splitComponents(path);
	IndexList_t results;
	size_t node = ROOT_NODE;
	bool end = false;
	bool match = false;

	for (std::vector<std::string>::const_reverse_iterator it = parts.rbegin();
			it != parts.rend();
			++it) {
		ChildMap_t::const_iterator child = m_nodes[node].m_children.find(string_to_lower(*it));

		if (child == m_nodes[node].m_children.end())
			break;

		node = child->second;
		match = true;
		end = !m_nodes[node].m_fullPaths.empty();
		if (end)
			results = m_nodes[node].m_fullPaths;
	}

	// Matched part of the way, try following a single branch to a full path
	if (match && !end) {
		const IndexList_t *next = drill(node);

		if (next)
			results.insert(results.end(), next->begin(), next->end());
	}

	if (results.empty())
		return "";

	if (results.size() == 1)
		return m_paths[results[0]];

	return bestMatch(path, results);
}

std::string PathTree::resolve(const std::string &rawPath, unsigned int ancestors) const
{
	std::string path = cleanPath(rawPath);

	if (path == "")
		return "";

	std::string out = lookup(path);

	if (out == "")
		return "";

	if (ancestors && !checkAncestors(path, out, ancestors)) {
		covmerge_debug(PATH_MSG, "path %s: match %s has too few common ancestors\n",
				path.c_str(), out.c_str());
		return "";
	}

	return out;
}

size_t PathTree::size() const
{
	return m_paths.size();
}

bool PathTree::empty() const
{
	return m_paths.empty();
}
