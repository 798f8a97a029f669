#pragma once

#include <string>
#include <vector>

namespace covmerge
{
	/**
	 * A coverage value: a hit count, a boolean, or a "hits/total"
	 * branch ratio.
	 */
	class Coverage
	{
	public:
		enum Kind
		{
			COVERAGE_NONE,
			COVERAGE_HITS,
			COVERAGE_BOOL,
			COVERAGE_BRANCH,
		};

		enum LineState
		{
			LINE_MISS,
			LINE_HIT,
			LINE_PARTIAL,
		};

		Coverage() :
			m_kind(COVERAGE_NONE), m_hits(0), m_total(0)
		{
		}

		static Coverage hits(unsigned int hits);

		static Coverage boolean(bool covered);

		// Clamps hits to total
		static Coverage branch(unsigned int hits, unsigned int total);

		/**
		 * Parse "12", "1/2", "true" or "false".
		 *
		 * @return false if the string is none of these
		 */
		static bool parse(const std::string &str, Coverage &out);

		bool isNone() const
		{
			return m_kind == COVERAGE_NONE;
		}

		enum LineState getState() const;

		std::string toString() const;

		bool operator==(const Coverage &other) const;

		bool operator!=(const Coverage &other) const
		{
			return !(*this == other);
		}

		bool operator<(const Coverage &other) const;

		enum Kind m_kind;
		unsigned int m_hits;  // Hit count, 0/1 for booleans
		unsigned int m_total; // Branches, only for COVERAGE_BRANCH
	};

	/**
	 * Merge two observations from the same session: the best
	 * observation wins (max for counts, or for booleans).
	 */
	Coverage mergeSameSession(const Coverage &a, const Coverage &b);

	/**
	 * Merge values from distinct sessions: counts sum, booleans or
	 * together.
	 */
	Coverage mergeAcrossSessions(const Coverage &a, const Coverage &b);


	// Start or end column not given
	const int PARTIAL_NONE = -1;

	/**
	 * A column span [start, end) of a line with its own coverage. A
	 * start of PARTIAL_NONE means from the beginning of the line, an end
	 * of PARTIAL_NONE means to the end of the line.
	 */
	class Partial
	{
	public:
		Partial() :
			m_start(PARTIAL_NONE), m_end(PARTIAL_NONE)
		{
		}

		Partial(int start, int end, const Coverage &coverage) :
			m_start(start), m_end(end), m_coverage(coverage)
		{
		}

		bool operator==(const Partial &other) const
		{
			return m_start == other.m_start && m_end == other.m_end &&
					m_coverage == other.m_coverage;
		}

		int m_start;
		int m_end;
		Coverage m_coverage;
	};

	typedef std::vector<Partial> PartialList_t;

	/**
	 * Combine overlapping partial spans into the minimal ordered list of
	 * spans, merging columns hit by several spans.
	 *
	 * The result does not depend on the input order, and combining an
	 * already combined list gives the same list back.
	 *
	 * @param partials the spans to combine
	 * @param out the combined spans
	 *
	 * @return false if nothing remains
	 */
	bool combinePartials(const PartialList_t &partials, PartialList_t &out);
}
