#include "test.hh"

#include <coverage.hh>

using namespace covmerge;

static Partial span(int start, int end, unsigned int hits)
{
	return Partial(start, end, Coverage::hits(hits));
}

static PartialList_t spans(const Partial &a, const Partial &b = Partial(),
		const Partial &c = Partial(), const Partial &d = Partial())
{
	PartialList_t out;

	out.push_back(a);
	if (!b.m_coverage.isNone())
		out.push_back(b);
	if (!c.m_coverage.isNone())
		out.push_back(c);
	if (!d.m_coverage.isNone())
		out.push_back(d);

	return out;
}

TESTSUITE(coverage)
{
	TEST(parse)
	{
		Coverage c;

		ASSERT_TRUE(Coverage::parse("12", c));
		ASSERT_TRUE(c == Coverage::hits(12));
		ASSERT_TRUE(Coverage::parse(" 1/2 ", c));
		ASSERT_TRUE(c == Coverage::branch(1, 2));
		ASSERT_TRUE(Coverage::parse("true", c));
		ASSERT_TRUE(c == Coverage::boolean(true));
		ASSERT_TRUE(Coverage::parse("false", c));
		ASSERT_TRUE(c == Coverage::boolean(false));

		ASSERT_FALSE(Coverage::parse("3/2", c));
		ASSERT_FALSE(Coverage::parse("a/2", c));
		ASSERT_FALSE(Coverage::parse("kalle", c));
		ASSERT_FALSE(Coverage::parse("", c));

		// Hit counts are never negative and must fit
		ASSERT_FALSE(Coverage::parse("-1", c));
		ASSERT_FALSE(Coverage::parse("-1/2", c));
		ASSERT_FALSE(Coverage::parse("1/-2", c));
		ASSERT_FALSE(Coverage::parse("5000000000", c));
		ASSERT_FALSE(Coverage::parse("1/5000000000", c));
		ASSERT_FALSE(Coverage::parse("+3", c));
		ASSERT_TRUE(Coverage::parse("4294967295", c));
		ASSERT_TRUE(c == Coverage::hits(4294967295u));
	}

	TEST(to_string)
	{
		ASSERT_TRUE(Coverage::hits(3).toString() == "3");
		ASSERT_TRUE(Coverage::branch(1, 4).toString() == "1/4");
		ASSERT_TRUE(Coverage::branch(7, 4).toString() == "4/4");
		ASSERT_TRUE(Coverage::boolean(false).toString() == "false");
		ASSERT_TRUE(Coverage().toString() == "null");
	}

	TEST(line_state)
	{
		ASSERT_TRUE(Coverage::hits(0).getState() == Coverage::LINE_MISS);
		ASSERT_TRUE(Coverage::hits(2).getState() == Coverage::LINE_HIT);
		ASSERT_TRUE(Coverage::boolean(true).getState() == Coverage::LINE_HIT);
		ASSERT_TRUE(Coverage::branch(0, 2).getState() == Coverage::LINE_MISS);
		ASSERT_TRUE(Coverage::branch(1, 2).getState() == Coverage::LINE_PARTIAL);
		ASSERT_TRUE(Coverage::branch(2, 2).getState() == Coverage::LINE_HIT);
	}

	TEST(same_session_takes_the_best_observation)
	{
		ASSERT_TRUE(mergeSameSession(Coverage::hits(3), Coverage::hits(5)) == Coverage::hits(5));
		ASSERT_TRUE(mergeSameSession(Coverage::hits(5), Coverage::hits(3)) == Coverage::hits(5));
		ASSERT_TRUE(mergeSameSession(Coverage::boolean(false), Coverage::boolean(true)) ==
				Coverage::boolean(true));
		ASSERT_TRUE(mergeSameSession(Coverage::branch(1, 2), Coverage::branch(0, 4)) ==
				Coverage::branch(1, 4));
		ASSERT_TRUE(mergeSameSession(Coverage(), Coverage::hits(2)) == Coverage::hits(2));
	}

	TEST(distinct_sessions_sum)
	{
		ASSERT_TRUE(mergeAcrossSessions(Coverage::hits(3), Coverage::hits(5)) == Coverage::hits(8));
		ASSERT_TRUE(mergeAcrossSessions(Coverage::boolean(false), Coverage::boolean(false)) ==
				Coverage::boolean(false));
		ASSERT_TRUE(mergeAcrossSessions(Coverage::hits(0), Coverage()) == Coverage::hits(0));
	}

	TEST(branch_against_scalar)
	{
		// A hit line means all branches were taken
		ASSERT_TRUE(mergeAcrossSessions(Coverage::branch(1, 2), Coverage::hits(1)) ==
				Coverage::branch(2, 2));
		ASSERT_TRUE(mergeAcrossSessions(Coverage::hits(0), Coverage::branch(1, 2)) ==
				Coverage::branch(1, 2));
		ASSERT_TRUE(mergeSameSession(Coverage::boolean(true), Coverage::branch(0, 3)) ==
				Coverage::branch(3, 3));
	}

	TEST(combine_closed_spans)
	{
		PartialList_t out;

		ASSERT_TRUE(combinePartials(spans(span(1, 5, 1), span(9, 12, 0), span(5, 7, 1), span(8, 9, 0)), out));
		ASSERT_TRUE(out.size() == 2);
		ASSERT_TRUE(out[0] == span(1, 7, 1));
		ASSERT_TRUE(out[1] == span(8, 12, 0));
	}

	TEST(combine_single_open_span)
	{
		PartialList_t out;

		ASSERT_TRUE(combinePartials(spans(span(1, PARTIAL_NONE, 1)), out));
		ASSERT_TRUE(out.size() == 1);
		ASSERT_TRUE(out[0] == span(1, PARTIAL_NONE, 1));
	}

	TEST(combine_degenerate_spans)
	{
		PartialList_t out;

		ASSERT_FALSE(combinePartials(spans(span(2, 2, 1), span(2, 2, 0)), out));
		ASSERT_TRUE(out.empty());

		ASSERT_FALSE(combinePartials(spans(span(2, 2, 1)), out));
		ASSERT_TRUE(out.empty());

		ASSERT_FALSE(combinePartials(PartialList_t(), out));
	}

	TEST(combine_single_span_is_normalized)
	{
		PartialList_t one;
		PartialList_t two;

		ASSERT_TRUE(combinePartials(spans(span(PARTIAL_NONE, 5, 1)), one));
		ASSERT_TRUE(combinePartials(spans(span(PARTIAL_NONE, 5, 1), span(PARTIAL_NONE, 5, 1)), two));
		ASSERT_TRUE(one.size() == 1);
		ASSERT_TRUE(one[0] == span(0, 5, 1));
		ASSERT_TRUE(one == two);

		ASSERT_TRUE(combinePartials(spans(span(PARTIAL_NONE, PARTIAL_NONE, 3)), one));
		ASSERT_TRUE(one.size() == 1);
		ASSERT_TRUE(one[0] == span(PARTIAL_NONE, PARTIAL_NONE, 3));
	}

	TEST(combine_overlapping_spans)
	{
		PartialList_t out;

		ASSERT_TRUE(combinePartials(spans(span(1, 10, 0), span(4, 6, 1)), out));
		ASSERT_TRUE(out.size() == 3);
		ASSERT_TRUE(out[0] == span(1, 4, 0));
		ASSERT_TRUE(out[1] == span(4, 6, 1));
		ASSERT_TRUE(out[2] == span(6, 10, 0));
	}

	TEST(combine_is_order_independent)
	{
		PartialList_t a;
		PartialList_t b;

		combinePartials(spans(span(1, 10, 0), span(4, 6, 1), span(8, PARTIAL_NONE, 2)), a);
		combinePartials(spans(span(8, PARTIAL_NONE, 2), span(4, 6, 1), span(1, 10, 0)), b);

		ASSERT_TRUE(a == b);
	}

	TEST(combine_is_idempotent)
	{
		PartialList_t once;
		PartialList_t twice;

		ASSERT_TRUE(combinePartials(spans(span(0, 3, 1), span(5, PARTIAL_NONE, 0)), once));
		ASSERT_TRUE(once.size() == 2);
		ASSERT_TRUE(once[0] == span(0, 3, 1));
		ASSERT_TRUE(once[1] == span(5, PARTIAL_NONE, 0));

		ASSERT_TRUE(combinePartials(once, twice));
		ASSERT_TRUE(once == twice);

		ASSERT_TRUE(combinePartials(spans(span(1, 10, 0), span(4, 6, 1)), once));
		ASSERT_TRUE(combinePartials(once, twice));
		ASSERT_TRUE(once == twice);
	}
}
