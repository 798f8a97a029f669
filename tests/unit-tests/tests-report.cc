#include "test.hh"

#include <report.hh>

#include <stdlib.h>
#include <string.h>

using namespace covmerge;

static Line makeLine(unsigned int sessionId, const Coverage &coverage)
{
	Line out;

	out.m_sessions.push_back(LineSession(sessionId, coverage));
	out.recalculate();

	return out;
}

static Line makeLabelledLine(unsigned int sessionId, const Coverage &coverage,
		unsigned int label1, unsigned int label2 = PLACEHOLDER_LABEL_ID)
{
	Line out = makeLine(sessionId, coverage);
	LabelIdSet_t labels;

	labels.insert(label1);
	out.m_hasDatapoints = true;
	out.m_datapoints.push_back(CoverageDatapoint(sessionId, coverage, COVERAGE_TYPE_LINE, labels));

	if (label2 != PLACEHOLDER_LABEL_ID) {
		labels.clear();
		labels.insert(label2);
		out.m_datapoints.push_back(CoverageDatapoint(sessionId, coverage, COVERAGE_TYPE_LINE, labels));
	}

	return out;
}

static Session makeSession(unsigned int id, const char *flag = NULL)
{
	Session out;

	out.m_id = id;
	if (flag)
		out.m_flags.push_back(flag);

	return out;
}

TESTSUITE(labels)
{
	TEST(placeholder_is_always_there)
	{
		LabelsIndex index;
		std::string label;

		ASSERT_TRUE(index.size() == 1);
		ASSERT_TRUE(index.isOnlyPlaceholder());
		ASSERT_TRUE(index.lookupLabel(PLACEHOLDER_LABEL_ID, label));
		ASSERT_TRUE(label == PLACEHOLDER_LABEL);
	}

	TEST(new_labels_get_the_next_id)
	{
		LabelsIndex index;
		unsigned int id;

		ASSERT_TRUE(index.getOrAdd("alpha") == 1);
		ASSERT_TRUE(index.getOrAdd("beta") == 2);
		ASSERT_TRUE(index.getOrAdd("alpha") == 1);
		ASSERT_FALSE(index.isOnlyPlaceholder());

		// Gaps are kept, new ids go above the highest
		ASSERT_TRUE(index.insert(7, "gamma"));
		ASSERT_TRUE(index.getOrAdd("delta") == 8);

		ASSERT_TRUE(index.lookupId("gamma", id));
		ASSERT_TRUE(id == 7);
		ASSERT_FALSE(index.lookupId("epsilon", id));
	}

	TEST(insert_conflicts)
	{
		LabelsIndex index;

		ASSERT_TRUE(index.insert(1, "alpha"));
		ASSERT_TRUE(index.insert(1, "alpha"));
		ASSERT_FALSE(index.insert(1, "beta"));
		ASSERT_FALSE(index.insert(2, "alpha"));
		ASSERT_FALSE(index.insert(PLACEHOLDER_LABEL_ID, "zero"));
		ASSERT_TRUE(index.size() == 2);
	}
}

TESTSUITE(report)
{
	TEST(lines_merge_across_sessions)
	{
		ReportFile file("a.c");

		file.append(1, makeLine(0, Coverage::hits(2)));
		file.append(1, makeLine(1, Coverage::hits(3)));
		// Same session again: best observation
		file.append(1, makeLine(1, Coverage::hits(1)));

		const Line *line = file.getLine(1);

		ASSERT_TRUE(line);
		ASSERT_TRUE(line->m_sessions.size() == 2);
		ASSERT_TRUE(line->m_sessions[0].m_id == 0);
		ASSERT_TRUE(line->getSession(1)->m_coverage == Coverage::hits(3));
		ASSERT_TRUE(line->m_coverage == Coverage::hits(5));
		ASSERT_FALSE(file.getLine(2));
	}

	TEST(missing_branches)
	{
		Line a;
		Line b;
		BranchList_t missA;
		BranchList_t missB;

		missA.push_back("1");
		missA.push_back("0");
		missB.push_back("1");
		missB.push_back("2");

		a.m_sessions.push_back(LineSession(0, Coverage::branch(2, 4)));
		a.m_sessions[0].setMissingBranches(missA);
		b.m_sessions.push_back(LineSession(1, Coverage::branch(2, 4)));
		b.m_sessions[0].setMissingBranches(missB);
		b.m_type = COVERAGE_TYPE_BRANCH;

		a.merge(b);

		// Only branch 1 was missed by both sessions
		ASSERT_TRUE(a.m_coverage == Coverage::branch(3, 4));
		ASSERT_TRUE(a.m_type == COVERAGE_TYPE_BRANCH);
		ASSERT_TRUE(a.m_sessions[0].m_missingBranches[0] == "0");

		// Within a session, missing branches are unioned
		LineSession ls(0, Coverage::branch(2, 4));
		LineSession other(0, Coverage::branch(2, 4));

		ls.setMissingBranches(missA);
		other.setMissingBranches(missB);
		ls.merge(other);
		ASSERT_TRUE(ls.m_missingBranches.size() == 3);
		ASSERT_TRUE(ls.m_coverage == Coverage::branch(1, 4));
	}

	TEST(coverage_types)
	{
		ASSERT_TRUE(mergeCoverageType(COVERAGE_TYPE_LINE, COVERAGE_TYPE_METHOD) == COVERAGE_TYPE_METHOD);
		ASSERT_TRUE(mergeCoverageType(COVERAGE_TYPE_BRANCH, COVERAGE_TYPE_METHOD) == COVERAGE_TYPE_BRANCH);
		ASSERT_TRUE(mergeCoverageType(COVERAGE_TYPE_LINE, COVERAGE_TYPE_LINE) == COVERAGE_TYPE_LINE);
	}

	TEST(merge_is_commutative)
	{
		Report a;
		Report b;
		ReportFile f1("a.c");
		ReportFile f2("a.c");
		ReportFile f3("b.c");

		f1.append(1, makeLine(0, Coverage::hits(1)));
		f1.append(2, makeLine(0, Coverage::hits(0)));
		f2.append(2, makeLine(0, Coverage::hits(4)));
		f2.append(3, makeLine(0, Coverage::branch(1, 2)));
		f3.append(10, makeLine(0, Coverage::boolean(true)));

		a.append(f1);
		a.append(f2);
		a.append(f3);

		b.append(f3);
		b.append(f2);
		b.append(f1);

		ASSERT_TRUE(a.getFiles().size() == 2);
		ASSERT_TRUE(a.getFile("a.c")->m_lines == b.getFile("a.c")->m_lines);
		ASSERT_TRUE(a.getFile("b.c")->m_lines == b.getFile("b.c")->m_lines);
		ASSERT_TRUE(a.getFile("a.c")->getLine(2)->m_coverage == Coverage::hits(4));
	}

	TEST(empty_files_are_not_added)
	{
		Report report;

		report.append(ReportFile("a.c"));
		ASSERT_TRUE(report.isEmpty());
		ASSERT_TRUE(report.getFiles().empty());
	}

	TEST(totals)
	{
		Report report;
		ReportFile file("a.c");
		Line method = makeLine(0, Coverage::hits(1));

		method.m_type = COVERAGE_TYPE_METHOD;
		method.m_sessions[0].m_complexity = Complexity(1, 3);
		method.recalculate();

		file.append(1, method);
		file.append(2, makeLine(0, Coverage::hits(0)));
		file.append(3, makeLine(0, Coverage::branch(1, 2)));
		file.append(4, makeLine(0, Coverage::hits(7)));

		report.append(file);
		report.addSession(makeSession(report.allocateSessionId()));

		ReportTotals totals = report.getTotals();

		ASSERT_TRUE(totals.m_files == 1);
		ASSERT_TRUE(totals.m_lines == 4);
		ASSERT_TRUE(totals.m_hits == 2);
		ASSERT_TRUE(totals.m_misses == 1);
		ASSERT_TRUE(totals.m_partials == 1);
		ASSERT_TRUE(totals.m_methods == 1);
		ASSERT_TRUE(totals.m_sessions == 1);
		ASSERT_TRUE(totals.m_complexity == 1);
		ASSERT_TRUE(totals.m_complexityTotal == 3);
		ASSERT_TRUE(totals.getCoverage() == "50");

		ReportTotals third;

		third.m_lines = 3;
		third.m_hits = 1;
		ASSERT_TRUE(third.getCoverage() == "33.33333");
		ASSERT_TRUE(ReportTotals().getCoverage() == "");
	}

	TEST(session_ids_are_never_reused)
	{
		Report report;
		unsigned int first = report.allocateSessionId();
		unsigned int second = report.allocateSessionId();

		ASSERT_TRUE(first == 0);
		ASSERT_TRUE(second == 1);

		report.addSession(makeSession(second));
		ASSERT_TRUE(report.deleteSession(second));
		ASSERT_FALSE(report.deleteSession(second));
		ASSERT_TRUE(report.allocateSessionId() == 2);

		// Sessions added with a higher id move the next id along
		report.addSession(makeSession(9));
		ASSERT_TRUE(report.allocateSessionId() == 10);
	}

	TEST(delete_session)
	{
		Report report;
		ReportFile a("a.c");
		ReportFile b("b.c");

		a.append(1, makeLine(0, Coverage::hits(1)));
		a.append(1, makeLine(1, Coverage::hits(2)));
		a.append(2, makeLine(1, Coverage::hits(0)));
		b.append(1, makeLine(1, Coverage::hits(1)));

		report.append(a);
		report.append(b);
		report.addSession(makeSession(0));
		report.addSession(makeSession(1, "unit"));

		ASSERT_TRUE(report.getSession(1)->hasFlag("unit"));
		ASSERT_FALSE(report.getSession(0)->hasFlag("unit"));

		report.deleteSession(1);

		ASSERT_FALSE(report.getSession(1));
		ASSERT_TRUE(report.getFiles().size() == 1);
		ASSERT_TRUE(report.getFile("a.c")->m_lines.size() == 1);
		ASSERT_TRUE(report.getFile("a.c")->getLine(1)->m_coverage == Coverage::hits(1));
		ASSERT_FALSE(report.getFile("a.c")->getLine(1)->getSession(1));
	}

	TEST(delete_labels)
	{
		Report report;
		ReportFile file("a.c");
		SessionIdSet_t sessions;
		LabelIdSet_t removed;

		// Session 0 covers line 1 under labels 1 and 2, line 2 under 1 only
		file.append(1, makeLabelledLine(0, Coverage::hits(1), 1, 2));
		file.append(2, makeLabelledLine(0, Coverage::hits(1), 1));
		file.append(2, makeLabelledLine(1, Coverage::hits(1), 1));
		report.append(file);
		report.addSession(makeSession(0));
		report.addSession(makeSession(1));

		LabelIdSet_t before = report.getLabelsForSession(0);
		ASSERT_TRUE(before.size() == 2);

		sessions.insert(0);
		removed.insert(1);
		report.deleteLabels(sessions, removed);

		const Line *line1 = report.getFile("a.c")->getLine(1);
		const Line *line2 = report.getFile("a.c")->getLine(2);

		ASSERT_TRUE(line1->m_datapoints.size() == 1);
		ASSERT_TRUE(*line1->m_datapoints[0].m_labelIds.begin() == 2);
		ASSERT_TRUE(line1->getSession(0));

		// Session 0 lost its only datapoint on line 2, session 1 is untouched
		ASSERT_FALSE(line2->getSession(0));
		ASSERT_TRUE(line2->getSession(1));
		ASSERT_TRUE(line2->m_datapoints.size() == 1);

		LabelIdSet_t after = report.getLabelsForSession(0);
		ASSERT_TRUE(after.size() == 1);
		ASSERT_TRUE(*after.begin() == 2);
	}

	TEST(remap_labels)
	{
		Report report;
		ReportFile file("a.c");
		Report::LabelIdMap_t mapping;

		file.append(1, makeLabelledLine(0, Coverage::hits(1), 1, 2));
		report.append(file);

		mapping[1] = 5;
		report.remapLabels(mapping);

		LabelIdSet_t all = report.getAllLabels();

		ASSERT_TRUE(all.size() == 2);
		ASSERT_TRUE(all.find(2) != all.end());
		ASSERT_TRUE(all.find(5) != all.end());
	}

	TEST(labels_index)
	{
		Report report;
		LabelsIndex index;

		ASSERT_FALSE(report.hasLabelsIndex());

		index.getOrAdd("alpha");
		report.setLabelsIndex(index);
		ASSERT_TRUE(report.hasLabelsIndex());
		ASSERT_TRUE(report.getLabelsIndex() == index);

		report.clearLabelsIndex();
		ASSERT_FALSE(report.hasLabelsIndex());
	}
}

TESTSUITE(report_marshal)
{
	TEST(marshal_and_load)
	{
		Report report;
		Report loaded;
		ReportFile file("src/a.c");
		Session session = makeSession(0, "unit");
		LabelsIndex index;
		Line line = makeLabelledLine(0, Coverage::branch(1, 2), 1);
		BranchList_t missing;
		size_t sz;

		missing.push_back("1:2");
		line.m_sessions[0].setMissingBranches(missing);
		line.m_sessions[0].m_partials.push_back(Partial(0, PARTIAL_NONE, Coverage::hits(1)));
		line.m_type = COVERAGE_TYPE_BRANCH;

		file.append(3, line);
		file.append(4, makeLine(0, Coverage::boolean(false)));
		report.append(file);

		session.m_type = Session::SESSION_CARRIEDFORWARD;
		session.m_name = "CI \"unit\"";
		session.m_env["OS"] = "linux";
		report.addSession(session);
		report.allocateSessionId();

		index.getOrAdd("test_a");
		report.setLabelsIndex(index);

		void *data = report.marshal(&sz);

		ASSERT_TRUE(data);
		ASSERT_TRUE(loaded.unMarshal(data, sz));

		ASSERT_TRUE(loaded.getFile("src/a.c")->m_lines == report.getFile("src/a.c")->m_lines);
		ASSERT_TRUE(loaded.getSessions().size() == 1);
		ASSERT_TRUE(loaded.getSession(0)->m_type == Session::SESSION_CARRIEDFORWARD);
		ASSERT_TRUE(loaded.getSession(0)->m_name == "CI \"unit\"");
		ASSERT_TRUE(loaded.getSession(0)->m_env["OS"] == "linux");
		ASSERT_TRUE(loaded.getSession(0)->hasFlag("unit"));
		ASSERT_TRUE(loaded.hasLabelsIndex());
		ASSERT_TRUE(loaded.getLabelsIndex() == index);
		ASSERT_TRUE(loaded.getNextSessionId() == 2);

		free(data);
	}

	TEST(corrupt_data_is_rejected)
	{
		Report report;
		Report loaded;
		ReportFile file("a.c");
		size_t sz;

		file.append(1, makeLine(0, Coverage::hits(1)));
		report.append(file);
		report.addSession(makeSession(0));

		uint8_t *data = (uint8_t *)report.marshal(&sz);

		// Truncated
		ASSERT_FALSE(loaded.unMarshal(data, sz - 1));
		ASSERT_FALSE(loaded.unMarshal(data, 3));

		// Payload bit flip
		data[sz - 1] ^= 0x1;
		ASSERT_FALSE(loaded.unMarshal(data, sz));
		data[sz - 1] ^= 0x1;

		// Wrong magic
		data[0] ^= 0xff;
		ASSERT_FALSE(loaded.unMarshal(data, sz));
		data[0] ^= 0xff;

		ASSERT_TRUE(loaded.unMarshal(data, sz));

		free(data);
	}
}
