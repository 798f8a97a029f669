#include "test.hh"
#include "mocks/mock-decoder.hh"

#include <upload-processor.hh>
#include <merge-engine.hh>
#include <merge-context.hh>
#include <configuration.hh>
#include <flag-configuration.hh>
#include <path-tree.hh>
#include <errors.hh>
#include <utils.hh>

#include <stdexcept>
#include <string>

using namespace covmerge;

static uint64_t fixedNow(void)
{
	return 1000;
}

static PathTree::PathList_t paths(const char *a = NULL, const char *b = NULL)
{
	PathTree::PathList_t out;

	if (a)
		out.push_back(a);
	if (b)
		out.push_back(b);

	return out;
}

static FlagList_t flags(const char *flag)
{
	return FlagList_t(1, flag);
}

class ProcessorFixture
{
public:
	ProcessorFixture() :
		m_conf(IConfiguration::create()),
		m_flags(IFlagConfiguration::create(m_conf)),
		m_decoders(IDecoderManager::create()),
		m_ctx(m_conf, m_flags, m_decoders)
	{
		m_decoders.registerDecoder(m_decoder);
	}

	IConfiguration &m_conf;
	IFlagConfiguration &m_flags;
	IDecoderManager &m_decoders;
	MergeContext m_ctx;
	MockDecoder m_decoder;
};

TESTSUITE(decoder_manager)
{
	TEST(best_match_wins)
	{
		IDecoderManager &manager = IDecoderManager::create();
		MockDecoder weak;
		MockDecoder perfect;

		manager.registerDecoder(weak);
		manager.registerDecoder(perfect);

		ALLOW_CALL(weak, getName()).RETURN("weak");
		ALLOW_CALL(perfect, getName()).RETURN("perfect");

		REQUIRE_CALL(weak, matchDecoder(_, "<?xml version=\"1.0\"?>", "coverage.xml"))
			.RETURN(match_weak);
		REQUIRE_CALL(perfect, matchDecoder(_, "<?xml version=\"1.0\"?>", "coverage.xml"))
			.RETURN(match_perfect);

		ASSERT_TRUE(manager.matchDecoder("\n  \n<?xml version=\"1.0\"?>\n<coverage/>", "coverage.xml") == &perfect);
	}

	TEST(first_registered_wins_ties)
	{
		IDecoderManager &manager = IDecoderManager::create();
		MockDecoder first;
		MockDecoder second;

		manager.registerDecoder(first);
		manager.registerDecoder(second);

		ALLOW_CALL(first, getName()).RETURN("first");
		ALLOW_CALL(second, getName()).RETURN("second");
		ALLOW_CALL(first, matchDecoder(_, _, _)).RETURN(match_weak);
		ALLOW_CALL(second, matchDecoder(_, _, _)).RETURN(match_weak);

		ASSERT_TRUE(manager.matchDecoder("TN:", "lcov.info") == &first);
	}

	TEST(no_match)
	{
		IDecoderManager &manager = IDecoderManager::create();
		MockDecoder decoder;

		manager.registerDecoder(decoder);

		REQUIRE_CALL(decoder, matchDecoder(_, "", "empty.txt"))
			.RETURN(match_none);

		ASSERT_FALSE(manager.matchDecoder("", "empty.txt"));
	}
}

TESTSUITE(upload_processor)
{
	TEST(decode_and_append, ProcessorFixture)
	{
		PathTree toc(paths("src/a.c"));
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		m_decoder.addLine("/ci/build/src/a.c", 1, 2);
		m_decoder.addLine("unknown/z.c", 1, 1);
		m_decoder.addLine("unknown/z.c", 2, 1);
		m_decoder.addLine("/ci/build/src/a.c", 2, 0);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		REQUIRE_CALL(m_decoder, matchDecoder(_, "<coverage>", "coverage.xml"))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, "coverage.xml", _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("coverage.xml", "\n<coverage>\n</coverage>\n")) ==
				PROCESS_OK);

		MergeResult res = engine.finalize();

		ASSERT_TRUE(res.m_report.getFiles().size() == 1);
		ASSERT_TRUE(res.m_report.getFile("src/a.c")->m_lines.size() == 2);
		ASSERT_TRUE(m_ctx.getStatistics().m_filesProcessed == 1);
		ASSERT_TRUE(m_ctx.getStatistics().m_pathsRejected == 1);
		ASSERT_TRUE(m_ctx.getStatistics().m_linesAppended == 2);
	}

	TEST(unknown_format, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		REQUIRE_CALL(m_decoder, matchDecoder(_, _, "random.txt"))
			.RETURN(match_none);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("random.txt", "hello")) == PROCESS_NO_DECODER);
		ASSERT_TRUE(m_ctx.getStatistics().m_filesFailed == 1);
		ASSERT_THROW(engine.finalize(), EmptyUploadError);
	}

	TEST(corrupt_file_is_dropped, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, "bad.xml", _))
			.THROW(CorruptInputError("bad.xml", "line without a count"));
		REQUIRE_CALL(m_decoder, decode(_, "good.xml", _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("src/a.c", 1, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("bad.xml", "<x/>")) == PROCESS_CORRUPT);
		ASSERT_TRUE(processor.processFile(engine, RawUpload("good.xml", "<x/>")) == PROCESS_OK);

		MergeResult res = engine.finalize();

		ASSERT_TRUE(res.m_report.getFile("src/a.c"));
		ASSERT_TRUE(m_ctx.getStatistics().m_filesFailed == 1);
	}

	TEST(line_zero_is_corrupt, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("src/a.c", 1, 1);
		m_decoder.addLine("src/a.c", 0, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("lcov.info", "SF:src/a.c")) == PROCESS_CORRUPT);
		ASSERT_THROW(engine.finalize(), EmptyUploadError);
	}

	TEST(expired_reports, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		mock_get_timestamp(fixedNow);
		m_conf.configure("max-report-age", "100");

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		ALLOW_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("src/a.c", 1, 1);

		engine.start(Report(), Session());

		m_decoder.m_timestamp = 800;
		ASSERT_TRUE(processor.processFile(engine, RawUpload("old.xml", "<x/>")) == PROCESS_EXPIRED);
		ASSERT_TRUE(m_ctx.getStatistics().m_filesExpired == 1);

		m_decoder.m_timestamp = 950;
		ASSERT_TRUE(processor.processFile(engine, RawUpload("new.xml", "<x/>")) == PROCESS_OK);

		// No age limit
		m_conf.configure("max-report-age", "0");
		m_decoder.m_timestamp = 1;
		ASSERT_TRUE(processor.processFile(engine, RawUpload("ancient.xml", "<x/>")) == PROCESS_OK);

		mock_get_timestamp(NULL);
	}

	TEST(nothing_resolves, ProcessorFixture)
	{
		PathTree toc(paths("src/a.c"));
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("lib/b.c", 1, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("coverage.xml", "<x/>")) == PROCESS_EMPTY);
		ASSERT_THROW(engine.finalize(), EmptyUploadError);
	}

	TEST(json_replaces_lcov, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);
		RawUploadList_t uploads;

		uploads.push_back(RawUpload("coverage/coverage.lcov", "TN:\nSF:src/a.c\n"));
		uploads.push_back(RawUpload("coverage/coverage.json", "{}"));
		uploads.push_back(RawUpload("empty.xml", ""));

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		REQUIRE_CALL(m_decoder, matchDecoder(_, _, "coverage/coverage.json"))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, "coverage/coverage.json", _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("src/a.c", 1, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processUpload(engine, uploads) == 1);
	}

	TEST(flag_scoped_paths, ProcessorFixture)
	{
		PathTree toc;

		m_conf.configure("flag-paths", "backend:server/");
		m_conf.configure("ignore", "server/generated/");

		UploadProcessor processor(m_ctx, toc, flags("backend"));
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("server/a.c", 1, 1);
		m_decoder.addLine("server/generated/b.c", 1, 1);
		m_decoder.addLine("web/c.js", 1, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("coverage.xml", "<x/>")) == PROCESS_OK);

		MergeResult res = engine.finalize();

		ASSERT_TRUE(res.m_report.getFiles().size() == 1);
		ASSERT_TRUE(res.m_report.getFile("server/a.c"));

		const IPathResolver::CalculatedPaths_t &calculated = processor.getCalculatedPaths();

		ASSERT_TRUE(calculated.find("")->second.count("web/c.js") == 1);
		ASSERT_TRUE(calculated.find("")->second.count("server/generated/b.c") == 1);
		ASSERT_TRUE(calculated.find("server/a.c") != calculated.end());
	}

	TEST(decoder_label_table, ProcessorFixture)
	{
		PathTree toc;

		m_conf.configure("carryforward-labels-flags", "unit");

		UploadProcessor processor(m_ctx, toc, flags("unit"));
		UploadMergeEngine engine(m_ctx);
		LineEvent event("src/a.c", 3, Coverage::hits(1));
		unsigned int id;

		event.m_labels.push_back(LabelHintGroup_t(1, LabelHint(5u)));
		m_decoder.m_labels[5] = "test_a";
		m_decoder.m_events.push_back(event);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("coverage.json", "{}")) == PROCESS_OK);

		MergeResult res = engine.finalize();
		const Line *line = res.m_report.getFile("src/a.c")->getLine(3);

		ASSERT_TRUE(res.m_report.hasLabelsIndex());
		ASSERT_TRUE(res.m_report.getLabelsIndex().lookupId("test_a", id));
		ASSERT_TRUE(line->m_datapoints.size() == 1);
		ASSERT_TRUE(*line->m_datapoints[0].m_labelIds.begin() == id);
	}

	TEST(ignored_lines, ProcessorFixture)
	{
		PathTree toc(paths("src/a.c", "src/b.c"));
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);
		IgnoredLinesMap_t ignored;

		ignored["/ci/build/src/a.c"].m_lines.insert(2);
		ignored["unknown/z.c"].m_lines.insert(1);
		processor.setIgnoredLines(ignored);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("src/a.c", 1, 1);
		m_decoder.addLine("src/a.c", 2, 1);
		m_decoder.addLine("src/a.c", 3, 0);
		m_decoder.addLine("src/b.c", 2, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("lcov.info", "SF:src/a.c")) == PROCESS_OK);

		MergeResult res = engine.finalize();
		const ReportFile *a = res.m_report.getFile("src/a.c");

		ASSERT_TRUE(a->m_lines.size() == 2);
		ASSERT_FALSE(a->getLine(2));
		ASSERT_TRUE(res.m_report.getFile("src/b.c")->getLine(2));
	}

	TEST(path_diagnostics_cover_all_files, ProcessorFixture)
	{
		PathTree toc(paths("src/a.c"));
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.TIMES(2)
			.LR_SIDE_EFFECT(m_decoder.mockDecode(_3));

		m_decoder.addLine("/ci/build/src/a.c", 1, 1);
		m_decoder.addLine("unknown/z.c", 1, 1);

		engine.start(Report(), Session());
		ASSERT_TRUE(processor.processFile(engine, RawUpload("first.xml", "<x/>")) == PROCESS_OK);

		m_decoder.m_events.clear();
		m_decoder.addLine("./src/a.c", 2, 1);
		ASSERT_TRUE(processor.processFile(engine, RawUpload("second.xml", "<x/>")) == PROCESS_OK);

		const IPathResolver::CalculatedPaths_t &calculated = processor.getCalculatedPaths();
		IPathResolver::CalculatedPaths_t::const_iterator a = calculated.find("src/a.c");

		ASSERT_TRUE(a != calculated.end());
		ASSERT_TRUE(a->second.size() == 2);
		ASSERT_TRUE(a->second.count("/ci/build/src/a.c") == 1);
		ASSERT_TRUE(a->second.count("./src/a.c") == 1);
		ASSERT_TRUE(calculated.find("")->second.count("unknown/z.c") == 1);
		ASSERT_TRUE(processor.getDisagreements().empty());
	}

	TEST(unexpected_decoder_errors_propagate, ProcessorFixture)
	{
		PathTree toc;
		UploadProcessor processor(m_ctx, toc, FlagList_t());
		UploadMergeEngine engine(m_ctx);

		ALLOW_CALL(m_decoder, getName()).RETURN("mock");
		ALLOW_CALL(m_decoder, matchDecoder(_, _, _))
			.RETURN(match_perfect);
		REQUIRE_CALL(m_decoder, decode(_, _, _))
			.THROW(std::logic_error("decoder bug"));

		engine.start(Report(), Session());
		ASSERT_THROW(processor.processFile(engine, RawUpload("lcov.info", "SF:a.c")), std::logic_error);
	}
}
