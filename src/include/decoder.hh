#pragma once

#include <report-builder.hh>

#include <stdint.h>

#include <string>
#include <vector>

namespace covmerge
{
	enum DecoderMatch
	{
		match_none    = 0,
		match_weak    = 1,
		match_perfect = 0xffff,
	};

	/**
	 * One decoded line observation, before path resolution.
	 */
	class LineEvent
	{
	public:
		LineEvent() :
			m_lineNr(0), m_type(COVERAGE_TYPE_LINE), m_hasMissingBranches(false)
		{
		}

		LineEvent(const std::string &path, unsigned int lineNr, const Coverage &coverage,
				enum CoverageType type = COVERAGE_TYPE_LINE) :
			m_path(path), m_lineNr(lineNr), m_coverage(coverage), m_type(type),
			m_hasMissingBranches(false)
		{
		}

		std::string m_path;
		unsigned int m_lineNr;
		Coverage m_coverage;
		enum CoverageType m_type;
		PartialList_t m_partials;
		bool m_hasMissingBranches;
		BranchList_t m_missingBranches;
		Complexity m_complexity;
		LabelHintList_t m_labels;
	};

	/**
	 * A coverage format decoder. Decoders never see the report, only
	 * the listener.
	 */
	class ICoverageDecoder
	{
	public:
		class IListener
		{
		public:
			virtual ~IListener()
			{
			}

			// The report declares when it was generated
			virtual void onTimestamp(uint64_t timestamp) = 0;

			// Entry in the report's own label table
			virtual void onLabel(unsigned int id, const std::string &label) = 0;

			virtual void onLine(const LineEvent &event) = 0;
		};

		virtual ~ICoverageDecoder()
		{
		}

		/**
		 * See if this decoder handles a file.
		 *
		 * @param content the file contents
		 * @param firstLine the first non-empty line of @a content
		 * @param filename the uploaded file name
		 *
		 * @return match_none if not, otherwise higher is a better match
		 */
		virtual unsigned int matchDecoder(const std::string &content,
				const std::string &firstLine, const std::string &filename) = 0;

		/**
		 * Decode a file, throws CorruptInputError on structural errors.
		 */
		virtual void decode(const std::string &content, const std::string &filename,
				IListener &listener) = 0;

		virtual std::string getName() = 0;
	};


	/**
	 * Picks the decoder for an uploaded file among the registered ones.
	 */
	class IDecoderManager
	{
	public:
		virtual ~IDecoderManager()
		{
		}

		virtual void registerDecoder(ICoverageDecoder &decoder) = 0;

		/**
		 * @return the best matching decoder, or NULL if none matches
		 */
		virtual ICoverageDecoder *matchDecoder(const std::string &content,
				const std::string &filename) = 0;

		static IDecoderManager &create();
	};
}
