#pragma once

namespace covmerge
{
	class IConfiguration;
	class IFlagConfiguration;
	class IDecoderManager;

	class MergeStatistics
	{
	public:
		MergeStatistics() :
			m_filesProcessed(0), m_filesFailed(0), m_filesExpired(0),
			m_pathsRejected(0), m_linesAppended(0), m_sessionsDeleted(0),
			m_sessionsPartiallyModified(0)
		{
		}

		unsigned int m_filesProcessed;
		unsigned int m_filesFailed;
		unsigned int m_filesExpired;
		unsigned int m_pathsRejected;
		unsigned int m_linesAppended;
		unsigned int m_sessionsDeleted;
		unsigned int m_sessionsPartiallyModified;
	};

	/**
	 * Everything a merge transaction needs from the process: settings,
	 * the decoders and the counters. Created once and passed along.
	 */
	class MergeContext
	{
	public:
		MergeContext(IConfiguration &conf, IFlagConfiguration &flags,
				IDecoderManager &decoders) :
			m_conf(conf), m_flags(flags), m_decoders(decoders)
		{
		}

		IConfiguration &getConfiguration()
		{
			return m_conf;
		}

		IFlagConfiguration &getFlagConfiguration()
		{
			return m_flags;
		}

		IDecoderManager &getDecoderManager()
		{
			return m_decoders;
		}

		MergeStatistics &getStatistics()
		{
			return m_statistics;
		}

	private:
		IConfiguration &m_conf;
		IFlagConfiguration &m_flags;
		IDecoderManager &m_decoders;
		MergeStatistics m_statistics;
	};
}
