#pragma once

#include <stdint.h>

#include <stdexcept>
#include <string>

namespace covmerge
{
	/**
	 * A decoder found a structural violation in an uploaded file. Only
	 * that file's contribution is dropped.
	 */
	class CorruptInputError : public std::runtime_error
	{
	public:
		CorruptInputError(const std::string &filename, const std::string &reason) :
			std::runtime_error(filename + ": " + reason),
			m_filename(filename)
		{
		}

		const std::string &getFilename() const
		{
			return m_filename;
		}

	private:
		std::string m_filename;
	};

	/**
	 * The uploaded report declares a timestamp older than the configured
	 * max-report-age.
	 */
	class ReportExpiredError : public std::runtime_error
	{
	public:
		ReportExpiredError(uint64_t timestamp, const std::string &filename) :
			std::runtime_error(filename + ": report expired"),
			m_timestamp(timestamp),
			m_filename(filename)
		{
		}

		uint64_t getTimestamp() const
		{
			return m_timestamp;
		}

		const std::string &getFilename() const
		{
			return m_filename;
		}

	private:
		uint64_t m_timestamp;
		std::string m_filename;
	};

	// Nothing survived path resolution and decoding in the whole upload
	class EmptyUploadError : public std::runtime_error
	{
	public:
		EmptyUploadError() :
			std::runtime_error("no coverage data in upload")
		{
		}
	};
}
