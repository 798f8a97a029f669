#pragma once

namespace covmerge
{
	class Report;

	/**
	 * Class that writes a finished report (JSON summary, chunks, ...)
	 */
	class IWriter
	{
	public:
		virtual ~IWriter() {}

		/**
		 * Write the report.
		 *
		 * @return false if the output could not be written
		 */
		virtual bool write(const Report &report) = 0;
	};
}
