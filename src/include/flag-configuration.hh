#pragma once

#include <string>
#include <vector>

namespace covmerge
{
	class IConfiguration;

	enum CarryforwardMode
	{
		CARRYFORWARD_ALL    = 0,
		CARRYFORWARD_LABELS = 1,
	};

	/**
	 * Per-flag settings: carryforward policy and the path rules scoped
	 * to a flag.
	 */
	class IFlagConfiguration
	{
	public:
		virtual ~IFlagConfiguration()
		{
		}

		virtual bool hasCarryforward(const std::string &flag) = 0;

		virtual enum CarryforwardMode getCarryforwardMode(const std::string &flag) = 0;

		/**
		 * Return true if any flag (or the default rule) carries forward
		 * by label. Reports built under such a configuration keep
		 * per-label datapoints.
		 */
		virtual bool supportsLabels() = 0;

		/**
		 * Include patterns for a flag. Ignore entries are returned
		 * inverted, i.e., with a leading !
		 */
		virtual std::vector<std::string> getPathPatterns(const std::string &flag) = 0;


		static IFlagConfiguration &create(IConfiguration &conf);
	};
}
