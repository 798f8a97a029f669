#pragma once

#include <string>
#include <vector>

namespace covmerge
{
	/**
	 * Class that hold the merge configuration (path rules, carryforward
	 * settings and limits)
	 */
	class IConfiguration
	{
	public:
		typedef std::vector<std::string> StringList_t;

		virtual ~IConfiguration() {}


		/**
		 * Print the option usage.
		 */
		virtual void printUsage() = 0;


		/**
		 * Return a value as a string.
		 *
		 * Will panic if the key is not present.
		 *
		 * @param key the key to lookup
		 *
		 * @return the string value
		 */
		virtual const std::string &keyAsString(const std::string &key) = 0;

		/**
		 * Return a value as an integer.
		 *
		 * Will panic if the key is not present.
		 *
		 * @param key the key to lookup
		 *
		 * @return the integer value
		 */
		virtual int keyAsInt(const std::string &key) = 0;

		/**
		 * Return a value as a string list.
		 *
		 * Will panic if the key is not present.
		 *
		 * @param key the key to lookup
		 *
		 * @return the values as a list, potentially empty
		 */
		virtual const StringList_t &keyAsList(const std::string &key) = 0;

		virtual bool hasKey(const std::string &key) = 0;

		/**
		 * Set a key. Use these with caution.
		 */
		virtual void setKey(const std::string &key, const std::string &val) = 0;

		virtual void setKey(const std::string &key, int val) = 0;

		virtual void setKey(const std::string &key, const StringList_t &val) = 0;

		/**
		 * Set a known key from its string form. List keys take a comma
		 * separated value.
		 *
		 * @return false if the value has the wrong type for the key
		 */
		virtual bool configure(const std::string &key, const std::string &value) = 0;

		/**
		 * Parse argc, argv and setup the configuration
		 *
		 * @return true if the configuration is OK
		 */
		virtual bool parse(unsigned int argc, const char *argv[]) = 0;

		static IConfiguration &create();
	};
}
