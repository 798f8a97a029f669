#include <flag-configuration.hh>
#include <configuration.hh>
#include <utils.hh>

#include <algorithm>

using namespace covmerge;

class FlagConfiguration : public IFlagConfiguration
{
public:
	FlagConfiguration(IConfiguration &conf) :
		m_conf(conf)
	{
	}

	bool hasCarryforward(const std::string &flag)
	{
		if (listContains("carryforward-flags", flag) ||
				listContains("carryforward-labels-flags", flag))
			return true;

		return m_conf.keyAsInt("default-carryforward") != 0;
	}

	enum CarryforwardMode getCarryforwardMode(const std::string &flag)
	{
		if (listContains("carryforward-labels-flags", flag))
			return CARRYFORWARD_LABELS;
		if (listContains("carryforward-flags", flag))
			return CARRYFORWARD_ALL;

		return defaultMode();
	}

	bool supportsLabels()
	{
		if (!m_conf.keyAsList("carryforward-labels-flags").empty())
			return true;

		return m_conf.keyAsInt("default-carryforward") != 0 &&
				defaultMode() == CARRYFORWARD_LABELS;
	}

	std::vector<std::string> getPathPatterns(const std::string &flag)
	{
		std::vector<std::string> out;

		addScoped(out, "flag-ignore", flag, "!");
		addScoped(out, "flag-paths", flag, "");

		return out;
	}

private:
	enum CarryforwardMode defaultMode()
	{
		if (m_conf.keyAsString("default-carryforward-mode") == "labels")
			return CARRYFORWARD_LABELS;

		return CARRYFORWARD_ALL;
	}

	bool listContains(const std::string &key, const std::string &flag)
	{
		const std::vector<std::string> &list = m_conf.keyAsList(key);

		return std::find(list.begin(), list.end(), flag) != list.end();
	}

	// Entries look like flag:pattern
	void addScoped(std::vector<std::string> &out, const std::string &key,
			const std::string &flag, const std::string &prefix)
	{
		const std::vector<std::string> &list = m_conf.keyAsList(key);

		for (std::vector<std::string>::const_iterator it = list.begin();
				it != list.end();
				++it) {
			size_t colon = it->find(':');

			if (colon == std::string::npos) {
				warning("Ignoring malformed %s entry %s", key.c_str(), it->c_str());
				continue;
			}

			if (it->substr(0, colon) != flag)
				continue;

			out.push_back(prefix + it->substr(colon + 1));
		}
	}

	IConfiguration &m_conf;
};

IFlagConfiguration &IFlagConfiguration::create(IConfiguration &conf)
{
	return *new FlagConfiguration(conf);
}
