#include <configuration.hh>
#include <utils.hh>
#include <stdlib.h>
#include <getopt.h>
#include <string>
#include <unordered_map>

using namespace covmerge;

class Configuration : public IConfiguration
{
public:
	Configuration()
	{
		setupDefaults();
	}


	const std::string &keyAsString(const std::string &key)
	{
		panic_if(m_strings.find(key) == m_strings.end(),
				"key %s not found", key.c_str());

		return m_strings[key];
	}

	int keyAsInt(const std::string &key)
	{
		panic_if(m_ints.find(key) == m_ints.end(),
				"key %s not found", key.c_str());

		return m_ints[key];
	}

	const StringList_t &keyAsList(const std::string &key)
	{
		panic_if(m_stringVectors.find(key) == m_stringVectors.end(),
				"key %s not found", key.c_str());

		return m_stringVectors[key];
	}

	bool hasKey(const std::string &key)
	{
		return m_strings.find(key) != m_strings.end() ||
				m_ints.find(key) != m_ints.end() ||
				m_stringVectors.find(key) != m_stringVectors.end();
	}

	bool usage(void)
	{
		printf("Usage: covmerge [OPTIONS]\n"
				"\n"
				"Where [OPTIONS] are\n"
				" -h, --help                 this text\n"
				" --fix=pattern::repl[,...]  path fix rules, applied before and after\n"
				"                            resolution against the table of contents\n"
				" --path=pat[,...]           include patterns, prefix with ! to exclude\n"
				" --ignore=pat[,...]         patterns to exclude from the report\n"
				" --disable-default-path-fixes  don't resolve against the table of contents\n"
				"                            and don't strip well-known noise prefixes\n"
				" --max-report-age=secs      reject reports older than this (0 = no limit)\n"
				"\n"
				" --carryforward-flag=f[,...]        carry forward flags, replacing all\n"
				" --carryforward-labels-flag=f[,...] carry forward flags, replacing by label\n"
				" --flag-path=flag:pat[,...]         include patterns for one flag\n"
				" --flag-ignore=flag:pat[,...]       ignore patterns for one flag\n"
				"\n"
				" --debug=X                  set debugging level (max 31, default %d)\n"
				" --configure=key=value,...  Manually set configuration values. Possible values:\n"
				"%s",
				(int)STATUS_MSG,
				getConfigurableValues());

		return false;
	}

	void printUsage()
	{
		usage();
	}

	bool parse(unsigned int argc, const char *argv[])
	{
		static const struct option long_options[] = {
				{"help", no_argument, 0, 'h'},
				{"fix", required_argument, 0, 'f'},
				{"path", required_argument, 0, 'p'},
				{"ignore", required_argument, 0, 'i'},
				{"disable-default-path-fixes", no_argument, 0, 'N'},
				{"max-report-age", required_argument, 0, 'a'},
				{"carryforward-flag", required_argument, 0, 'c'},
				{"carryforward-labels-flag", required_argument, 0, 'l'},
				{"flag-path", required_argument, 0, 'P'},
				{"flag-ignore", required_argument, 0, 'I'},
				{"debug", required_argument, 0, 'D'},
				{"configure", required_argument, 0, 'M'},
				{0,0,0,0}
		};

		setupDefaults();

		/* Hooray for reentrancy... */
		optind = 0;
		optarg = 0;
		while (1) {
			int option_index = 0;
			int c;

			c = getopt_long (argc, (char **)argv,
					"h", long_options, &option_index);

			/* No more options */
			if (c == -1)
				break;

			switch (c) {
			case 0:
				break;
			case 'h':
				return usage();
			case 'f':
				appendList("fixes", std::string(optarg));
				break;
			case 'p':
				appendList("paths", std::string(optarg));
				break;
			case 'i':
				appendList("ignore", std::string(optarg));
				break;
			case 'N':
				setKey("disable-default-path-fixes", 1);
				break;
			case 'c':
				appendList("carryforward-flags", std::string(optarg));
				break;
			case 'l':
				appendList("carryforward-labels-flags", std::string(optarg));
				break;
			case 'P':
				appendList("flag-paths", std::string(optarg));
				break;
			case 'I':
				appendList("flag-ignore", std::string(optarg));
				break;
			case 'a':
				if (!configure("max-report-age", std::string(optarg)))
					return usage();
				break;
			case 'D':
				if (!configure("debug", std::string(optarg)))
					return usage();
				break;
			case 'M': {
				StringList_t vec = getCommaSeparatedList(std::string(optarg));

				for (StringList_t::const_iterator it = vec.begin();
						it != vec.end();
						++it) {
					size_t eq = it->find('=');

					if (eq == std::string::npos) {
						error("Malformed --configure value %s", it->c_str());
						return usage();
					}

					if (!configure(it->substr(0, eq), it->substr(eq + 1)))
						return usage();
				}
				break;
			}
			default:
				error("Unrecognized option: -%c", optopt);
				return usage();
			}
		}

		// Positional arguments are not used
		if ((unsigned int)optind != argc)
			return usage();

		return true;
	}

	// "private", but we ignore that in the unit test
	typedef std::unordered_map<std::string, std::string> StringKeyMap_t;
	typedef std::unordered_map<std::string, int> IntKeyMap_t;
	typedef std::unordered_map<std::string, StringList_t> StrVecKeyMap_t;


	// Setup the default key:value pairs
	void setupDefaults()
	{
		setKey("fixes", StringList_t());
		setKey("paths", StringList_t());
		setKey("ignore", StringList_t());
		setKey("disable-default-path-fixes", 0);
		setKey("max-report-age", 0);
		setKey("carryforward-flags", StringList_t());
		setKey("carryforward-labels-flags", StringList_t());
		setKey("default-carryforward", 0);
		setKey("default-carryforward-mode", "all");
		setKey("flag-paths", StringList_t());
		setKey("flag-ignore", StringList_t());
		setKey("debug", (int)STATUS_MSG);
	}


	void setKey(const std::string &key, const std::string &val)
	{
		m_strings[key] = val;
	}

	void setKey(const std::string &key, int val)
	{
		m_ints[key] = val;

		if (key == "debug")
			g_covmerge_debug_mask = val;
	}

	void setKey(const std::string &key, const StringList_t &val)
	{
		m_stringVectors[key] = val;
	}

	bool configure(const std::string &key, const std::string &value)
	{
		if (m_ints.find(key) != m_ints.end()) {
			if (!string_is_integer(value, 10)) {
				error("Value for %s must be integer", key.c_str());
				return false;
			}

			setKey(key, (int)string_to_integer(value, 10));
		} else if (m_stringVectors.find(key) != m_stringVectors.end()) {
			setKey(key, getCommaSeparatedList(value));
		} else if (key == "default-carryforward-mode") {
			if (value != "all" && value != "labels") {
				error("Value for %s must be all or labels", key.c_str());
				return false;
			}

			setKey(key, value);
		} else {
			panic("Unknown key %s\n", key.c_str());
		}

		return true;
	}

	const char *getConfigurableValues()
	{
		return
		"                            default-carryforward=0|1     Carry forward unlisted flags\n"
		"                            default-carryforward-mode=all|labels\n"
		"                                                         Mode for unlisted flags\n"
		"                            max-report-age=NUM           Max report age in seconds\n";
	}

	void appendList(const std::string &key, const std::string &value)
	{
		StringList_t cur = keyAsList(key);
		StringList_t vec = getCommaSeparatedList(value);

		cur.insert(cur.end(), vec.begin(), vec.end());
		setKey(key, cur);
	}

	StringList_t getCommaSeparatedList(std::string str)
	{
		StringList_t out;

		if (str == "")
			return out;

		if (str.find(',') == std::string::npos) {
			out.push_back(str);
			return out;
		}

		size_t pos, lastPos;

		lastPos = 0;
		for (pos = str.find_first_of(",");
				pos != std::string::npos;
				pos = str.find_first_of(",", pos + 1)) {
			std::string cur = str.substr(lastPos, pos - lastPos);

			out.push_back(cur);
			lastPos = pos + 1;
		}
		out.push_back(str.substr(lastPos, str.size() - lastPos));

		return out;
	}

	StringKeyMap_t m_strings;
	IntKeyMap_t m_ints;
	StrVecKeyMap_t m_stringVectors;
};


IConfiguration &IConfiguration::create()
{
	return *new Configuration();
}
