#include <decoder.hh>
#include <utils.hh>

#include <vector>

using namespace covmerge;

class DecoderManager : public IDecoderManager
{
public:
	DecoderManager()
	{
	}

	void registerDecoder(ICoverageDecoder &decoder)
	{
		m_decoders.push_back(&decoder);
	}

	ICoverageDecoder *matchDecoder(const std::string &content, const std::string &filename)
	{
		ICoverageDecoder *best = NULL;
		unsigned int bestVal = match_none;
		std::string firstLine = getFirstLine(content);

		// First registered wins on equal scores
		for (DecoderList_t::const_iterator it = m_decoders.begin();
				it != m_decoders.end();
				++it) {
			unsigned int myVal = (*it)->matchDecoder(content, firstLine, filename);

			if (myVal == match_none)
				continue;

			if (!best || myVal > bestVal) {
				best = *it;
				bestVal = myVal;
			}
		}

		if (best)
			covmerge_debug(INFO_MSG, "%s: decoded by %s\n", filename.c_str(),
					best->getName().c_str());

		return best;
	}

private:
	typedef std::vector<ICoverageDecoder *> DecoderList_t;

	std::string getFirstLine(const std::string &content)
	{
		std::vector<std::string> lines = split_string(content, "\n");

		for (std::vector<std::string>::const_iterator it = lines.begin();
				it != lines.end();
				++it) {
			std::string cur = trim_string(*it);

			if (cur != "")
				return cur;
		}

		return "";
	}

	DecoderList_t m_decoders;
};


IDecoderManager &IDecoderManager::create()
{
	return *new DecoderManager();
}
