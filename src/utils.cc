#include <sys/types.h>
#include <sys/time.h>
#include <string.h>
#include <stdio.h>
#include <stdint.h>
#include <stdarg.h>
#include <ctype.h>
#include <time.h>
#include <zlib.h>

#include <utils.hh>

#include <sstream>
#include <stdexcept>

int g_covmerge_debug_mask = STATUS_MSG;
static uint64_t (*mocked_get_timestamp_callback)(void);

std::string dir_concat(const std::string &dirIn, const std::string &filenameIn)
{
	if (dirIn == "")
		return filenameIn;

	std::string dir = dirIn;
	std::string filename = filenameIn;

	// Slash extra slashses
	while (dir.size() > 1 && dir[dir.size() - 1] == '/')
	{
		dir = dir.substr(0, dir.size() - 1);
	}

	while (filename.size() > 0 && filename[0] == '/')
	{
		filename = filename.substr(1);
	}

	if (dir == "/")
		return dir + filename;

	return dir + "/" + filename;
}

void mock_get_timestamp(uint64_t (*callback)(void))
{
	mocked_get_timestamp_callback = callback;
}

uint64_t get_timestamp(void)
{
	if (mocked_get_timestamp_callback)
		return mocked_get_timestamp_callback();

	struct timeval tv;

	gettimeofday(&tv, NULL);

	return tv.tv_sec;
}

std::string fmt(const char *fmt, ...)
{
	char buf[4096];
	va_list ap;
	int res;

	va_start(ap, fmt);
	res = vsnprintf(buf, sizeof(buf), fmt, ap);
	va_end(ap);

	if (res >= (int)sizeof(buf)) {
		std::string result;
		result.resize(res+1);

		va_start(ap, fmt);
		res = vsnprintf(&result[0], result.size(), fmt, ap);
		va_end(ap);

		panic_if(res >= (int)result.size(),
				"Buffer overflow");

		result.resize(res);
		return result;
	}

	return std::string(buf);
}

static std::vector<std::string> &split(const std::string &s, char delim,
		std::vector<std::string> &elems)
{
	std::stringstream ss(s);
	std::string item;

	while (std::getline(ss, item, delim)) {
		elems.push_back(item);
	}

	return elems;
}


std::vector<std::string> split_string(const std::string &s, const char *delims)
{
	std::vector<std::string> elems;
	split(s, *delims, elems);

	return elems;
}

std::string trim_string(const std::string &strIn, const std::string &trimEndChars)
{
	std::string str = strIn;
	size_t endpos = str.find_last_not_of(trimEndChars);

	if (std::string::npos != endpos)
		str = str.substr( 0, endpos+1 );

	// trim leading spaces
	size_t startpos = str.find_first_not_of(" \t");
	if (std::string::npos != startpos)
		str = str.substr( startpos );
	else
		str = "";

	return str;
}

std::string string_to_lower(const std::string &str)
{
	std::string out = str;

	for (std::string::iterator it = out.begin();
			it != out.end();
			++it)
		*it = tolower((unsigned char)*it);

	return out;
}

bool string_starts_with(const std::string &str, const std::string &prefix)
{
	if (prefix.size() > str.size())
		return false;

	return str.compare(0, prefix.size(), prefix) == 0;
}

bool string_ends_with(const std::string &str, const std::string &suffix)
{
	if (suffix.size() > str.size())
		return false;

	return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string string_replace_all(const std::string &str, const std::string &what, const std::string &with)
{
	if (what.empty())
		return str;

	std::string out;
	size_t last = 0;
	size_t pos;

	while ((pos = str.find(what, last)) != std::string::npos) {
		out += str.substr(last, pos - last);
		out += with;
		last = pos + what.size();
	}
	out += str.substr(last);

	return out;
}

bool string_is_integer(const std::string &str, unsigned base)
{
	size_t pos;

	try
	{
		stoull(str, &pos, base);
	}
	catch(std::invalid_argument &e)
	{
		return false;
	}
	catch(std::out_of_range &e)
	{
		return false;
	}

	return pos == str.size();
}

int64_t string_to_integer(const std::string &str, unsigned base)
{
	size_t pos;

	return (int64_t)stoull(str, &pos, base);
}

std::string escape_json(const std::string &str)
{
	std::string out;

	out.reserve(str.size());

	for (unsigned i = 0; i < str.size(); i++) {
		unsigned char c = (unsigned char)str[i];

		switch (c) {
		case '"':
			out += "\\\"";
			break;
		case '\\':
			out += "\\\\";
			break;
		case '\t':
			out += "\\t";
			break;
		case '\n':
			out += "\\n";
			break;
		case '\r':
			out += "\\r";
			break;
		case '\b':
			out += "\\b";
			break;
		case '\f':
			out += "\\f";
			break;
		default:
			// Other control characters
			if (c < 0x20)
				out += fmt("\\u%04x", (unsigned int)c);
			else
				out += str[i];
			break;
		}
	}

	return out;
}

uint32_t hash_block(const void *buf, size_t len)
{
	return crc32(0, (const Bytef *)buf, len);
}

std::pair<std::string, std::string> split_path(const std::string &pathStr)
{
	std::pair<std::string, std::string> out;
	std::string path(pathStr);

	size_t pos = path.rfind('/');

	out.first = "";
	out.second = path;
	if (pos != std::string::npos) {
		out.first= path.substr(0, pos + 1);
		out.second = path.substr(pos + 1, std::string::npos);
	}

	return out;
}
