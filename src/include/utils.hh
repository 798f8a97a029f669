#pragma once

#include <stdlib.h>
#include <stdint.h>
#include <string.h>
#include <stdio.h>
#include <stdarg.h>
#include <sys/types.h>

#include <string>
#include <vector>
#include <utility>

#define error(x...) do \
{ \
	fprintf(stderr, "covmerge: error: "); \
	fprintf(stderr, x); \
	fprintf(stderr, "\n"); \
} while(0)

#define warning(x...) do \
{ \
	fprintf(stderr, "covmerge: warning: "); \
	fprintf(stderr, x); \
	fprintf(stderr, "\n"); \
} while(0)

#define panic(x...) do \
{ \
	error(x); \
	exit(1); \
} while(0)

enum debug_mask
{
	INFO_MSG   =   1,
	PATH_MSG   =   2,
	MERGE_MSG  =   4,
	LABEL_MSG  =   8,
	STATUS_MSG =  16,
};
extern int g_covmerge_debug_mask;

static inline void covmerge_debug(enum debug_mask dbg, const char *fmt, ...) __attribute__((format(printf,2,3)));

static inline void covmerge_debug(enum debug_mask dbg, const char *fmt, ...)
{
	va_list ap;

	if ((g_covmerge_debug_mask & dbg) == 0)
		return;

	va_start(ap, fmt);
	vfprintf(stdout, fmt, ap);
	va_end(ap);
}

#define panic_if(cond, x...) \
		do { if ((cond)) panic(x); } while(0)

static inline void *xrealloc(void *p, size_t sz)
{
  void *out = realloc(p, sz);

  panic_if(!out, "realloc failed");

  return out;
}

extern std::string dir_concat(const std::string &dir, const std::string &filename);

std::string fmt(const char *fmt, ...) __attribute__((format(printf,1,2)));

/**
 * Return the current wall-clock time in seconds since the epoch.
 */
uint64_t get_timestamp(void);

std::vector<std::string> split_string(const std::string &s, const char *delims);

std::string trim_string(const std::string &strIn, const std::string &trimEndChars = " \t\n\r");

std::string string_to_lower(const std::string &str);

bool string_starts_with(const std::string &str, const std::string &prefix);

bool string_ends_with(const std::string &str, const std::string &suffix);

// Replace all occurrences of @a what with @a with
std::string string_replace_all(const std::string &str, const std::string &what, const std::string &with);

// Split into path / filename
std::pair<std::string, std::string> split_path(const std::string &pathStr);

bool string_is_integer(const std::string &str, unsigned base = 0);

int64_t string_to_integer(const std::string &str, unsigned base = 0);

std::string escape_json(const std::string &str);

// Unit test stuff
void mock_get_timestamp(uint64_t (*callback)(void));

uint32_t hash_block(const void *buf, size_t len);
