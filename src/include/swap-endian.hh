#pragma once

#include <stddef.h>
#include <stdint.h>

// Byte order helpers for the marshalled report format, which is big endian
template <typename T>
T swap_endian(T u)
{
	union
	{
		T value;
		uint8_t bytes[sizeof(T)];
	} in, out;

	in.value = u;
	for (size_t i = 0; i < sizeof(T); i++)
		out.bytes[i] = in.bytes[sizeof(T) - 1 - i];

	return out.value;
}

static inline bool host_is_big_endian()
{
	const uint32_t value = 0x01020304;

	return *(const uint8_t *)&value == 0x01;
}

template <typename T>
T to_be(T u)
{
	return host_is_big_endian() ? u : swap_endian<T>(u);
}

template <typename T>
T be_to_host(T u)
{
	return to_be<T>(u);
}
