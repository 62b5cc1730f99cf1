#ifndef _BINCODEC_VAR_INT_HPP
#define _BINCODEC_VAR_INT_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "big_endian.hpp"
#include "error.hpp"

namespace bincodec {

// 7 bits per byte, least significant group first, 0x80 marks a following byte
template<typename T>
struct var_int {
	static_assert(std::is_same<T, uint32_t>::value || std::is_same<T, uint64_t>::value,
		      "var_int is defined for uint32_t and uint64_t");

	static constexpr size_t bits = sizeof(T) * 8;
	static constexpr size_t max_length = (bits + 6) / 7;

	var_int() = default;
	var_int(T value) : m_value(value) {}
private:
	T m_value = 0;
public:
	T value() const { return m_value; }
	operator T() const { return m_value; }

	size_t byte_length() const
	{
		size_t len = 1;
		for(T v = m_value >> 7; v != 0; v >>= 7) {
			len++;
		}
		return len;
	}

	std::vector<uint8_t> to_bytes() const
	{
		std::vector<uint8_t> out;
		T v = m_value;
		while(v >= 0x80) {
			out.push_back(uint8_t(v & 0x7F) | 0x80);
			v >>= 7;
		}
		out.push_back(uint8_t(v));
		return out;
	}

	static var_int from_bytes(big_endian::decoder &d)
	{
		T result = 0;
		for(size_t shift = 0; shift < max_length * 7; shift += 7) {
			uint8_t b = d.pop_front();
			if(shift + 7 > bits && (b & 0x7F) >> (bits - shift) != 0) {
				throw error(error::kind::recoverable_known,
					    "var_int overflows " + std::to_string(bits) + " bits.");
			}
			result |= T(b & 0x7F) << shift;
			if((b & 0x80) == 0) {
				return var_int(result);
			}
		}
		throw error(error::kind::recoverable_known,
			    "var_int is longer than " + std::to_string(max_length) + " bytes.");
	}

	static var_int from_bytes(const std::vector<uint8_t> &source, size_t pos = 0)
	{
		big_endian::decoder d { source, pos };
		return from_bytes(d);
	}
};

using var_uint32 = var_int<uint32_t>;
using var_uint64 = var_int<uint64_t>;

inline constexpr uint32_t zigzag_encode(int32_t v) { return (uint32_t(v) << 1) ^ uint32_t(v >> 31); }
inline constexpr uint64_t zigzag_encode(int64_t v) { return (uint64_t(v) << 1) ^ uint64_t(v >> 63); }
inline constexpr int32_t zigzag_decode(uint32_t v) { return int32_t(v >> 1) ^ -int32_t(v & 1); }
inline constexpr int64_t zigzag_decode(uint64_t v) { return int64_t(v >> 1) ^ -int64_t(v & 1); }

namespace big_endian {

template<typename T>
inline encoder &operator<<(encoder &e, const var_int<T> &v)
{
	for(uint8_t b : v.to_bytes()) {
		e << b;
	}
	return e;
}

template<typename T>
inline decoder &operator>>(decoder &d, var_int<T> &v)
{
	v = var_int<T>::from_bytes(d);
	return d;
}

}

}

#endif
