#ifndef _BINCODEC_BIG_ENDIAN_HPP
#define _BINCODEC_BIG_ENDIAN_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "error.hpp"

namespace bincodec {
namespace big_endian {

struct encoder {
	encoder(std::vector<uint8_t> &data)
		: m_data(data) {}
private:
	std::vector<uint8_t> &m_data;
public:
	void push_back(uint8_t a) { m_data.push_back(a); }
	void append(const uint8_t *bytes, size_t len) { m_data.insert(m_data.end(), bytes, bytes + len); }
};

// encoding primitives, designed to be overloaded further for custom types
inline encoder &operator<<(encoder &e, uint8_t u8)
{
	e.push_back(u8); return e;
}

inline encoder &operator<<(encoder &e, uint16_t u16)
{
	return e << uint8_t(u16 >> 8)
		 << uint8_t(u16 >> 0);
}

inline encoder &operator<<(encoder &e, uint32_t u32)
{
	return e << uint8_t(u32 >> 24)
		 << uint8_t(u32 >> 16)
		 << uint8_t(u32 >>  8)
		 << uint8_t(u32 >>  0);
}

inline encoder &operator<<(encoder &e, uint64_t u64)
{
	return e << uint32_t(u64 >> 32)
		 << uint32_t(u64 >>  0);
}

inline encoder &operator<<(encoder &e, int8_t i8)   { return e << uint8_t(i8); }
inline encoder &operator<<(encoder &e, int16_t i16) { return e << uint16_t(i16); }
inline encoder &operator<<(encoder &e, int32_t i32) { return e << uint32_t(i32); }
inline encoder &operator<<(encoder &e, int64_t i64) { return e << uint64_t(i64); }

inline encoder &operator<<(encoder &e, float f)
{
	uint32_t bits;
	std::memcpy(&bits, &f, sizeof(bits));
	return e << bits;
}

inline encoder &operator<<(encoder &e, double f)
{
	uint64_t bits;
	std::memcpy(&bits, &f, sizeof(bits));
	return e << bits;
}

template<size_t N>
inline encoder &operator<<(encoder &e, const std::array<uint8_t, N> &bytes)
{
	for(uint8_t b : bytes) {
		e << b;
	}
	return e;
}

// reads from [data, data + len), positions are absolute from data
struct decoder {
	decoder(const uint8_t *data, size_t len, size_t pos = 0)
		: m_start(data), m_data(data), m_end(data + len)
	{
		seek(pos);
	}

	decoder(const std::vector<uint8_t> &data, size_t pos = 0)
		: decoder(data.data(), data.size(), pos) {}
private:
	const uint8_t *m_start;
	const uint8_t *m_data;
	const uint8_t *m_end;
public:
	void seek(size_t i)
	{
		if(i > size_t(m_end - m_start)) {
			throw error(error::kind::truncated,
				    "Seek to " + std::to_string(i) + " is past the end of a "
				    + std::to_string(m_end - m_start) + " byte source.");
		}
		m_data = m_start + i;
	}
	size_t tell() const { return m_data - m_start; }
	size_t remaining() const { return m_end - m_data; }
	const uint8_t *start() const { return m_start; }

	void require(size_t n) const
	{
		if(n > remaining()) {
			throw error(error::kind::truncated,
				    "Needed " + std::to_string(n) + " bytes at offset "
				    + std::to_string(tell()) + ", only "
				    + std::to_string(remaining()) + " available.");
		}
	}

	uint8_t pop_front() { require(1); return *m_data++; }

	void read(uint8_t *out, size_t n)
	{
		require(n);
		std::memcpy(out, m_data, n);
		m_data += n;
	}
};


inline decoder &operator>>(decoder &d, uint8_t &u8)
{
	u8 = d.pop_front(); return d;
}

inline decoder &operator>>(decoder &d, uint16_t &u16)
{
	d.require(sizeof(u16));
	u16 = 0;
	u16 += d.pop_front() << 8;
	u16 += d.pop_front() << 0;
	return d;
}

inline decoder &operator>>(decoder &d, uint32_t &u32)
{
	d.require(sizeof(u32));
	u32 = 0;
	u32 += uint32_t(d.pop_front()) << 24;
	u32 += uint32_t(d.pop_front()) << 16;
	u32 += uint32_t(d.pop_front()) <<  8;
	u32 += uint32_t(d.pop_front()) <<  0;
	return d;
}

inline decoder &operator>>(decoder &d, uint64_t &u64)
{
	d.require(sizeof(u64));
	uint32_t hi, lo;
	d >> hi >> lo;
	u64 = (uint64_t(hi) << 32) | lo;
	return d;
}

template<typename S, typename U>
inline decoder &decode_signed(decoder &d, S &s)
{
	U u;
	d >> u;
	s = static_cast<S>(u);
	return d;
}

inline decoder &operator>>(decoder &d, int8_t &i8)   { return decode_signed<int8_t, uint8_t>(d, i8); }
inline decoder &operator>>(decoder &d, int16_t &i16) { return decode_signed<int16_t, uint16_t>(d, i16); }
inline decoder &operator>>(decoder &d, int32_t &i32) { return decode_signed<int32_t, uint32_t>(d, i32); }
inline decoder &operator>>(decoder &d, int64_t &i64) { return decode_signed<int64_t, uint64_t>(d, i64); }

inline decoder &operator>>(decoder &d, float &f)
{
	uint32_t bits;
	d >> bits;
	std::memcpy(&f, &bits, sizeof(f));
	return d;
}

inline decoder &operator>>(decoder &d, double &f)
{
	uint64_t bits;
	d >> bits;
	std::memcpy(&f, &bits, sizeof(f));
	return d;
}

template<size_t N>
inline decoder &operator>>(decoder &d, std::array<uint8_t, N> &bytes)
{
	d.read(bytes.data(), N);
	return d;
}

}
}

#endif
