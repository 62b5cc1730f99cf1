#ifndef _BINCODEC_BINARY_STREAM_HPP
#define _BINCODEC_BINARY_STREAM_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "streamable.hpp"
#include "var_int.hpp"

namespace bincodec {

/*
 * Owned byte buffer with a cursor and a (lower, upper) window.
 *
 *	bounds.first <= offset <= bounds.second <= buffer.size()
 *
 * Reads and writes happen at the offset and advance it. Nothing ever
 * touches bytes outside the window; attempts throw error::kind::out_of_bounds
 * and leave the stream as it was.
 */
struct binary_stream {
	binary_stream() = default;
	explicit binary_stream(std::vector<uint8_t> buffer);
private:
	std::vector<uint8_t> m_buffer;
	size_t m_offset = 0;
	std::pair<size_t, size_t> m_bounds { 0, 0 };

	void check_range(size_t start, size_t end) const;
	void check_writable(size_t len) const;
public:
	// Grows the buffer and the upper bound by `bytes` zero bytes.
	void allocate(size_t bytes);

	// Returns false, changing nothing, when offset is outside the bounds.
	bool set_offset(size_t offset);
	size_t increase_offset(size_t amount = 1);
	size_t get_offset() const { return m_offset; }
	std::pair<size_t, size_t> get_bounds() const { return m_bounds; }
	size_t size() const { return m_buffer.size(); }
	const std::vector<uint8_t> &data() const { return m_buffer; }

	// Copy of the whole buffer whose lower bound is `lower`. The copy is
	// independent; this stream keeps its own bounds.
	binary_stream clamp(size_t lower) const;
	bool is_within_bounds(size_t offset) const;

	uint8_t at(size_t index) const;
	uint8_t &at(size_t index);
	uint8_t operator[](size_t index) const { return at(index); }
	uint8_t &operator[](size_t index) { return at(index); }
	std::vector<uint8_t> slice(size_t start, size_t end) const;

	template<typename T>
	T read_value()
	{
		try {
			return compose<T>(m_buffer.data(), m_bounds.second, m_offset);
		} catch(const error &err) {
			if(err.code() != error::kind::truncated) {
				throw;
			}
			throw error(error::kind::out_of_bounds,
				    "Read at offset " + std::to_string(m_offset)
				    + " crosses the upper bound " + std::to_string(m_bounds.second)
				    + ": " + err.what());
		}
	}

	template<typename T>
	void write_value(const T &value)
	{
		write(parse(value));
	}

	uint8_t read_byte() { return read_value<uint8_t>(); }
	int8_t read_signed_byte() { return read_value<int8_t>(); }
	bool read_bool() { return read_value<bool>(); }
	std::string read_string() { return read_value<std::string>(); }

	uint16_t read_short() { return read_value<uint16_t>(); }
	uint16_t read_short_le() { return read_value<le<uint16_t>>().inner(); }
	int16_t read_signed_short() { return read_value<int16_t>(); }
	int16_t read_signed_short_le() { return read_value<le<int16_t>>().inner(); }

	uint32_t read_uint() { return read_value<uint32_t>(); }
	uint32_t read_uint_le() { return read_value<le<uint32_t>>().inner(); }
	int32_t read_int() { return read_value<int32_t>(); }
	int32_t read_int_le() { return read_value<le<int32_t>>().inner(); }

	int64_t read_long() { return read_value<int64_t>(); }
	int64_t read_long_le() { return read_value<le<int64_t>>().inner(); }

	float read_float() { return read_value<float>(); }
	float read_float_le() { return read_value<le<float>>().inner(); }
	double read_double() { return read_value<double>(); }
	double read_double_le() { return read_value<le<double>>().inner(); }

	uint32_t read_var_int() { return read_value<var_uint32>(); }
	int32_t read_signed_var_int() { return zigzag_decode(read_var_int()); }
	uint64_t read_var_long() { return read_value<var_uint64>(); }
	int64_t read_signed_var_long() { return zigzag_decode(read_var_long()); }

	void write(const std::vector<uint8_t> &bytes);

	void write_byte(uint8_t v) { write_value(v); }
	void write_signed_byte(int8_t v) { write_value(v); }
	void write_bool(bool v) { write_value(v); }
	void write_string(const std::string &v) { write_value(v); }

	void write_short(uint16_t v) { write_value(v); }
	void write_short_le(uint16_t v) { write_value(le<uint16_t>(v)); }
	void write_signed_short(int16_t v) { write_value(v); }
	void write_signed_short_le(int16_t v) { write_value(le<int16_t>(v)); }

	void write_uint(uint32_t v) { write_value(v); }
	void write_uint_le(uint32_t v) { write_value(le<uint32_t>(v)); }
	void write_int(int32_t v) { write_value(v); }
	void write_int_le(int32_t v) { write_value(le<int32_t>(v)); }

	void write_long(int64_t v) { write_value(v); }
	void write_long_le(int64_t v) { write_value(le<int64_t>(v)); }

	void write_float(float v) { write_value(v); }
	void write_float_le(float v) { write_value(le<float>(v)); }
	void write_double(double v) { write_value(v); }
	void write_double_le(double v) { write_value(le<double>(v)); }

	void write_var_int(uint32_t v) { write_value(var_uint32(v)); }
	void write_signed_var_int(int32_t v) { write_var_int(zigzag_encode(v)); }
	void write_var_long(uint64_t v) { write_value(var_uint64(v)); }
	void write_signed_var_long(int64_t v) { write_var_long(zigzag_encode(v)); }
};

}

#endif
