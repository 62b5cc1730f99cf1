#ifndef _BINCODEC_STREAMABLE_HPP
#define _BINCODEC_STREAMABLE_HPP

#include <cstdint>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "big_endian.hpp"
#include "error.hpp"
#include "var_int.hpp"

namespace bincodec {
namespace be = big_endian;

/*
 * A type is streamable when it has
 *
 *	be::encoder &operator<<(be::encoder &, const T &);
 *	be::decoder &operator>>(be::decoder &, T &);
 *
 * reachable by ADL. Decoders throw bincodec::error on malformed input and
 * leave the caller's cursor alone when they do.
 */

// Number of bytes T always occupies on the wire, empty when it depends on the value.
template<typename T, typename = void>
struct fixed_size {
	static constexpr std::optional<size_t> value {};
};

template<typename T>
struct fixed_size<T, std::enable_if_t<std::is_arithmetic<T>::value>> {
	static constexpr std::optional<size_t> value { sizeof(T) };
};

template<typename T>
struct le {
	le() = default;
	le(T v) : value(v) {}
	T value {};
	T inner() const { return value; }
	bool operator==(const le &o) const { return value == o.value; }
	bool operator!=(const le &o) const { return !(*this == o); }
};

template<typename T>
struct fixed_size<le<T>> : fixed_size<T> {};

// count is written as a big endian uint16_t instead of a var_int
template<typename T>
struct short_sequence {
	short_sequence() = default;
	short_sequence(std::vector<T> v) : items(std::move(v)) {}
	std::vector<T> items;
	bool operator==(const short_sequence &o) const { return items == o.items; }
};

bool is_valid_utf8(const uint8_t *data, size_t len);

namespace big_endian {

template<typename B, std::enable_if_t<std::is_same<B, bool>::value, int> = 0>
inline encoder &operator<<(encoder &e, B b)
{
	return e << uint8_t(b ? 1 : 0);
}

template<typename B, std::enable_if_t<std::is_same<B, bool>::value, int> = 0>
inline decoder &operator>>(decoder &d, B &b)
{
	d.require(1);
	uint8_t byte = d.start()[d.tell()];
	if(byte > 1) {
		throw error(error::kind::recoverable_known,
			    "Tried composing binary from non-binary byte: " + std::to_string(byte));
	}
	d.pop_front();
	b = byte == 1;
	return d;
}

encoder &operator<<(encoder &e, const std::string &s);
decoder &operator>>(decoder &d, std::string &s);

namespace detail {

template<typename T>
void decode_elements(decoder &d, std::vector<T> &v, size_t count)
{
	constexpr std::optional<size_t> width = fixed_size<T>::value;
	if(width && count * *width > d.remaining()) {
		throw error(error::kind::truncated,
			    "Sequence declares " + std::to_string(count) + " elements of "
			    + std::to_string(*width) + " bytes, only "
			    + std::to_string(d.remaining()) + " bytes available.");
	}

	std::vector<T> out;
	if(width) {
		out.reserve(count);
	}
	for(size_t i = 0; i < count; i++) {
		T item {};
		d >> item;
		out.push_back(std::move(item));
	}
	v = std::move(out);
}

}

template<typename T>
inline encoder &operator<<(encoder &e, const std::vector<T> &v)
{
	if(v.size() > UINT32_MAX) {
		throw error(error::kind::recoverable_known, "Sequence is too long to encode.");
	}
	e << var_uint32(uint32_t(v.size()));
	for(const T &item : v) {
		e << item;
	}
	return e;
}

template<typename T>
inline decoder &operator>>(decoder &d, std::vector<T> &v)
{
	var_uint32 count;
	d >> count;
	detail::decode_elements(d, v, count.value());
	return d;
}

}

template<typename T>
inline be::encoder &operator<<(be::encoder &e, const le<T> &v)
{
	std::vector<uint8_t> bytes;
	be::encoder inner { bytes };
	inner << v.value;
	for(auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
		e << *it;
	}
	return e;
}

// A fixed size T is decoded from its byte swapped span alone. Anything else is
// decoded from a copy of the source whose span at the cursor is byte swapped,
// so absolute offsets keep their meaning.
template<typename T>
inline be::decoder &operator>>(be::decoder &d, le<T> &v)
{
	size_t pos = d.tell();
	constexpr std::optional<size_t> width = fixed_size<T>::value;
	size_t span = width.value_or(d.remaining());
	d.require(span);

	std::reverse_iterator<const uint8_t *> first(d.start() + pos + span);
	std::reverse_iterator<const uint8_t *> last(d.start() + pos);

	if(width) {
		std::vector<uint8_t> swapped(first, last);
		be::decoder local { swapped };
		local >> v.value;
		d.seek(pos + local.tell());
		return d;
	}

	std::vector<uint8_t> swapped(d.start(), d.start() + pos);
	swapped.insert(swapped.end(), first, last);

	be::decoder local { swapped, pos };
	local >> v.value;
	d.seek(local.tell());
	return d;
}

template<typename T>
inline be::encoder &operator<<(be::encoder &e, const short_sequence<T> &s)
{
	if(s.items.size() > UINT16_MAX) {
		throw error(error::kind::recoverable_known,
			    "Sequence of " + std::to_string(s.items.size())
			    + " elements does not fit a uint16_t count.");
	}
	e << uint16_t(s.items.size());
	for(const T &item : s.items) {
		e << item;
	}
	return e;
}

template<typename T>
inline be::decoder &operator>>(be::decoder &d, short_sequence<T> &s)
{
	uint16_t count;
	d >> count;
	be::detail::decode_elements(d, s.items, count);
	return d;
}

struct socket_address {
	static constexpr uint8_t tag_v4 = 4;
	static constexpr uint8_t tag_v6 = 6;

	socket_address() = default;
	socket_address(const asio::ip::address &address, uint16_t port, uint32_t flow_info = 0);

	template<typename Protocol>
	socket_address(const asio::ip::basic_endpoint<Protocol> &endpoint)
		: socket_address(endpoint.address(), endpoint.port()) {}
private:
	asio::ip::address m_address;
	uint16_t m_port = 0;
	uint32_t m_flow_info = 0;
public:
	const asio::ip::address &address() const { return m_address; }
	uint16_t port() const { return m_port; }
	uint32_t flow_info() const { return m_flow_info; }

	template<typename Protocol>
	asio::ip::basic_endpoint<Protocol> to_endpoint() const
	{
		return asio::ip::basic_endpoint<Protocol>(m_address, m_port);
	}

	bool operator==(const socket_address &o) const;
	bool operator!=(const socket_address &o) const { return !(*this == o); }

	friend be::encoder &operator<<(be::encoder &e, const socket_address &addr);
	friend be::decoder &operator>>(be::decoder &d, socket_address &addr);
	friend std::ostream &operator<<(std::ostream &os, const socket_address &addr);
};

template<typename T>
std::vector<uint8_t> parse(const T &value)
{
	std::vector<uint8_t> out;
	be::encoder e { out };
	e << value;
	return out;
}

template<typename T>
T compose(const uint8_t *source, size_t len, size_t &position)
{
	be::decoder d { source, len, position };
	T value {};
	d >> value;
	position = d.tell();
	return value;
}

template<typename T>
T compose(const std::vector<uint8_t> &source, size_t &position)
{
	return compose<T>(source.data(), source.size(), position);
}

[[noreturn]] void fatal(const error &err);

template<typename T>
std::vector<uint8_t> fparse(const T &value)
{
	try {
		return parse(value);
	} catch(const error &err) {
		fatal(err);
	}
}

template<typename T>
T fcompose(const std::vector<uint8_t> &source, size_t &position)
{
	try {
		return compose<T>(source, position);
	} catch(const error &err) {
		fatal(err);
	}
}

}

#endif
