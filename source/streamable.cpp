#include "pch.hpp"
#include "streamable.hpp"

namespace be = bincodec::big_endian;

bool bincodec::is_valid_utf8(const uint8_t *data, size_t len)
{
	size_t i = 0;
	while(i < len) {
		uint8_t lead = data[i];
		size_t extra;
		uint32_t cp;

		if(lead < 0x80) {
			i++;
			continue;
		} else if((lead & 0xE0) == 0xC0) {
			extra = 1; cp = lead & 0x1F;
		} else if((lead & 0xF0) == 0xE0) {
			extra = 2; cp = lead & 0x0F;
		} else if((lead & 0xF8) == 0xF0) {
			extra = 3; cp = lead & 0x07;
		} else {
			return false;
		}

		if(extra > len - i - 1) {
			return false;
		}
		for(size_t j = 1; j <= extra; j++) {
			uint8_t cont = data[i + j];
			if((cont & 0xC0) != 0x80) {
				return false;
			}
			cp = (cp << 6) | (cont & 0x3F);
		}

		// overlong forms, surrogates and values past U+10FFFF
		static constexpr uint32_t min_cp[] = { 0, 0x80, 0x800, 0x10000 };
		if(cp < min_cp[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
			return false;
		}
		i += extra + 1;
	}
	return true;
}


be::encoder &be::operator<<(be::encoder &e, const std::string &s)
{
	if(s.size() > UINT16_MAX) {
		throw bincodec::error(bincodec::error::kind::recoverable_known,
				      "String of " + std::to_string(s.size())
				      + " bytes does not fit a uint16_t length.");
	}
	e << uint16_t(s.size());
	e.append(reinterpret_cast<const uint8_t *>(s.data()), s.size());
	return e;
}


be::decoder &be::operator>>(be::decoder &d, std::string &s)
{
	uint16_t len;
	d >> len;
	d.require(len);

	const uint8_t *bytes = d.start() + d.tell();
	if(!bincodec::is_valid_utf8(bytes, len)) {
		throw bincodec::error(bincodec::error::kind::invalid_utf8,
				      "String at offset " + std::to_string(d.tell())
				      + " is not valid UTF-8.");
	}

	s.assign(reinterpret_cast<const char *>(bytes), len);
	d.seek(d.tell() + len);
	return d;
}


bincodec::socket_address::socket_address(const asio::ip::address &address, uint16_t port, uint32_t flow_info)
	: m_address(address),
	  m_port(port),
	  m_flow_info(flow_info)
{

}

bool bincodec::socket_address::operator==(const socket_address &o) const
{
	return m_address == o.m_address
		&& m_port == o.m_port
		&& m_flow_info == o.m_flow_info;
}

be::encoder &bincodec::operator<<(be::encoder &e, const bincodec::socket_address &addr)
{
	if(addr.m_address.is_v4()) {
		return e << socket_address::tag_v4
			 << addr.m_address.to_v4().to_bytes()
			 << addr.m_port;
	}

	asio::ip::address_v6 v6 = addr.m_address.to_v6();
	return e << socket_address::tag_v6
		 << uint16_t(0) // family, unused
		 << addr.m_port
		 << addr.m_flow_info
		 << v6.to_bytes()
		 << uint32_t(v6.scope_id());
}

be::decoder &bincodec::operator>>(be::decoder &d, bincodec::socket_address &addr)
{
	uint8_t tag;
	d >> tag;

	switch(tag) {
	case socket_address::tag_v4: {
		std::array<uint8_t, 4> ipv4;
		uint16_t port;
		d >> ipv4 >> port;
		addr = socket_address(asio::ip::make_address_v4(ipv4), port);
		break;
	}
	case socket_address::tag_v6: {
		uint16_t family;
		uint16_t port;
		uint32_t flow;
		std::array<uint8_t, 16> ipv6;
		uint32_t scope;
		d >> family
		  >> port
		  >> flow
		  >> ipv6
		  >> scope;
		addr = socket_address(asio::ip::make_address_v6(ipv6, scope), port, flow);
		break;
	}
	default:
		throw bincodec::error(bincodec::error::kind::unknown_tag,
				      "Unknown address type: " + std::to_string(tag));
	}

	return d;
}

std::ostream &bincodec::operator<<(std::ostream &os, const bincodec::socket_address &addr)
{
	if(addr.m_address.is_v6()) {
		os << '[' << addr.m_address << "]:" << addr.m_port;
		if(addr.m_flow_info != 0) {
			os << " flow " << addr.m_flow_info;
		}
		return os;
	}
	return os << addr.m_address << ':' << addr.m_port;
}


void bincodec::fatal(const bincodec::error &err)
{
	std::cerr << "bincodec: " << err.what() << std::endl;
	std::abort();
}
