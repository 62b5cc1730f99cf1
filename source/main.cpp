#include "pch.hpp"
#include "streamable.hpp"

static constexpr uint16_t default_port = 19132;

// One row per record field, prefixed with its offset into the encoding.
struct field_row {
	size_t offset;
	size_t length;
	const char *name;
};

static std::vector<field_row> layout_of(const bincodec::socket_address &addr)
{
	if(addr.address().is_v4()) {
		return { { 0, 1, "tag" }, { 1, 4, "address" }, { 5, 2, "port" } };
	}
	return {
		{ 0, 1, "tag" }, { 1, 2, "family" }, { 3, 2, "port" }, { 5, 4, "flow" },
		{ 9, 16, "address" }, { 25, 4, "scope" }
	};
}

static void dump(std::ostream &os, const std::vector<uint8_t> &wire, const std::vector<field_row> &rows)
{
	for(const field_row &row : rows) {
		os << std::hex << std::setfill('0') << std::setw(4) << row.offset << "  ";
		for(size_t i = row.offset; i < row.offset + row.length && i < wire.size(); i++) {
			os << std::setw(2) << unsigned(wire[i]);
		}
		os << std::setfill(' ') << std::setw(int(2 * (16 - row.length) + 2)) << ""
		   << std::dec << row.name << std::endl;
	}
}

int main(int argc, char **argv)
{
	if(argc != 2 && argc != 3) {
		std::cerr << "Usage: bindump HOST [PORT]" << std::endl;
		return EXIT_FAILURE;
	}

	asio::error_code ec;
	asio::ip::address address = asio::ip::make_address(argv[1], ec);
	if(ec) {
		std::cerr << "Bad IP address: " << ec.message() << std::endl;
		return EXIT_FAILURE;
	}

	uint16_t port = default_port;
	if(argc == 3) {
		try {
			unsigned long value = std::stoul(argv[2]);
			if(value > UINT16_MAX) {
				throw std::out_of_range("port");
			}
			port = uint16_t(value);
		} catch(const std::exception &) {
			std::cerr << "Bad port: " << argv[2] << std::endl;
			return EXIT_FAILURE;
		}
	} else {
		std::cout << "No port provided, defaulting to: " << default_port << '.' << std::endl;
	}

	bincodec::socket_address addr { asio::ip::udp::endpoint { address, port } };

	try {
		std::vector<uint8_t> wire = bincodec::parse(addr);
		std::cout << "Encoded " << addr << " in " << wire.size() << " bytes:" << std::endl;
		dump(std::cout, wire, layout_of(addr));

		size_t pos = 0;
		bincodec::socket_address decoded = bincodec::compose<bincodec::socket_address>(wire, pos);
		std::cout << "Decoded: " << decoded << std::endl;
		if(decoded != addr || pos != wire.size()) {
			std::cerr << "Round trip mismatch." << std::endl;
			return EXIT_FAILURE;
		}
	} catch(const bincodec::error &e) {
		std::cerr << "Codec error: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}

	return 0;
}
