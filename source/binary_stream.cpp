#include "pch.hpp"
#include "binary_stream.hpp"

bincodec::binary_stream::binary_stream(std::vector<uint8_t> buffer)
	: m_buffer(std::move(buffer)),
	  m_offset(0),
	  m_bounds(0, m_buffer.size())
{

}

void bincodec::binary_stream::allocate(size_t bytes)
{
	m_bounds.second = m_buffer.size() + bytes;
	m_buffer.resize(m_bounds.second, 0);
}

bool bincodec::binary_stream::set_offset(size_t offset)
{
	if(offset < m_bounds.first || offset > m_bounds.second) {
		return false;
	}
	m_offset = offset;
	return true;
}

size_t bincodec::binary_stream::increase_offset(size_t amount)
{
	if(amount > m_bounds.second - m_offset) {
		throw error(error::kind::out_of_bounds,
			    "Offset " + std::to_string(m_offset) + " + " + std::to_string(amount)
			    + " is outside the buffer bounds.");
	}
	m_offset += amount;
	return m_offset;
}

bincodec::binary_stream bincodec::binary_stream::clamp(size_t lower) const
{
	if(lower < m_bounds.first || lower > m_bounds.second) {
		throw error(error::kind::out_of_bounds,
			    "Bounds not possible: cannot clamp to " + std::to_string(lower)
			    + " within [" + std::to_string(m_bounds.first) + ", "
			    + std::to_string(m_bounds.second) + "].");
	}

	binary_stream clamped = *this;
	clamped.m_bounds.first = lower;
	clamped.m_offset = std::max(m_offset, lower);
	return clamped;
}

bool bincodec::binary_stream::is_within_bounds(size_t offset) const
{
	return offset >= m_bounds.first
		&& offset <= m_bounds.second
		&& offset <= m_buffer.size();
}

void bincodec::binary_stream::check_range(size_t start, size_t end) const
{
	if(start <= end && start >= m_bounds.first && end <= m_bounds.second) {
		return;
	}

	std::string range = "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
	if(m_bounds.first == 0 && m_bounds.second == m_buffer.size()) {
		throw error(error::kind::out_of_bounds,
			    "Index " + range + " is out of bounds of a "
			    + std::to_string(m_buffer.size()) + " byte buffer.");
	}
	throw error(error::kind::out_of_bounds,
		    "Index " + range + " is out of bounds due to clamp ["
		    + std::to_string(m_bounds.first) + ", "
		    + std::to_string(m_bounds.second) + ").");
}

void bincodec::binary_stream::check_writable(size_t len) const
{
	if(len > m_bounds.second - m_offset) {
		throw error(error::kind::out_of_bounds,
			    "Writing " + std::to_string(len) + " bytes at offset "
			    + std::to_string(m_offset) + " crosses the upper bound "
			    + std::to_string(m_bounds.second) + ", allocate first.");
	}
}

uint8_t bincodec::binary_stream::at(size_t index) const
{
	check_range(index, index + 1);
	return m_buffer[index];
}

uint8_t &bincodec::binary_stream::at(size_t index)
{
	check_range(index, index + 1);
	return m_buffer[index];
}

std::vector<uint8_t> bincodec::binary_stream::slice(size_t start, size_t end) const
{
	check_range(start, end);
	return std::vector<uint8_t>(m_buffer.begin() + start, m_buffer.begin() + end);
}

void bincodec::binary_stream::write(const std::vector<uint8_t> &bytes)
{
	check_writable(bytes.size());
	std::copy(bytes.begin(), bytes.end(), m_buffer.begin() + m_offset);
	m_offset += bytes.size();
}
