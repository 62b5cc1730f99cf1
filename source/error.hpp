#ifndef _BINCODEC_ERROR_HPP
#define _BINCODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bincodec {

struct error : std::runtime_error {
	enum class kind {
		recoverable_known,
		truncated,
		out_of_bounds,
		unknown_tag,
		invalid_utf8
	};

	error(kind k, const std::string &message)
		: std::runtime_error(message), m_kind(k) {}
private:
	kind m_kind;
public:
	kind code() const noexcept { return m_kind; }
};

}

#endif
