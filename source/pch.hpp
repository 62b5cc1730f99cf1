#ifndef _BINCODEC_PCH_HPP
#define _BINCODEC_PCH_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>

#endif
