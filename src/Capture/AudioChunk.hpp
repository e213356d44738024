#pragma once

#include <cstddef>
#include <vector>

namespace voice_search {

// Raw LINEAR16 little-endian bytes, as captured or as coalesced for sending.
using AudioChunk = std::vector<std::byte>;
using AudioBlock = std::vector<std::byte>;

} // namespace voice_search
