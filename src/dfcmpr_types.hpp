#pragma once
#include <vector>

namespace dfcmpr {

using Buffer = std::vector<char>;

} // namespace dfcmpr
