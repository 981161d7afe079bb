#pragma once

#include <cstdint>
#include <vector>

namespace escpos::types {

    using Bytes = std::vector<uint8_t>;

}
