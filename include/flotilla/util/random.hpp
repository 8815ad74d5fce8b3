#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace flot::util {
uint32_t
UniformUint32(uint32_t min, uint32_t max);

/** @brief Random lowercase hex string of the given length. */
std::string
RandomHex(std::size_t length);

/** @brief Identifier of the form prefix-xxxxxxxx. */
std::string
RandomId(const std::string& prefix, std::size_t length = 8);
}
