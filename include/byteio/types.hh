/**
 * @file types.hh
 * @brief Fixed-width type aliases used across byteio
 * @ingroup byteio_types
 */

#ifndef BYTEIO_TYPES_HH
#define BYTEIO_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace byteio {

// Basic integer types
using int8 = int8_t;
using int16 = int16_t;
using int32 = int32_t;
using int64 = int64_t;
using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

// Size type
using size = std::size_t;

// Pointer difference type
using ptrdiff = std::ptrdiff_t;

} // namespace byteio

#endif // BYTEIO_TYPES_HH
