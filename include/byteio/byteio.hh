/**
 * @file byteio.hh
 * @brief Convenience header including the whole byteio API
 */

#pragma once

#include <byteio/types.hh>
#include <byteio/error.hh>
#include <byteio/io_stream.hh>
#include <byteio/buffer.hh>
#include <byteio/endian.hh>
#include <byteio/byte_io.hh>
#include <byteio/primitives.hh>
#include <byteio/text.hh>
#include <byteio/transfer.hh>
