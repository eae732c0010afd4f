#pragma once

#include <cstdint>
#include <boost/endian/buffers.hpp>

namespace roxfs { namespace format
{

using boost::endian::big_uint16_buf_t;
using boost::endian::big_uint32_buf_t;
using boost::endian::big_uint64_buf_t;
using boost::endian::big_int32_buf_t;
using boost::endian::little_uint32_buf_t;

static const unsigned UuidSize = 16;

}}
