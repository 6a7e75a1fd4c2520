#pragma once

#include "core.hpp"

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

namespace state_sync {

// Boost.Iostreams sink appending to a byte buffer
class buffer_sink : public boost::iostreams::sink {
public:
  explicit buffer_sink(buffer_type& buffer)
    : buffer_(&buffer) {
  }

  std::streamsize write(char const* data, std::streamsize count) {
    buffer_->insert(buffer_->end(), data, data + count);
    return count;
  }

private:
  buffer_type* buffer_;
};

// std::ostream appending to a byte buffer, used as the sink of output
// archives. Bytes reach the buffer on flush or when the stream is destroyed.
class buffer_ostream : public boost::iostreams::stream<buffer_sink> {
public:
  explicit buffer_ostream(buffer_type& buffer)
    : boost::iostreams::stream<buffer_sink>(buffer_sink(buffer)) {
  }
};

// std::istream reading a byte buffer in place
class buffer_istream : public boost::iostreams::stream<boost::iostreams::array_source> {
public:
  explicit buffer_istream(buffer_type const& buffer)
    : boost::iostreams::stream<boost::iostreams::array_source>(reinterpret_cast<char const*>(buffer.data()), buffer.size()) {
  }
};

} // namespace state_sync
