// ============================================================================
// frame_decoder.cpp: implementation for frame_decoder.hpp
// ============================================================================
#include "dgtlink/frame_decoder.hpp"

#include <algorithm>

namespace dgtlink {

void FrameDecoder::reset() {
  header_len_ = 0;
  payload_remaining_ = 0;
  current_.id = 0;
  current_.payload.clear();
}

size_t FrameDecoder::wanted() const {
  if (header_len_ < proto::HEADER_SIZE) return proto::HEADER_SIZE - header_len_;
  return payload_remaining_;          // > 0 whenever the header is complete
}

FrameDecoder::Result FrameDecoder::feed(const uint8_t* data, size_t n, std::vector<Frame>& out) {
  size_t pos = 0;

  while (pos < n) {
    // Header phase: take only what the header still needs.
    if (header_len_ < proto::HEADER_SIZE) {
      const size_t take = std::min(proto::HEADER_SIZE - header_len_, n - pos);
      std::copy(data + pos, data + pos + take, header_ + header_len_);
      header_len_ += take;
      pos += take;

      if (header_len_ < proto::HEADER_SIZE) break;      // still partial

      const unsigned declared = (static_cast<unsigned>(header_[1]) << 7) | header_[2];
      if (declared < proto::HEADER_SIZE) {
        last_bad_length_ = declared;
        reset();
        return Result::BadLength;
      }

      current_.id = header_[0];
      current_.payload.clear();
      payload_remaining_ = declared - proto::HEADER_SIZE;
      current_.payload.reserve(payload_remaining_);
    }

    // Payload phase.
    if (payload_remaining_ > 0) {
      const size_t take = std::min(payload_remaining_, n - pos);
      current_.payload.insert(current_.payload.end(), data + pos, data + pos + take);
      payload_remaining_ -= take;
      pos += take;
    }

    // Complete: emit and start over with a fresh header.
    if (payload_remaining_ == 0) {
      out.push_back(std::move(current_));
      reset();
    }
  }
  return Result::Ok;
}

} // namespace dgtlink
