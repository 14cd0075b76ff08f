/**
 * @file frame_decoder.hpp
 * @brief Stateful reassembly of length-prefixed board frames from a raw byte stream.
 *
 * @details
 * The serial link delivers bytes at whatever granularity the driver and the
 * kernel feel like: one byte per read, half a header, three frames at once.
 * `FrameDecoder` turns that into whole `Frame`s.
 *
 * @par Algorithm
 * ```
 *   header phase:  collect exactly 3 bytes
 *                  id = h[0], len = (h[1] << 7) | h[2], payload = len - 3
 *                  len < 3  -> BadLength (caller disconnects)
 *   payload phase: collect exactly `payload` bytes
 *                  emit Frame{id, payload}, reset to header phase
 * ```
 * `wanted()` reports how many bytes the current phase still needs, so a driver
 * can read exactly that much and never pull the next frame's header into the
 * current payload. `feed()` also accepts larger chunks and splits them itself.
 *
 * Nothing is emitted before the payload is complete. A partial frame is simply
 * held until more bytes arrive; `reset()` drops it (used on disconnect so a
 * truncated frame never reaches the interpreter).
 */
#ifndef DGTLINK_FRAME_DECODER_HPP
#define DGTLINK_FRAME_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "dgtlink/protocol.hpp"

namespace dgtlink {

/// One complete message from the board.
struct Frame {
  uint8_t id{0};
  std::vector<uint8_t> payload;
};

class FrameDecoder {
public:
  enum class Result : uint8_t {
    Ok        = 0,  ///< All input consumed; zero or more frames emitted.
    BadLength = 1   ///< Header declared a total length below 3. Stream is unusable.
  };

  FrameDecoder() { reset(); }

  /**
   * @brief Consume @p n bytes, appending every completed frame to @p out.
   *
   * On BadLength the decoder resets itself; bytes after the bad header are
   * not consumed and @p out keeps the frames completed before it.
   */
  Result feed(const uint8_t* data, size_t n, std::vector<Frame>& out);

  /// Bytes still needed to finish the current header or payload (never 0).
  size_t wanted() const;

  /// True while a header or payload has been started but not finished.
  bool partial() const { return header_len_ > 0; }

  /// Drop any partial frame and wait for a fresh header.
  void reset();

  /// Total length value of the last bad header (diagnostics only).
  unsigned last_bad_length() const { return last_bad_length_; }

private:
  uint8_t header_[proto::HEADER_SIZE];
  size_t header_len_{0};             ///< bytes of header collected so far
  size_t payload_remaining_{0};      ///< bytes of payload still missing
  Frame current_;
  unsigned last_bad_length_{0};
};

} // namespace dgtlink

#endif // DGTLINK_FRAME_DECODER_HPP
