#ifndef __CMUX_LINE_BUFFER__
#define __CMUX_LINE_BUFFER__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace cmux {
/**
 * @brief Reassembles newline-delimited protocol lines from arbitrarily
 * fragmented socket reads.
 *
 * Bytes are appended as they arrive; complete lines (without the trailing
 * `\n`, and without a trailing `\r` if present) are popped in order. A line
 * that grows beyond the limit without a newline is a framing error.
 */
class LineBuffer {
 public:
  explicit LineBuffer(size_t _maxLineLength = MAX_PROTOCOL_LINE_LENGTH)
      : maxLineLength(_maxLineLength), scanOffset(0) {}

  /**
   * @brief Appends raw bytes read from the socket.
   * @throws ProtocolError if the pending partial line exceeds the limit.
   */
  void append(const char *data, size_t count) {
    buffer.append(data, count);
    size_t newline = buffer.find('\n', scanOffset);
    if (newline == string::npos) {
      scanOffset = buffer.size();
      if (buffer.size() > maxLineLength) {
        throw ProtocolError("Protocol line exceeds " +
                            to_string(maxLineLength) + " bytes");
      }
    }
  }

  void append(const string &data) { append(data.data(), data.size()); }

  /**
   * @brief Pops the next complete line.
   * @return The line, or nullopt when no newline has been received yet.
   */
  optional<string> nextLine() {
    size_t newline = buffer.find('\n');
    if (newline == string::npos) {
      scanOffset = buffer.size();
      return nullopt;
    }
    if (newline > maxLineLength) {
      throw ProtocolError("Protocol line exceeds " + to_string(maxLineLength) +
                          " bytes");
    }
    string line = buffer.substr(0, newline);
    buffer.erase(0, newline + 1);
    scanOffset = 0;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

  /** @brief True when bytes of an incomplete line are buffered. */
  bool hasPartialLine() const { return !buffer.empty(); }

  size_t size() const { return buffer.size(); }

  void clear() {
    buffer.clear();
    scanOffset = 0;
  }

 private:
  size_t maxLineLength;
  // Bytes before this offset are known to contain no newline
  size_t scanOffset;
  string buffer;
};
}  // namespace cmux

#endif  // __CMUX_LINE_BUFFER__
