#pragma once

#include "transport.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge {

constexpr std::string_view kWebSocketGUID =
    "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

constexpr uint16_t kCloseNormal = 1000;
constexpr uint16_t kCloseGoingAway = 1001;
constexpr uint16_t kCloseProtocolError = 1002;
constexpr uint16_t kCloseNoStatus = 1005;
constexpr uint16_t kCloseTooBig = 1009;
constexpr uint16_t kCloseInternalError = 1011;

/// Largest reassembled message accepted from a peer.
constexpr uint64_t kMaxMessageSize = 16 * 1024 * 1024;

/// Control frame payloads are limited to 125 bytes; 2 go to the code.
constexpr size_t kMaxCloseReason = 123;

/// Sec-WebSocket-Accept for a client's Sec-WebSocket-Key (RFC 6455 4.2.2).
inline std::string websocket_accept_key(std::string_view client_key) {
  std::string material(client_key);
  material.append(kWebSocketGUID);

  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char *>(material.data()),
       material.size(), digest);

  // 20 bytes -> 28 base64 characters plus NUL.
  unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
  int n = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
  return std::string(reinterpret_cast<const char *>(encoded),
                     static_cast<size_t>(n));
}

/// Serialize one unfragmented frame. Clients must mask, servers must not.
inline std::string encode_frame(uint8_t opcode, std::string_view payload,
                                bool mask) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | (opcode & 0x0F)));

  uint8_t mask_bit = mask ? 0x80 : 0x00;
  uint64_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      frame.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
  }

  if (!mask) {
    frame.append(payload.data(), payload.size());
    return frame;
  }

  static thread_local std::mt19937 rng{std::random_device{}()};
  std::array<uint8_t, 4> key{};
  for (auto &b : key) {
    b = static_cast<uint8_t>(rng());
    frame.push_back(static_cast<char>(b));
  }
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^
                                      key[i % 4]));
  }
  return frame;
}

/// Close frame body: big-endian status code followed by a UTF-8 reason.
inline std::string close_payload(uint16_t code, std::string_view reason) {
  if (reason.size() > kMaxCloseReason)
    reason = reason.substr(0, kMaxCloseReason);
  std::string body;
  body.push_back(static_cast<char>((code >> 8) & 0xFF));
  body.push_back(static_cast<char>(code & 0xFF));
  body.append(reason.data(), reason.size());
  return body;
}

struct ws_message {
  uint8_t opcode = kOpText;
  std::string payload;
  uint16_t close_code = 0;
};

enum class read_status { message, closed, error };

/// WebSocket framing over an already-upgraded socket.
///
/// One thread reads; any thread may send. The stream does not own the fd.
class websocket_stream {
public:
  enum class role { server, client };

  websocket_stream(int fd, role r) : fd_(fd), role_(r) {}

  websocket_stream(const websocket_stream &) = delete;
  websocket_stream &operator=(const websocket_stream &) = delete;

  /// False once a close frame was sent or the socket failed.
  bool is_open() const { return open_.load(); }

  /// Send a text message. A no-op returning false after closure.
  bool send_text(std::string_view payload) {
    return send_frame(kOpText, payload);
  }

  /// Send a close frame; further sends become no-ops. Returns false if the
  /// stream was already closed.
  bool send_close(uint16_t code, std::string_view reason) {
    std::lock_guard<std::mutex> lock(send_mu_);
    if (!open_.exchange(false))
      return false;
    auto frame = encode_frame(kOpClose, close_payload(code, reason),
                              role_ == role::client);
    return send_all(fd_, frame.data(), frame.size());
  }

  /// Mark the stream closed without sending anything.
  void abandon() { open_.store(false); }

  /// Read the next data message. Pings are answered and pongs skipped.
  /// A close frame is echoed (if still open) and reported as
  /// read_status::closed with the peer's code and reason.
  read_status read(ws_message &msg) {
    msg = ws_message{};
    std::string assembled;
    uint8_t message_opcode = 0;
    bool reading_fragment = false;

    for (;;) {
      uint8_t header[2];
      if (!read_exact(fd_, header, 2))
        return fail();

      bool fin = (header[0] & 0x80) != 0;
      uint8_t opcode = static_cast<uint8_t>(header[0] & 0x0F);
      bool masked = (header[1] & 0x80) != 0;
      uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

      if (role_ == role::server && !masked)
        return protocol_error("client frames must be masked");

      if (len == 126) {
        uint8_t ext[2];
        if (!read_exact(fd_, ext, 2))
          return fail();
        len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
      } else if (len == 127) {
        uint8_t ext[8];
        if (!read_exact(fd_, ext, 8))
          return fail();
        if ((ext[0] & 0x80) != 0)
          return protocol_error("invalid frame length");
        len = 0;
        for (int i = 0; i < 8; ++i) {
          len = (len << 8) | ext[i];
        }
      }

      // assembled.size() never exceeds the cap, so this cannot wrap.
      if (len > kMaxMessageSize - assembled.size()) {
        send_close(kCloseTooBig, "message too big");
        return read_status::error;
      }

      std::array<uint8_t, 4> mask{};
      if (masked && !read_exact(fd_, mask.data(), mask.size()))
        return fail();

      std::string payload(static_cast<size_t>(len), '\0');
      if (len > 0 && !read_exact(fd_, payload.data(), payload.size()))
        return fail();
      if (masked) {
        for (size_t i = 0; i < payload.size(); ++i) {
          payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }
      }

      if (opcode == kOpClose) {
        msg.opcode = kOpClose;
        msg.close_code = kCloseNoStatus;
        if (payload.size() >= 2) {
          msg.close_code = static_cast<uint16_t>(
              (static_cast<uint8_t>(payload[0]) << 8) |
              static_cast<uint8_t>(payload[1]));
          msg.payload = payload.substr(2);
        }
        send_close(msg.close_code == kCloseNoStatus ? kCloseNormal
                                                    : msg.close_code,
                   "");
        return read_status::closed;
      }
      if (opcode == kOpPing) {
        if (!send_frame(kOpPong, payload))
          return fail();
        continue;
      }
      if (opcode == kOpPong) {
        continue;
      }

      if (opcode == kOpText || opcode == kOpBinary) {
        if (reading_fragment)
          return protocol_error("expected continuation frame");
        message_opcode = opcode;
        assembled = std::move(payload);
      } else if (opcode == kOpContinuation) {
        if (!reading_fragment)
          return protocol_error("unexpected continuation frame");
        assembled.append(payload);
      } else {
        return protocol_error("unknown opcode");
      }

      reading_fragment = !fin;
      if (fin) {
        msg.opcode = message_opcode;
        msg.payload = std::move(assembled);
        return read_status::message;
      }
    }
  }

private:
  bool send_frame(uint8_t opcode, std::string_view payload) {
    std::lock_guard<std::mutex> lock(send_mu_);
    if (!open_.load())
      return false;
    auto frame = encode_frame(opcode, payload, role_ == role::client);
    if (!send_all(fd_, frame.data(), frame.size())) {
      open_.store(false);
      return false;
    }
    return true;
  }

  read_status fail() {
    open_.store(false);
    return read_status::error;
  }

  read_status protocol_error(std::string_view reason) {
    send_close(kCloseProtocolError, reason);
    return read_status::error;
  }

  int fd_;
  role role_;
  std::atomic<bool> open_{true};
  std::mutex send_mu_;
};

} // namespace mcpbridge
