#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace apirest::websocket {

// The magic GUID used in the Sec-WebSocket-Accept calculation (RFC 6455 section 1.3)
inline constexpr std::string_view kGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline constexpr std::string_view kVersion = "13";

inline constexpr std::string_view SecWebSocketKey = "Sec-WebSocket-Key";
inline constexpr std::string_view SecWebSocketAccept = "Sec-WebSocket-Accept";
inline constexpr std::string_view SecWebSocketVersion = "Sec-WebSocket-Version";

inline constexpr std::string_view UpgradeValue = "websocket";

// WebSocket Frame Opcodes (RFC 6455 section 5.2)
enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

// Reserved non-control: 0x3-0x7, reserved control: 0xB-0xF
[[nodiscard]] constexpr bool IsReservedOpcode(uint8_t rawOpcode) noexcept {
  return (rawOpcode >= 0x3 && rawOpcode <= 0x7) || rawOpcode >= 0xB;
}

// WebSocket Close Status Codes (RFC 6455 section 7.4.1)
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  ProtocolError = 1002,
  UnsupportedData = 1003,
  NoStatusReceived = 1005,
  MessageTooBig = 1009,
  InternalError = 1011,
};

// Whether a close code may be sent in a Close frame (RFC 6455 section 7.4). 1004 is reserved, 1005, 1006 and 1015 are
// only used for local reporting, and 1016-2999 are left for future protocol extensions.
[[nodiscard]] constexpr bool IsValidWireCloseCode(uint16_t code) noexcept {
  if (code >= 3000) {
    return code < 5000;
  }
  return code >= 1000 && code <= 1014 && code != 1004 && code != 1005 && code != 1006;
}

inline constexpr uint8_t kFinBit = 0x80;
inline constexpr uint8_t kRsvBits = 0x70;
inline constexpr uint8_t kOpcodeMask = 0x0F;
inline constexpr uint8_t kMaskBit = 0x80;
inline constexpr uint8_t kPayloadLenMask = 0x7F;
inline constexpr uint8_t kPayloadLen16 = 126;
inline constexpr uint8_t kPayloadLen64 = 127;

inline constexpr std::size_t kMaxControlFramePayload = 125;
inline constexpr std::size_t kMaskingKeySize = 4;
inline constexpr std::size_t kMinFrameHeaderSize = 2;

}  // namespace apirest::websocket
