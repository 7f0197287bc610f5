#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "apirest/websocket-constants.hpp"

namespace apirest::websocket {

using MaskingKey = std::array<uint8_t, kMaskingKeySize>;

struct FrameHeader {
  Opcode opcode{Opcode::Text};
  bool fin{true};
  bool masked{false};
  uint64_t payloadLength{0};
  MaskingKey maskingKey{};
};

struct FrameParseResult {
  enum class Status : uint8_t {
    Complete,        // Frame fully parsed, payload is unmasked
    Incomplete,      // Need more data to parse the frame
    ProtocolError,   // Invalid frame format (close with 1002)
    PayloadTooLarge  // Payload exceeds configured maximum (close with 1009)
  };

  Status status{Status::Incomplete};
  FrameHeader header;
  std::string payload;
  std::size_t bytesConsumed{0};
  std::string_view errorMessage;
};

/// Parse a WebSocket frame from raw bytes.
///
/// @param data           Input buffer containing raw WebSocket data
/// @param maxPayloadSize Maximum allowed payload size (0 = unlimited)
/// @param isServerSide   True if we're the server (clients MUST mask, servers MUST NOT)
[[nodiscard]] FrameParseResult ParseFrame(std::string_view data, std::size_t maxPayloadSize = 0,
                                          bool isServerSide = true);

/// XOR masking, symmetric (same function masks and unmasks).
void ApplyMask(std::string& data, const MaskingKey& maskingKey) noexcept;

/// Build a single (FIN) frame and append it to output. Servers do not mask, clients must.
void BuildFrame(std::string& output, Opcode opcode, std::string_view payload, bool mask = false,
                MaskingKey maskingKey = {});

/// Build a Close frame with a status code and an optional reason.
void BuildCloseFrame(std::string& output, CloseCode code = CloseCode::Normal, std::string_view reason = {},
                     bool mask = false, MaskingKey maskingKey = {});

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;
};

[[nodiscard]] ClosePayload ParseClosePayload(std::string_view payload) noexcept;

/// Status code to answer to a received Close frame payload: the peer's code when it is valid on the wire, Normal when
/// the peer sent none, ProtocolError otherwise.
[[nodiscard]] CloseCode CloseReplyCode(std::string_view closePayload) noexcept;

}  // namespace apirest::websocket
