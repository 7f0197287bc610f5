#include "apirest/websocket-frame.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "apirest/websocket-constants.hpp"

namespace apirest::websocket {

namespace {

uint8_t ByteAt(std::string_view data, std::size_t pos) noexcept { return static_cast<uint8_t>(data[pos]); }

FrameParseResult Failure(FrameParseResult::Status status, std::string_view message) {
  FrameParseResult result;
  result.status = status;
  result.errorMessage = message;
  return result;
}

}  // namespace

FrameParseResult ParseFrame(std::string_view data, std::size_t maxPayloadSize, bool isServerSide) {
  FrameParseResult result;
  if (data.size() < kMinFrameHeaderSize) {
    return result;
  }

  const uint8_t byte0 = ByteAt(data, 0);
  if ((byte0 & kRsvBits) != 0) {
    return Failure(FrameParseResult::Status::ProtocolError, "Reserved bits must be 0");
  }
  const uint8_t rawOpcode = byte0 & kOpcodeMask;
  if (IsReservedOpcode(rawOpcode)) {
    return Failure(FrameParseResult::Status::ProtocolError, "Reserved opcode");
  }
  result.header.opcode = static_cast<Opcode>(rawOpcode);
  result.header.fin = (byte0 & kFinBit) != 0;
  if (IsControlFrame(result.header.opcode) && !result.header.fin) {
    return Failure(FrameParseResult::Status::ProtocolError, "Control frames must not be fragmented");
  }

  const uint8_t byte1 = ByteAt(data, 1);
  result.header.masked = (byte1 & kMaskBit) != 0;
  if (isServerSide && !result.header.masked) {
    return Failure(FrameParseResult::Status::ProtocolError, "Client frames must be masked");
  }
  if (!isServerSide && result.header.masked) {
    return Failure(FrameParseResult::Status::ProtocolError, "Server frames must not be masked");
  }

  std::size_t offset = kMinFrameHeaderSize;
  const uint8_t payloadLen7 = byte1 & kPayloadLenMask;
  if (payloadLen7 == kPayloadLen16) {
    if (data.size() < offset + 2) {
      return result;
    }
    result.header.payloadLength = (static_cast<uint64_t>(ByteAt(data, offset)) << 8) | ByteAt(data, offset + 1);
    offset += 2;
    if (result.header.payloadLength < kPayloadLen16) {
      return Failure(FrameParseResult::Status::ProtocolError, "Non-minimal extended length encoding");
    }
  } else if (payloadLen7 == kPayloadLen64) {
    if (data.size() < offset + 8) {
      return result;
    }
    for (std::size_t idx = 0; idx < 8; ++idx) {
      result.header.payloadLength = (result.header.payloadLength << 8) | ByteAt(data, offset + idx);
    }
    offset += 8;
    if ((result.header.payloadLength >> 63) != 0) {
      return Failure(FrameParseResult::Status::ProtocolError, "Invalid payload length (MSB set)");
    }
    if (result.header.payloadLength <= 0xFFFF) {
      return Failure(FrameParseResult::Status::ProtocolError, "Non-minimal extended length encoding");
    }
  } else {
    result.header.payloadLength = payloadLen7;
  }

  if (IsControlFrame(result.header.opcode) && result.header.payloadLength > kMaxControlFramePayload) {
    return Failure(FrameParseResult::Status::ProtocolError, "Control frame payload too large");
  }
  if (maxPayloadSize > 0 && result.header.payloadLength > maxPayloadSize) {
    return Failure(FrameParseResult::Status::PayloadTooLarge, "Payload exceeds maximum size");
  }

  if (result.header.masked) {
    if (data.size() < offset + kMaskingKeySize) {
      return result;
    }
    for (std::size_t idx = 0; idx < kMaskingKeySize; ++idx) {
      result.header.maskingKey[idx] = ByteAt(data, offset + idx);
    }
    offset += kMaskingKeySize;
  }

  if (data.size() - offset < result.header.payloadLength) {
    return result;
  }

  result.payload.assign(data.substr(offset, static_cast<std::size_t>(result.header.payloadLength)));
  if (result.header.masked) {
    ApplyMask(result.payload, result.header.maskingKey);
  }
  result.bytesConsumed = offset + static_cast<std::size_t>(result.header.payloadLength);
  result.status = FrameParseResult::Status::Complete;
  return result;
}

void ApplyMask(std::string& data, const MaskingKey& maskingKey) noexcept {
  for (std::size_t idx = 0; idx < data.size(); ++idx) {
    data[idx] = static_cast<char>(static_cast<uint8_t>(data[idx]) ^ maskingKey[idx % kMaskingKeySize]);
  }
}

void BuildFrame(std::string& output, Opcode opcode, std::string_view payload, bool mask, MaskingKey maskingKey) {
  const std::size_t payloadSize = payload.size();
  output.push_back(static_cast<char>(kFinBit | static_cast<uint8_t>(opcode)));

  const uint8_t maskBit = mask ? kMaskBit : 0;
  if (payloadSize < kPayloadLen16) {
    output.push_back(static_cast<char>(maskBit | static_cast<uint8_t>(payloadSize)));
  } else if (payloadSize <= 0xFFFF) {
    output.push_back(static_cast<char>(maskBit | kPayloadLen16));
    output.push_back(static_cast<char>((payloadSize >> 8) & 0xFF));
    output.push_back(static_cast<char>(payloadSize & 0xFF));
  } else {
    output.push_back(static_cast<char>(maskBit | kPayloadLen64));
    for (int shift = 56; shift >= 0; shift -= 8) {
      output.push_back(static_cast<char>((static_cast<uint64_t>(payloadSize) >> shift) & 0xFF));
    }
  }

  if (mask) {
    output.append(reinterpret_cast<const char*>(maskingKey.data()), maskingKey.size());
    std::string masked(payload);
    ApplyMask(masked, maskingKey);
    output.append(masked);
  } else {
    output.append(payload);
  }
}

void BuildCloseFrame(std::string& output, CloseCode code, std::string_view reason, bool mask,
                     MaskingKey maskingKey) {
  std::string payload;
  const auto codeValue = static_cast<uint16_t>(code);
  payload.push_back(static_cast<char>((codeValue >> 8) & 0xFF));
  payload.push_back(static_cast<char>(codeValue & 0xFF));
  payload.append(reason.substr(0, kMaxControlFramePayload - 2));
  BuildFrame(output, Opcode::Close, payload, mask, maskingKey);
}

ClosePayload ParseClosePayload(std::string_view payload) noexcept {
  ClosePayload ret;
  if (payload.size() >= 2) {
    ret.code = static_cast<CloseCode>((static_cast<uint16_t>(ByteAt(payload, 0)) << 8) | ByteAt(payload, 1));
    ret.reason = payload.substr(2);
  }
  return ret;
}

CloseCode CloseReplyCode(std::string_view closePayload) noexcept {
  if (closePayload.empty()) {
    return CloseCode::Normal;
  }
  const auto code = ParseClosePayload(closePayload).code;
  if (closePayload.size() < 2 || !IsValidWireCloseCode(static_cast<uint16_t>(code))) {
    return CloseCode::ProtocolError;
  }
  return code;
}

}  // namespace apirest::websocket
