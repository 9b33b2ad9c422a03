/*
 * Copyright 2025 Tether Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tether Wire Format - Header
// Binary frames multiplexing many responses onto one append-only log
//
// Layout (9 byte header, big-endian integers):
//   +------+----------------+----------------+-----------------+
//   | type | response_id:32 | payload_len:32 | payload ...     |
//   +------+----------------+----------------+-----------------+
//
//   'S' Start     {"status": int, "headers": {name: value}}
//   'D' Data      raw body bytes
//   'C' Complete  empty
//   'A' Abort     empty
//   'E' Error     {"message": str, "code": str} (raw text accepted on decode)

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "../http/http.hpp"

namespace tether::wire {

inline constexpr size_t kFrameHeaderSize = 9;

/// Default upper bound for a single frame payload
inline constexpr size_t kMaxFramePayload = 4 * 1024 * 1024;

enum class FrameType : uint8_t {
    Start = 'S',
    Data = 'D',
    Complete = 'C',
    Abort = 'A',
    Error = 'E',
};

/// Ordered header list carried in a Start frame
using HeaderList = http::HeaderList;

struct StartFrame {
    uint32_t response_id = 0;
    int status = 0;
    HeaderList headers;
};

struct DataFrame {
    uint32_t response_id = 0;
    std::string payload;
};

struct CompleteFrame {
    uint32_t response_id = 0;
};

struct AbortFrame {
    uint32_t response_id = 0;
};

struct ErrorFrame {
    uint32_t response_id = 0;
    std::string message;
    std::optional<std::string> code;
};

using Frame = std::variant<StartFrame, DataFrame, CompleteFrame, AbortFrame, ErrorFrame>;

[[nodiscard]] uint32_t response_id_of(const Frame& frame) noexcept;
[[nodiscard]] FrameType type_of(const Frame& frame) noexcept;
[[nodiscard]] bool is_terminal(const Frame& frame) noexcept;

// ============================================================================
// Encoding
// ============================================================================

[[nodiscard]] std::string encode_frame(const Frame& frame);

[[nodiscard]] std::string encode_start(uint32_t response_id, int status,
                                       const HeaderList& headers);
[[nodiscard]] std::string encode_data(uint32_t response_id, std::string_view payload);
[[nodiscard]] std::string encode_complete(uint32_t response_id);
[[nodiscard]] std::string encode_abort(uint32_t response_id);
[[nodiscard]] std::string encode_error(uint32_t response_id, std::string_view message,
                                       std::optional<std::string_view> code = std::nullopt);

// ============================================================================
// Decoding
// ============================================================================

enum class DecodeErrorKind : uint8_t {
    UnknownType,
    MalformedStart,
    PayloadTooLarge,
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::UnknownType;
    std::string message;
    size_t offset = 0;  // Absolute stream offset of the offending frame header
};

/// Outcome of FrameDecoder::next(): a frame, "need more bytes", or a fatal error
struct DecodeResult {
    std::optional<Frame> frame;
    std::optional<DecodeError> error;

    [[nodiscard]] static DecodeResult ok(Frame frame) { return {std::move(frame), std::nullopt}; }
    [[nodiscard]] static DecodeResult need_more() { return {}; }
    [[nodiscard]] static DecodeResult failure(DecodeError error) {
        return {std::nullopt, std::move(error)};
    }
};

/// Incremental decoder over an arbitrarily chunked byte stream.
/// Errors are sticky: once next() fails, every later call returns the same error.
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_payload = kMaxFramePayload);

    void feed(std::string_view bytes);

    [[nodiscard]] DecodeResult next();

    /// Bytes received but not yet consumed as frames
    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - read_pos_; }

    [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

private:
    void compact();

    std::string buffer_;
    size_t read_pos_ = 0;
    size_t consumed_total_ = 0;
    size_t max_payload_;
    std::optional<DecodeError> error_;
};

/// Decode every complete frame in a buffer
struct DecodeAllResult {
    std::vector<Frame> frames;
    size_t trailing_bytes = 0;
    std::optional<DecodeError> error;
};

[[nodiscard]] DecodeAllResult decode_frames(std::string_view bytes,
                                            size_t max_payload = kMaxFramePayload);

/// Parse a Start payload; nullopt when it is not {"status": int, "headers": {...}}
[[nodiscard]] std::optional<StartFrame> parse_start_payload(uint32_t response_id,
                                                            std::string_view payload);

/// Parse an Error payload, falling back to the raw text as the message
[[nodiscard]] ErrorFrame parse_error_payload(uint32_t response_id, std::string_view payload);

// ============================================================================
// Ordering
// ============================================================================

enum class ResponseState : uint8_t { Absent, Open, Completed, Aborted, Errored };

enum class SequenceViolation : uint8_t {
    None,
    DuplicateStart,
    FrameBeforeStart,
    FrameAfterTerminal,
};

[[nodiscard]] std::string_view to_string(SequenceViolation violation) noexcept;

/// Per-response lifecycle tracker: Start, Data*, exactly one terminal frame
class SequenceTracker {
public:
    /// Validate without recording
    [[nodiscard]] SequenceViolation check(const Frame& frame) const;

    /// Validate and, when valid, record the transition
    SequenceViolation apply(const Frame& frame);

    [[nodiscard]] ResponseState state(uint32_t response_id) const;

    /// Highest response id that has been started (0 if none)
    [[nodiscard]] uint32_t max_started() const noexcept { return max_started_; }

private:
    std::unordered_map<uint32_t, ResponseState> states_;
    uint32_t max_started_ = 0;
};

struct SequenceResult {
    bool valid = true;
    SequenceViolation violation = SequenceViolation::None;
    size_t frame_index = 0;
    uint32_t response_id = 0;

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Check a complete frame sequence against the ordering contract
[[nodiscard]] SequenceResult validate_sequence(std::span<const Frame> frames);

}  // namespace tether::wire
