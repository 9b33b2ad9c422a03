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

// Tether Wire Format - Implementation

#include "frame.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

namespace tether::wire {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

void put_u32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

uint32_t get_u32(const char* p) {
    auto b = reinterpret_cast<const unsigned char*>(p);
    return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

std::string make_frame(FrameType type, uint32_t response_id, std::string_view payload) {
    std::string out;
    out.reserve(kFrameHeaderSize + payload.size());
    out.push_back(static_cast<char>(type));
    put_u32(out, response_id);
    put_u32(out, static_cast<uint32_t>(payload.size()));
    out.append(payload);
    return out;
}

// Upstream header values are not guaranteed to be valid UTF-8
std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool is_known_type(unsigned char c) {
    switch (static_cast<FrameType>(c)) {
        case FrameType::Start:
        case FrameType::Data:
        case FrameType::Complete:
        case FrameType::Abort:
        case FrameType::Error:
            return true;
    }
    return false;
}

}  // namespace

uint32_t response_id_of(const Frame& frame) noexcept {
    return std::visit([](const auto& f) { return f.response_id; }, frame);
}

FrameType type_of(const Frame& frame) noexcept {
    return std::visit(overloaded{
                          [](const StartFrame&) { return FrameType::Start; },
                          [](const DataFrame&) { return FrameType::Data; },
                          [](const CompleteFrame&) { return FrameType::Complete; },
                          [](const AbortFrame&) { return FrameType::Abort; },
                          [](const ErrorFrame&) { return FrameType::Error; },
                      },
                      frame);
}

bool is_terminal(const Frame& frame) noexcept {
    auto type = type_of(frame);
    return type == FrameType::Complete || type == FrameType::Abort || type == FrameType::Error;
}

// ============================================================================
// Encoding
// ============================================================================

std::string encode_start(uint32_t response_id, int status, const HeaderList& headers) {
    // Repeated names are folded into one entry: Set-Cookie values as an array
    // (they cannot be comma-joined), everything else joined with ", "
    nlohmann::json header_obj = nlohmann::json::object();
    for (const auto& [name, value] : headers) {
        auto existing = header_obj.end();
        for (auto it = header_obj.begin(); it != header_obj.end(); ++it) {
            if (http::header_name_equals(it.key(), name)) {
                existing = it;
                break;
            }
        }
        if (existing == header_obj.end()) {
            header_obj[name] = value;
        } else if (http::header_name_equals(name, http::header::kSetCookie)) {
            if (!existing->is_array()) {
                *existing = nlohmann::json::array({existing->get<std::string>()});
            }
            existing->push_back(value);
        } else {
            *existing = existing->get<std::string>() + ", " + value;
        }
    }
    nlohmann::json payload = {{"status", status}, {"headers", std::move(header_obj)}};
    return make_frame(FrameType::Start, response_id, dump_json(payload));
}

std::string encode_data(uint32_t response_id, std::string_view payload) {
    return make_frame(FrameType::Data, response_id, payload);
}

std::string encode_complete(uint32_t response_id) {
    return make_frame(FrameType::Complete, response_id, {});
}

std::string encode_abort(uint32_t response_id) {
    return make_frame(FrameType::Abort, response_id, {});
}

std::string encode_error(uint32_t response_id, std::string_view message,
                         std::optional<std::string_view> code) {
    nlohmann::json payload = {{"message", std::string(message)}};
    if (code) {
        payload["code"] = std::string(*code);
    }
    return make_frame(FrameType::Error, response_id, dump_json(payload));
}

std::string encode_frame(const Frame& frame) {
    return std::visit(
        overloaded{
            [](const StartFrame& f) { return encode_start(f.response_id, f.status, f.headers); },
            [](const DataFrame& f) { return encode_data(f.response_id, f.payload); },
            [](const CompleteFrame& f) { return encode_complete(f.response_id); },
            [](const AbortFrame& f) { return encode_abort(f.response_id); },
            [](const ErrorFrame& f) {
                return f.code ? encode_error(f.response_id, f.message, *f.code)
                              : encode_error(f.response_id, f.message);
            },
        },
        frame);
}

// ============================================================================
// Payload parsing
// ============================================================================

std::optional<StartFrame> parse_start_payload(uint32_t response_id, std::string_view payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto status = j.find("status");
    if (status == j.end() || !status->is_number_unsigned()) {
        return std::nullopt;
    }
    auto code = status->get<uint64_t>();
    if (code < 100 || code > 599) {
        return std::nullopt;
    }

    StartFrame start;
    start.response_id = response_id;
    start.status = static_cast<int>(code);

    auto headers = j.find("headers");
    if (headers != j.end() && !headers->is_null()) {
        if (!headers->is_object()) {
            return std::nullopt;
        }
        for (const auto& [name, value] : headers->items()) {
            if (value.is_array()) {
                for (const auto& item : value) {
                    start.headers.emplace_back(
                        name, item.is_string() ? item.get<std::string>() : item.dump());
                }
                continue;
            }
            start.headers.emplace_back(name,
                                       value.is_string() ? value.get<std::string>() : value.dump());
        }
    }

    return start;
}

ErrorFrame parse_error_payload(uint32_t response_id, std::string_view payload) {
    ErrorFrame error;
    error.response_id = response_id;

    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        auto message = j.find("message");
        if (message != j.end() && message->is_string()) {
            error.message = message->get<std::string>();
            auto code = j.find("code");
            if (code != j.end() && code->is_string()) {
                error.code = code->get<std::string>();
            }
            return error;
        }
    }

    error.message = payload.empty() ? std::string("Upstream error") : std::string(payload);
    return error;
}

// ============================================================================
// FrameDecoder
// ============================================================================

FrameDecoder::FrameDecoder(size_t max_payload) : max_payload_(max_payload) {}

void FrameDecoder::feed(std::string_view bytes) {
    if (error_) {
        return;
    }
    compact();
    buffer_.append(bytes);
}

void FrameDecoder::compact() {
    // Drop consumed prefix once it dominates the buffer
    if (read_pos_ > 0 && read_pos_ * 2 >= buffer_.size()) {
        buffer_.erase(0, read_pos_);
        read_pos_ = 0;
    }
}

DecodeResult FrameDecoder::next() {
    if (error_) {
        return DecodeResult::failure(*error_);
    }

    size_t available = buffer_.size() - read_pos_;
    if (available < 1) {
        return DecodeResult::need_more();
    }

    const char* header = buffer_.data() + read_pos_;
    size_t frame_offset = consumed_total_;
    auto type_byte = static_cast<unsigned char>(header[0]);

    // Unknown type: no way to find the next frame boundary
    if (!is_known_type(type_byte)) {
        error_ = DecodeError{DecodeErrorKind::UnknownType,
                             fmt::format("Unknown frame type 0x{:02x}", type_byte), frame_offset};
        return DecodeResult::failure(*error_);
    }

    if (available < kFrameHeaderSize) {
        return DecodeResult::need_more();
    }

    uint32_t response_id = get_u32(header + 1);
    uint32_t length = get_u32(header + 5);

    if (length > max_payload_) {
        error_ = DecodeError{DecodeErrorKind::PayloadTooLarge,
                             fmt::format("Frame payload of {} bytes exceeds limit of {}", length,
                                         max_payload_),
                             frame_offset};
        return DecodeResult::failure(*error_);
    }

    if (available < kFrameHeaderSize + length) {
        return DecodeResult::need_more();
    }

    std::string_view payload(header + kFrameHeaderSize, length);
    read_pos_ += kFrameHeaderSize + length;
    consumed_total_ += kFrameHeaderSize + length;

    switch (static_cast<FrameType>(type_byte)) {
        case FrameType::Start: {
            auto start = parse_start_payload(response_id, payload);
            if (!start) {
                error_ = DecodeError{DecodeErrorKind::MalformedStart,
                                     fmt::format("Malformed Start frame for response {}",
                                                 response_id),
                                     frame_offset};
                return DecodeResult::failure(*error_);
            }
            return DecodeResult::ok(std::move(*start));
        }
        case FrameType::Data:
            return DecodeResult::ok(DataFrame{response_id, std::string(payload)});
        case FrameType::Complete:
            return DecodeResult::ok(CompleteFrame{response_id});
        case FrameType::Abort:
            return DecodeResult::ok(AbortFrame{response_id});
        case FrameType::Error:
            return DecodeResult::ok(parse_error_payload(response_id, payload));
    }

    // Unreachable: is_known_type() admitted the byte
    error_ = DecodeError{DecodeErrorKind::UnknownType, "Unknown frame type", frame_offset};
    return DecodeResult::failure(*error_);
}

DecodeAllResult decode_frames(std::string_view bytes, size_t max_payload) {
    DecodeAllResult result;
    FrameDecoder decoder(max_payload);
    decoder.feed(bytes);

    while (true) {
        auto next = decoder.next();
        if (next.error) {
            result.error = std::move(next.error);
            break;
        }
        if (!next.frame) {
            break;
        }
        result.frames.push_back(std::move(*next.frame));
    }

    result.trailing_bytes = decoder.buffered();
    return result;
}

// ============================================================================
// Ordering
// ============================================================================

std::string_view to_string(SequenceViolation violation) noexcept {
    switch (violation) {
        case SequenceViolation::None:
            return "none";
        case SequenceViolation::DuplicateStart:
            return "duplicate Start frame";
        case SequenceViolation::FrameBeforeStart:
            return "frame before Start";
        case SequenceViolation::FrameAfterTerminal:
            return "frame after terminal frame";
    }
    return "unknown";
}

ResponseState SequenceTracker::state(uint32_t response_id) const {
    auto it = states_.find(response_id);
    return it == states_.end() ? ResponseState::Absent : it->second;
}

SequenceViolation SequenceTracker::check(const Frame& frame) const {
    ResponseState current = state(response_id_of(frame));

    if (type_of(frame) == FrameType::Start) {
        return current == ResponseState::Absent ? SequenceViolation::None
                                                : SequenceViolation::DuplicateStart;
    }

    switch (current) {
        case ResponseState::Absent:
            return SequenceViolation::FrameBeforeStart;
        case ResponseState::Open:
            return SequenceViolation::None;
        case ResponseState::Completed:
        case ResponseState::Aborted:
        case ResponseState::Errored:
            return SequenceViolation::FrameAfterTerminal;
    }
    return SequenceViolation::FrameBeforeStart;
}

SequenceViolation SequenceTracker::apply(const Frame& frame) {
    auto violation = check(frame);
    if (violation != SequenceViolation::None) {
        return violation;
    }

    uint32_t id = response_id_of(frame);
    switch (type_of(frame)) {
        case FrameType::Start:
            states_[id] = ResponseState::Open;
            max_started_ = std::max(max_started_, id);
            break;
        case FrameType::Data:
            break;
        case FrameType::Complete:
            states_[id] = ResponseState::Completed;
            break;
        case FrameType::Abort:
            states_[id] = ResponseState::Aborted;
            break;
        case FrameType::Error:
            states_[id] = ResponseState::Errored;
            break;
    }
    return SequenceViolation::None;
}

SequenceResult validate_sequence(std::span<const Frame> frames) {
    SequenceTracker tracker;
    for (size_t i = 0; i < frames.size(); ++i) {
        auto violation = tracker.apply(frames[i]);
        if (violation != SequenceViolation::None) {
            return {false, violation, i, response_id_of(frames[i])};
        }
    }
    return {};
}

}  // namespace tether::wire
