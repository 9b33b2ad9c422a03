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

// Tether Server-Sent Events - Implementation

#include "sse.hpp"

namespace tether::http {

std::string format_sse_event(std::string_view event, std::string_view data) {
    std::string out;
    out.reserve(event.size() + data.size() + 24);
    out += "event: ";
    out += event;
    out += '\n';

    size_t pos = 0;
    while (true) {
        auto nl = data.find('\n', pos);
        out += "data: ";
        out += data.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        out += '\n';
        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }
    out += '\n';
    return out;
}

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    for (char c : chunk) {
        if (pending_cr_) {
            pending_cr_ = false;
            if (c == '\n') {
                continue;  // CRLF already handled at CR
            }
        }
        if (c == '\r' || c == '\n') {
            pending_cr_ = (c == '\r');
            process_line(line_buffer_, events);
            line_buffer_.clear();
        } else {
            line_buffer_ += c;
        }
    }

    return events;
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
    // Blank line dispatches the pending event
    if (line.empty()) {
        if (has_data_) {
            out.push_back(std::move(current_));
        }
        current_ = SseEvent{};
        has_data_ = false;
        return;
    }

    if (line.front() == ':') {
        return;  // Comment
    }

    std::string_view field = line;
    std::string_view value;
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "event") {
        current_.event = std::string(value);
    } else if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
        }
        current_.data += value;
        has_data_ = true;
    } else if (field == "id") {
        current_.id = std::string(value);
    }
}

}  // namespace tether::http
