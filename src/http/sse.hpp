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

// Tether Server-Sent Events - Header
// text/event-stream framing used for live=sse tailing

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tether::http {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

/// Serialize one event; multi-line data becomes several data: lines
[[nodiscard]] std::string format_sse_event(std::string_view event, std::string_view data);

/// Incremental text/event-stream parser (LF, CRLF or CR line endings)
class SseParser {
public:
    /// Feed a chunk, returning every event completed by it
    [[nodiscard]] std::vector<SseEvent> feed(std::string_view chunk);

private:
    void process_line(std::string_view line, std::vector<SseEvent>& out);

    std::string line_buffer_;
    SseEvent current_;
    bool has_data_ = false;
    bool pending_cr_ = false;
};

}  // namespace tether::http
