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

// Tether Proxy Errors - Implementation

#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace tether::proxy {

ProxyError ProxyError::from_capability(core::CapabilityError error, std::string_view stream_id) {
    ProxyError result;
    result.status = error == core::CapabilityError::MalformedStreamUrl ? 400 : 401;
    result.code = std::string(core::to_code(error));
    result.message = std::string(core::to_message(error));

    if (error == core::CapabilityError::SignatureExpired) {
        result.stream_id = std::string(stream_id);
        result.renewable = true;
    }
    return result;
}

std::string error_body(const ProxyError& error) {
    nlohmann::json detail = {{"code", error.code}, {"message", error.message}};
    if (error.stream_id) {
        detail["streamId"] = *error.stream_id;
    }
    if (error.renewable) {
        detail["renewable"] = true;
    }

    nlohmann::json body = {{"error", std::move(detail)}};
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace tether::proxy
