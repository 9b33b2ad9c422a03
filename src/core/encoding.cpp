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

// Tether Encoding Utilities - Implementation

#include "encoding.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace tether::core {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

// BIO decoding silently skips garbage, so reject it up front
bool is_well_formed_base64(std::string_view input) {
    if (input.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '=') {
            if (i < input.size() - 2) {
                return false;
            }
            ++padding;
        } else if (padding > 0 || !is_base64_char(c)) {
            return false;
        }
    }
    return padding <= 2;
}

}  // namespace

std::string base64_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bmem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    BIO_flush(b64);

    BUF_MEM* bptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);
    BIO_free_all(b64);
    return result;
}

std::optional<std::string> base64_decode(std::string_view input) {
    if (input.empty()) {
        return std::string();
    }
    if (!is_well_formed_base64(input)) {
        return std::nullopt;
    }

    std::string encoded(input);
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    bmem = BIO_push(b64, bmem);
    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> buffer(encoded.size());
    int decoded_size = BIO_read(bmem, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bmem);

    if (decoded_size < 0) {
        return std::nullopt;
    }

    return std::string(buffer.data(), static_cast<size_t>(decoded_size));
}

std::string base64url_encode(std::string_view input) {
    std::string result = base64_encode(input);

    // '+' -> '-', '/' -> '_', strip '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.find_first_of("+/=") != std::string_view::npos) {
        return std::nullopt;
    }

    std::string base64(input);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');

    size_t padding = (4 - (base64.size() % 4)) % 4;
    if (padding == 3) {
        return std::nullopt;
    }
    base64.append(padding, '=');

    return base64_decode(base64);
}

std::string generate_stream_id() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating stream id");
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                       bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                       bytes[14], bytes[15]);
}

}  // namespace tether::core
