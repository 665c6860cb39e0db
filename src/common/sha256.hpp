#pragma once

#include <string>
#include <string_view>

// OpenSSL EVP SHA-256, 소문자 hex 64자.
// EVP 컨텍스트 할당 실패 시 빈 문자열.
[[nodiscard]] std::string sha256_hex(std::string_view input);
