#pragma once

// ---------------------------------------------------------------------------
// sql_lexer.hpp
//
// PostgreSQL 어휘 규칙을 따르는 SQL 토크나이저.
//
// [지원 범위]
// - 주석: -- 인라인, /* */ 블록 (PostgreSQL 규칙대로 중첩 허용)
// - 문자열: '...' ('' 이스케이프), E'...' (백슬래시 이스케이프),
//           B'...' / X'...' / N'...', $$...$$ / $tag$...$tag$ dollar quoting
// - 식별자: 비인용 식별자는 소문자로 접어서(value) 보관, "..." 인용 식별자는
//           대소문자 보존
// - 연산자: PostgreSQL 연산자 문자 집합의 최장 일치.
//           "+"/"-" 로 끝나는 다중 문자 연산자는 ~!@#%^&|`? 를 포함할 때만 허용
//           (예: "=-1" → "=", "-", "1")
//
// [설계 원칙]
// - 키워드를 별도 토큰 종류로 구분하지 않는다. 키워드 판정은 파서가
//   kIdentifier 의 value 비교로 수행한다 (비예약어가 식별자로 쓰이는 경우 처리).
// - 모든 토큰은 원문 오프셋(offset, length)을 보관한다. LIMIT 재작성과
//   SELECT * 치환이 원문 텍스트 구간 교체로 동작하기 때문이다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // GatewayError

enum class TokenKind : std::uint8_t {
    kIdentifier       = 0,   // 비인용 식별자/키워드 (value = 소문자)
    kQuotedIdentifier = 1,   // "Name" (value = 인용 해제된 원문)
    kNumber           = 2,
    kString           = 3,   // value = 내용
    kParameter        = 4,   // $1
    kOperator         = 5,   // + - * / < > = ~ ! @ # % ^ & | ` ? 조합
    kLeftParen        = 6,
    kRightParen       = 7,
    kLeftBracket      = 8,
    kRightBracket     = 9,
    kComma            = 10,
    kSemicolon        = 11,
    kDot              = 12,
    kColon            = 13,  // 배열 slice a[1:2]
    kDoubleColon      = 14,  // ::type 캐스트
    kEnd              = 15,
};

struct Token {
    TokenKind   kind{TokenKind::kEnd};
    std::string value{};
    std::size_t offset{0};   // 원문 내 시작 위치 (byte)
    std::size_t length{0};

    [[nodiscard]] std::size_t end() const noexcept { return offset + length; }
};

// ---------------------------------------------------------------------------
// tokenize
//   sql 전체를 토큰 벡터로 변환한다. 마지막 원소는 항상 kEnd.
//   닫히지 않은 문자열/주석/인용 식별자는 kSyntaxError 로 실패한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<Token>, GatewayError>
tokenize(std::string_view sql);
