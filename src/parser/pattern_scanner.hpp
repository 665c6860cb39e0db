#pragma once

// ---------------------------------------------------------------------------
// pattern_scanner.hpp
//
// 파싱 이전에 원문 SQL 에 대해 수행하는 정규식 기반 금지 키워드 스캔.
// 문법이 수용할 수 있는 위험 형태(COPY ... TO, SELECT ... INTO, 잠금 절,
// 역할 전환, LISTEN/NOTIFY)를 AST 와 무관하게 먼저 걸러낸다.
//
// [기본 패턴]
// - \bCOPY\b.*\b(TO|FROM)\b                          서버 파일/프로그램 입출력
// - \bSELECT\b.*\bINTO\s+(?!@)                       SELECT INTO (변수 할당 형태 제외)
// - \bFOR\s+(UPDATE|SHARE|NO\s+KEY\s+UPDATE|KEY\s+SHARE)\b   행 잠금
// - \bSET\s+ROLE\b, \bSET\s+SESSION\s+AUTHORIZATION\b, \bRESET\s+ROLE\b
// - \bLISTEN\b, \bNOTIFY\b, \bUNLISTEN\b
//
// [오탐/미탐 트레이드오프]
// - 문자열 리터럴 내부도 스캔한다. WHERE note = 'for update' 같은 쿼리는
//   거부된다 (false positive). AST 단계 검사만으로는 파서가 받아들이지 않는
//   변형을 놓칠 수 있으므로 원문 스캔을 유지한다.
// - 줄바꿈/탭은 매칭 전에 공백으로 치환한다 (.* 가 줄을 넘도록).
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

struct PatternMatch {
    bool        matched{false};
    std::string pattern{};   // 매칭된 정규식 (감사/진단용)
    std::string reason{};    // 사람이 읽을 수 있는 사유
};

struct ForbiddenPattern {
    std::string regex{};
    std::string reason{};
};

[[nodiscard]] const std::vector<ForbiddenPattern>& default_forbidden_patterns();

// ---------------------------------------------------------------------------
// ForbiddenPatternScanner
//   생성 시 정규식을 컴파일하고 scan() 에서 첫 매칭을 반환한다.
//
//   [Fail-close]
//   유효한 패턴이 하나도 없으면 모든 SQL 이 matched=true 로 판정된다.
// ---------------------------------------------------------------------------
class ForbiddenPatternScanner {
public:
    explicit ForbiddenPatternScanner(
        const std::vector<ForbiddenPattern>& patterns = default_forbidden_patterns());

    ~ForbiddenPatternScanner();

    // CompiledPattern 이 완전한 cpp 에서 default 로 정의
    ForbiddenPatternScanner(const ForbiddenPatternScanner&);
    ForbiddenPatternScanner& operator=(const ForbiddenPatternScanner&);
    ForbiddenPatternScanner(ForbiddenPatternScanner&&) noexcept;
    ForbiddenPatternScanner& operator=(ForbiddenPatternScanner&&) noexcept;

    [[nodiscard]] PatternMatch scan(std::string_view sql) const;

    [[nodiscard]] std::size_t pattern_count() const noexcept;

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};
