// ---------------------------------------------------------------------------
// pattern_scanner.cpp
//
// [CompiledPattern 구현 주의사항]
// 헤더는 CompiledPattern 을 전방 선언만 하므로 compiled_patterns_ 를 건드리는
// 멤버(소멸자, 복사/이동, pattern_count)는 모두 이 파일에서 정의한다.
// 복사 시 컴파일된 regex 는 shared_ptr 로 공유된다.
// ---------------------------------------------------------------------------

#include "parser/pattern_scanner.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

struct ForbiddenPatternScanner::CompiledPattern {
    std::string                 source_pattern;
    std::shared_ptr<std::regex> compiled;
    std::string                 reason;
};

const std::vector<ForbiddenPattern>& default_forbidden_patterns() {
    static const std::vector<ForbiddenPattern> kPatterns = {
        {R"(\bCOPY\b.*\b(TO|FROM)\b)",                         "Forbidden keyword detected: COPY TO/FROM"},
        {R"(\bSELECT\b.*\bINTO\s+(?!@))",                      "Forbidden keyword detected: SELECT INTO"},
        {R"(\bFOR\s+(UPDATE|SHARE|NO\s+KEY\s+UPDATE|KEY\s+SHARE)\b)", "Forbidden keyword detected: FOR UPDATE/SHARE"},
        {R"(\bSET\s+ROLE\b)",                                  "Forbidden keyword detected: SET ROLE"},
        {R"(\bSET\s+SESSION\s+AUTHORIZATION\b)",               "Forbidden keyword detected: SET SESSION AUTHORIZATION"},
        {R"(\bRESET\s+ROLE\b)",                                "Forbidden keyword detected: RESET ROLE"},
        {R"(\bLISTEN\b)",                                      "Forbidden keyword detected: LISTEN"},
        {R"(\bNOTIFY\b)",                                      "Forbidden keyword detected: NOTIFY"},
        {R"(\bUNLISTEN\b)",                                    "Forbidden keyword detected: UNLISTEN"},
    };
    return kPatterns;
}

ForbiddenPatternScanner::ForbiddenPatternScanner(const std::vector<ForbiddenPattern>& patterns) {
    compiled_patterns_.reserve(patterns.size());

    for (const auto& p : patterns) {
        try {
            auto re = std::make_shared<std::regex>(
                p.regex, std::regex_constants::icase | std::regex_constants::ECMAScript);
            compiled_patterns_.push_back(CompiledPattern{p.regex, std::move(re), p.reason});
        } catch (const std::regex_error& e) {
            // 나머지 유효한 패턴은 계속 적용된다 (해당 패턴은 false negative)
            spdlog::warn("pattern_scanner: invalid regex pattern '{}', skipping: {}",
                         p.regex, e.what());
        }
    }

    if (compiled_patterns_.empty()) {
        fail_close_active_ = true;
        spdlog::error("pattern_scanner: no valid forbidden patterns loaded, "
                      "fail-close active, all SQL will be rejected");
    }
}

ForbiddenPatternScanner::~ForbiddenPatternScanner() = default;
ForbiddenPatternScanner::ForbiddenPatternScanner(const ForbiddenPatternScanner&) = default;
ForbiddenPatternScanner& ForbiddenPatternScanner::operator=(const ForbiddenPatternScanner&) = default;
ForbiddenPatternScanner::ForbiddenPatternScanner(ForbiddenPatternScanner&&) noexcept = default;
ForbiddenPatternScanner& ForbiddenPatternScanner::operator=(ForbiddenPatternScanner&&) noexcept = default;

std::size_t ForbiddenPatternScanner::pattern_count() const noexcept {
    return compiled_patterns_.size();
}

PatternMatch ForbiddenPatternScanner::scan(std::string_view sql) const {
    if (fail_close_active_) {
        return PatternMatch{true, "", "no valid forbidden patterns loaded"};
    }

    std::string normalized(sql);
    std::replace_if(normalized.begin(), normalized.end(),
                    [](char c) { return c == '\n' || c == '\r' || c == '\t'; }, ' ');

    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }
        if (std::regex_search(normalized, *cp.compiled)) {
            return PatternMatch{true, cp.source_pattern, cp.reason};
        }
    }
    return PatternMatch{};
}
