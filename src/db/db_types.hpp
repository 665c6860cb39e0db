#pragma once

// ---------------------------------------------------------------------------
// db_types.hpp
//
// 데이터베이스 드라이버와 상위 레이어가 주고받는 결과 타입.
// 모든 값은 서버가 보낸 텍스트 표현 그대로 보관한다 (NULL 은 nullopt).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using CellValue = std::optional<std::string>;
using Row       = std::vector<CellValue>;

struct RowSet {
    std::vector<std::string> columns{};
    std::vector<Row>         rows{};
    std::string              command_tag{};   // "SELECT 3" 등

    [[nodiscard]] std::size_t row_count() const noexcept { return rows.size(); }

    // 컬럼 이름으로 인덱스를 찾는다. 없으면 nullopt.
    [[nodiscard]] std::optional<std::size_t> column_index(const std::string& name) const {
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// QueryResult
//   QueryExecutor 가 호출자에게 반환하는 최종 결과.
//   truncated: 요청한 limit 보다 많은 행이 있어 잘렸는지 여부
// ---------------------------------------------------------------------------
struct QueryResult {
    std::vector<std::string> columns{};
    std::vector<Row>         rows{};
    std::size_t              row_count{0};
    bool                     truncated{false};
    std::vector<std::string> warnings{};
    double                   execution_time_ms{0.0};
};
