#pragma once

// ---------------------------------------------------------------------------
// evaluation_budget.hpp
//
// 한 번의 sandbox 평가에 허용되는 자원 한도.
// 기본값은 보수적으로 잡는다 (depth 10, 노드 방문 100회, 100ms).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>

struct EvaluationBudget {
    std::size_t               max_depth{10};       // 정적 트리 높이 한도
    std::size_t               max_operations{100}; // 노드 방문 수 한도
    std::chrono::milliseconds timeout{100};        // steady_clock 기준

    // 설정 시 여기에 없는 연산/비교자/권한 검사 이름은 kSecurityViolation.
    // std::nullopt 이면 registry 의 모든 연산 허용.
    std::optional<std::set<std::string, std::less<>>> allowed_operations{};
};
