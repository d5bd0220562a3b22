#pragma once

#include <namesake/core/types.h>

#include <array>
#include <string_view>

namespace namesake::scoring {

/**
 * @brief Closed set of versioned scoring algorithms
 *
 * A new version is a new enumerator with its own weight table. Existing
 * enumerators never change behaviour.
 */
enum class AlgorithmId { NameBased, NameQualified, LogicV1 };

inline constexpr std::array<AlgorithmId, 3> kAllAlgorithms = {
    AlgorithmId::NameBased, AlgorithmId::NameQualified, AlgorithmId::LogicV1};

[[nodiscard]] constexpr const char* algorithmName(AlgorithmId id) noexcept {
    switch (id) {
        case AlgorithmId::NameBased:
            return "name-based";
        case AlgorithmId::NameQualified:
            return "name-qualified";
        case AlgorithmId::LogicV1:
            return "logic-v1";
    }
    return "unknown";
}

inline Result<AlgorithmId> parseAlgorithm(std::string_view name) {
    for (auto id : kAllAlgorithms) {
        if (name == algorithmName(id)) {
            return id;
        }
    }
    return Error{ErrorCode::UnknownAlgorithm, "unknown algorithm '" + std::string(name) + "'"};
}

} // namespace namesake::scoring
