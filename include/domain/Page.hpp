#pragma once

#include "Result.hpp"
#include "Validation.hpp"

namespace nimbasms::domain {

/**
 * @brief Параметры страницы для list-операций (limit/offset)
 */
struct Page {
    static constexpr int DEFAULT_LIMIT = 10;

    int limit = DEFAULT_LIMIT;
    int offset = 0;

    static Result<Page> create(int limit = DEFAULT_LIMIT, int offset = 0) {
        if (auto failure = validation::firstFailure({
                validation::atLeast("limit", limit, 1),
                validation::atLeast("offset", offset, 0)})) {
            return *failure;
        }
        Page page;
        page.limit = limit;
        page.offset = offset;
        return page;
    }
};

} // namespace nimbasms::domain
