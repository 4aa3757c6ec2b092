#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace ledger::tests::mocks {

/**
 * @brief Управляемые часы для тестов срока действия токенов
 */
class FakeClock : public ports::output::IClock {
public:
    FakeClock()
        : now_(std::chrono::system_clock::time_point(std::chrono::seconds(1700000000))) {}

    std::chrono::system_clock::time_point now() const override {
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        now_ += delta;
    }

    int64_t nowSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(now_.time_since_epoch()).count();
    }

private:
    std::chrono::system_clock::time_point now_;
};

} // namespace ledger::tests::mocks
