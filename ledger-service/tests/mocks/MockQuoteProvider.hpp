#pragma once

#include "ports/output/IQuoteProvider.hpp"
#include <gmock/gmock.h>

namespace ledger::tests {

class MockQuoteProvider : public ports::output::IQuoteProvider {
public:
    MOCK_METHOD(std::optional<domain::Quote>, getQuote, (const std::string& symbol), (override));
};

} // namespace ledger::tests
