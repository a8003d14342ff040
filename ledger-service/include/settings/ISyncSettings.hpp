#pragma once

namespace ledger::settings {

class ISyncSettings {
public:
    virtual ~ISyncSettings() = default;

    virtual int getConcurrency() const = 0;
    virtual int getTimeoutSeconds() const = 0;
};

} // namespace ledger::settings
