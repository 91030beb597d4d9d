#pragma once

#include "engine/EngineOptions.hpp"
#include <string>

namespace btctax::settings {

class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// "memory" или "postgres"
    virtual std::string getStorageBackend() const = 0;
    virtual engine::EngineOptions getEngineOptions() const = 0;
};

} // namespace btctax::settings
