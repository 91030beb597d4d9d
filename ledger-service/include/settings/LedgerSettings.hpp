#pragma once

#include "settings/Environment.hpp"
#include "settings/ILedgerSettings.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace btctax::settings {

/**
 * @brief Реализация ILedgerSettings, получает данные из Environment
 *
 * Ключи:
 * - storage.backend                 (default: "memory")
 * - engine.transfer_fee_is_disposal (default: true)
 * - engine.long_term_threshold_days (default: 365)
 */
class LedgerSettings : public ILedgerSettings {
public:
    /**
     * @throws std::invalid_argument при недопустимом значении
     */
    explicit LedgerSettings(std::shared_ptr<Environment> env)
        : storageBackend_(env->get<std::string>("storage.backend", "memory"))
    {
        options_.transferFeeIsDisposal = env->get<bool>("engine.transfer_fee_is_disposal", true);
        options_.longTermThresholdDays = env->get<int64_t>("engine.long_term_threshold_days", 365);

        if (storageBackend_ != "memory" && storageBackend_ != "postgres") {
            throw std::invalid_argument("storage.backend must be 'memory' or 'postgres', got '" +
                                        storageBackend_ + "'");
        }
        if (options_.longTermThresholdDays < 0) {
            throw std::invalid_argument("engine.long_term_threshold_days must be >= 0");
        }
    }

    std::string getStorageBackend() const override { return storageBackend_; }
    engine::EngineOptions getEngineOptions() const override { return options_; }

private:
    std::string storageBackend_;
    engine::EngineOptions options_;
};

} // namespace btctax::settings
