#pragma once

#include <cstdint>

namespace btctax::domain {

using AccountId = int;
using TransactionId = int64_t;
using LedgerEntryId = int64_t;
using LotId = int64_t;
using DisposalId = int64_t;

} // namespace btctax::domain
