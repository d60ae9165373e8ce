#pragma once

// Creator ledger facade
// Composes the ledger state machine and its storage backends

#include "creatorledger/common/error.hpp"
#include "creatorledger/common/hash.hpp"
#include "creatorledger/common/types.hpp"
#include "creatorledger/ledger/config.hpp"
#include "creatorledger/ledger/events.hpp"
#include "creatorledger/ledger/payment.hpp"
#include "creatorledger/ledger/platform.hpp"
#include "creatorledger/ledger/records.hpp"
#include "creatorledger/storage/ledger_store.hpp"
#include "creatorledger/storage/memory_store.hpp"
#include "creatorledger/storage/sqlite_store.hpp"
