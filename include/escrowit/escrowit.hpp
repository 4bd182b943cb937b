#pragma once

// High-level Escrowit facade
// Composes ledger, reputation, events and storage modules

#include "escrowit/common/error.hpp"
#include "escrowit/common/types.hpp"
#include "escrowit/events/event_log.hpp"
#include "escrowit/ledger/ledger.hpp"
#include "escrowit/reputation/reputation_store.hpp"
#include "escrowit/storage/escrowit_store.hpp"
