#pragma once

#include "access_control.hpp"
#include "donation.hpp"
#include "donation_ledger.hpp"
#include "escrow_vault.hpp"
#include "funds_transport.hpp"

namespace escrowit::ledger {
    // Aggregates ledger headers under escrowit::ledger
}
