#pragma once

#include "approval_store.hpp"
#include "balance_ledger.hpp"
#include "events.hpp"
#include "ledger_state.hpp"
#include "token_registry.hpp"
#include "transfer_engine.hpp"
