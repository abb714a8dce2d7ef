#pragma once

// Multi-asset token ledger
// Composes the ledger, settlement and storage modules behind one facade

#include "multitoken/common/balance.hpp"
#include "multitoken/common/config.hpp"
#include "multitoken/common/error.hpp"
#include "multitoken/common/types.hpp"
#include "multitoken/host/invocation.hpp"
#include "multitoken/host/payment.hpp"
#include "multitoken/host/scheduler.hpp"
#include "multitoken/ledger/ledger.hpp"
#include "multitoken/multitoken.hpp"
#include "multitoken/settlement/notification.hpp"
#include "multitoken/settlement/saga.hpp"
#include "multitoken/settlement/transfer_protocol.hpp"
#include "multitoken/storage/file_store.hpp"
#include "multitoken/storage/kv_store.hpp"
#include "multitoken/storage/state_store.hpp"
