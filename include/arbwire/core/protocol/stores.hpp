#pragma once

#include "arbwire/core/config/retention.hpp"
#include "arbwire/core/store/retention_store.hpp"
#include "arbwire/core/protocol/schema/quote.hpp"
#include "arbwire/core/protocol/schema/opportunity.hpp"
#include "arbwire/core/protocol/schema/mev_alert.hpp"
#include "arbwire/core/protocol/schema/depth_snapshot.hpp"
#include "arbwire/core/protocol/schema/execution_update.hpp"


namespace arbwire::core::protocol {

// One live quote per (pair, exchange), least recently updated first
using QuoteStore = store::RetentionStore<
    schema::Quote, schema::QuoteKey,
    store::Ordering::InsertionOrder, config::QUOTE_STORE_CAPACITY,
    schema::NewerQuote>;

using OpportunityStore = store::RetentionStore<
    schema::Opportunity, schema::OpportunityKey,
    store::Ordering::MostRecentFirst, config::OPPORTUNITY_STORE_CAPACITY>;

using MevStore = store::RetentionStore<
    schema::MevAlert, schema::MevAlertKey,
    store::Ordering::MostRecentFirst, config::MEV_STORE_CAPACITY>;

// Snapshots are a rolling window, never deduplicated
using DepthStore = store::RetentionStore<
    schema::DepthSnapshot, store::no_identity,
    store::Ordering::MostRecentFirst, config::DEPTH_STORE_CAPACITY>;

using ExecutionStore = store::RetentionStore<
    schema::ExecutionUpdate, schema::ExecutionUpdateKey,
    store::Ordering::MostRecentFirst, config::EXECUTION_STORE_CAPACITY>;

} // namespace arbwire::core::protocol
