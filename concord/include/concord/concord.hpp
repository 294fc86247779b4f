#pragma once
// Concord: advisory consensus over independent peer verdicts
//
// Pipeline:
//   VerdictAcquirer  fan-out to peers, shape-checked extraction
//   ConsensusAdvisor softmax weighting, IQR outliers, recommendation
//   AuditMatrix      append-only, hash-chained record of every advisory
//   StateHub         live peer availability and control intents
//   IntegrationCoordinator ties them together; never dispatches anything

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "shape_guide.hpp"
#include "consensus.hpp"
#include "audit_matrix.hpp"
#include "state_hub.hpp"
#include "peer_inferrer.hpp"
#include "verdict_acquirer.hpp"
#include "coordinator.hpp"
#include "socket_server.hpp"
#include "rpc/protocol.hpp"
#include "rpc/handler.hpp"
