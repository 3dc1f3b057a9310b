#pragma once

#include "protocol/odalpapi.hpp"
#include "protocol/packet_codec.hpp"
#include "protocol/query_error.hpp"
#include "query/discovery_client.hpp"
#include "query/fan_out_scheduler.hpp"
#include "query/local_discovery.hpp"
#include "registry/activity_detector.hpp"
#include "registry/server_filters.hpp"
#include "registry/server_registry.hpp"
#include "match/matchmaking_engine.hpp"

#define ODAL_VERSION_MAJOR 0
#define ODAL_VERSION_MINOR 9
#define ODAL_VERSION_PATCH 0
