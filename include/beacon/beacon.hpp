// include/beacon/beacon.hpp
// Umbrella header.

#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "json.hpp"
#include "measurement.hpp"
#include "ping.hpp"
#include "ping_builder.hpp"
#include "telemetry.hpp"
