#pragma once

#include "relay/core/error.hpp"
#include "relay/core/key.hpp"
#include "relay/event/async_registry.hpp"
#include "relay/event/confined_registry.hpp"
#include "relay/event/factories.hpp"
#include "relay/event/reducers.hpp"
#include "relay/event/strategy.hpp"
#include "relay/event/synchronized_registry.hpp"
#include "relay/exec/executor.hpp"
