#pragma once

// Umbrella header for cadence::core module
#include <cadence/core/log.hpp>
#include <cadence/core/error.hpp>
#include <cadence/core/time.hpp>
#include <cadence/core/filesystem.hpp>
#include <cadence/core/settings.hpp>
