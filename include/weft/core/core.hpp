#pragma once

/// @file core.hpp
/// @brief Main include file for weft_core

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "settings.hpp"
