#pragma once

/// @file lazyjson.hpp
/// @brief Main header file for the lazyjson library.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "object.hpp"
#include "native.hpp"
#include "validator.hpp"
#include "pointer.hpp"
#include "locator.hpp"
#include "codec.hpp"
#include "value.hpp"
