#pragma once

/// @file fsgate.h
/// Umbrella header for the fsgate C++ API.

#include "error.h"
#include "types.h"
#include "log.h"
#include "paths.h"
#include "glob.h"
#include "roots.h"
#include "resolver.h"
#include "edit.h"
#include "mutation.h"
#include "reader.h"
#include "traversal.h"
#include "sandbox.h"
#include "dispatcher.h"
#include "server.h"
#include "config.h"
