#pragma once

#include "cst/compiler.hpp"
#include "cst/construct.hpp"
#include "cst/deferred.hpp"
#include "cst/error.hpp"
#include "cst/expr.hpp"
#include "cst/mmap.hpp"
#include "cst/registry.hpp"
#include "cst/schema.hpp"
#include "cst/stream.hpp"
#include "cst/value.hpp"

#ifndef CONSTRUE_VERSION
#define CONSTRUE_VERSION "0.1.0"
#endif
