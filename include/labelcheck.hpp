#pragma once

#include "batch.hpp"
#include "config.hpp"
#include "core.hpp"
#include "io.hpp"
#include "rule.hpp"
#include "tb.hpp"
#include "validate.hpp"
#include "validator.hpp"

#define LABELCHECK_VERSION_MAJOR 0
#define LABELCHECK_VERSION_MINOR 1
