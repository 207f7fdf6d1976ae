#pragma once

#include <sphere/analysis/classifier.hpp>
#include <sphere/analysis/dependencies.hpp>
#include <sphere/compiler/compiler.hpp>
#include <sphere/compiler/formula_cache.hpp>
#include <sphere/core/error.hpp>
#include <sphere/core/formula_batch.hpp>
#include <sphere/core/value.hpp>
#include <sphere/runtime/aggregates.hpp>
#include <sphere/runtime/csv.hpp>
#include <sphere/runtime/evaluator.hpp>
#include <sphere/runtime/functions.hpp>
#include <sphere/runtime/scenario.hpp>
