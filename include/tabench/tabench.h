/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/**
 * @file tabench.h
 * @brief Tabular micro-benchmark harness - Main Header
 * 
 * A C++20 header-only harness that synthesizes reproducible tabular
 * datasets, runs a fixed catalogue of query kernels against them and
 * reports robust timings as JSON and markdown.
 * 
 * This header includes all component declarations:
 * - Lcg: deterministic sequence generator
 * - Dataset: synthesized rows per variant
 * - frame_ops: selection, sorting, counting and grouping kernels
 * - Operation / case registry: the benchmark cases
 * - Timing harness, report builder, run configuration, CSV export
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Component declarations
#include "barrier.h"
#include "lcg.h"
#include "column.h"
#include "dataset.h"
#include "frame_ops.h"
#include "operation.h"
#include "operations.h"
#include "case_registry.h"
#include "timing.h"
#include "report.h"
#include "run_config.h"
#include "csv_export.h"

// Include implementations
#include "dataset.hpp"
#include "frame_ops.hpp"
#include "operations.hpp"
#include "case_registry.hpp"
#include "timing.hpp"
#include "report.hpp"
#include "run_config.hpp"
#include "csv_export.hpp"
