/**
 * @file constants.h
 * @brief Common constants used across the codebase
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace sqlbackup::constants {

// ============================================================================
// Byte unit constants
// ============================================================================

/// Bytes per kilobyte as double (for floating-point calculations)
constexpr double kBytesPerKilobyteDouble = 1024.0;

// ============================================================================
// Dump defaults
// ============================================================================

/// Rows per batched INSERT statement
constexpr size_t kDefaultBatchSize = 1000;

/// Log a progress line every N rows while streaming a table
constexpr uint64_t kProgressLogIntervalRows = 100000;

/// Width of the "YYYYMMDD_HHMMSS" prefix of incremental backup names
constexpr size_t kTimestampPrefixLength = 15;

}  // namespace sqlbackup::constants
