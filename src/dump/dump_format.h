/**
 * @file dump_format.h
 * @brief Text format definitions for SQL dump files
 *
 * A dump is UTF-8 text made of ';'-terminated SQL statements, replayable
 * with the stock mysql client.
 *
 * File Format Overview:
 *   -- sqlbackup dump                      header comment lines
 *   -- Format version: 1
 *   -- ...
 *   SET NAMES utf8mb4;                     preamble session statements
 *   ...
 *   -- Table: <name>                       one section per table, dependency order
 *   DROP TABLE IF EXISTS `<name>`;
 *   CREATE TABLE `<name>` (...);
 *   INSERT INTO `<name>` (...) VALUES (...),(...);
 *   ...
 *   -- Dump completed                      completion marker
 *   SET UNIQUE_CHECKS = 1;                 epilogue session statements
 *   SET FOREIGN_KEY_CHECKS = 1;
 *
 * A file without the completion marker was cut short and is refused by
 * restore unless explicitly allowed.
 */

#pragma once

#include <array>
#include <cstdint>

namespace sqlbackup::dump {

/**
 * @brief Dump file format constants
 */
namespace dump_format {

// Current format version (written in the header)
constexpr uint32_t kCurrentVersion = 1;

// First header line
constexpr const char* kTitle = "-- sqlbackup dump";

// Header line prefixes
constexpr const char* kFormatVersionPrefix = "-- Format version: ";
constexpr const char* kToolVersionPrefix = "-- Tool version: ";
constexpr const char* kDatabasePrefix = "-- Database: ";
constexpr const char* kServerVersionPrefix = "-- Server version: ";
constexpr const char* kGeneratedAtPrefix = "-- Generated at: ";

// Structural marker opening a table section
constexpr const char* kTableMarkerPrefix = "-- Table: ";

// Completion marker, written once every table section is flushed
constexpr const char* kCompletionMarker = "-- Dump completed";

// Statement terminator
constexpr char kTerminator = ';';

// Session statements run before any table section.
// Foreign-key checks stay off for the whole replay so tables can be
// dropped and filled in any order, including tables in a reference cycle.
constexpr std::array<const char*, 5> kPreamble = {
    "SET NAMES utf8mb4",
    "SET TIME_ZONE = '+00:00'",
    "SET SQL_MODE = 'NO_AUTO_VALUE_ON_ZERO'",
    "SET FOREIGN_KEY_CHECKS = 0",
    "SET UNIQUE_CHECKS = 0",
};

// Session statements run after the last table section
constexpr std::array<const char*, 2> kEpilogue = {
    "SET UNIQUE_CHECKS = 1",
    "SET FOREIGN_KEY_CHECKS = 1",
};

// Character set the source session reads with; matches the SET NAMES in kPreamble
constexpr const char* kSourceCharsetStatement = "SET NAMES utf8mb4";

// Time zone the source session is switched to before reading TIMESTAMP data
constexpr const char* kSourceTimeZoneStatement = "SET time_zone = '+00:00'";

}  // namespace dump_format

}  // namespace sqlbackup::dump
