/**
 * @file connection_test.cpp
 * @brief Unit tests for C API field classification, row conversion and
 *        the unconnected Connection
 *
 * These tests need the client headers only; no server is contacted.
 */

#include "mysql/connection.h"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <utility>

using namespace sqlbackup::mysql;
using sqlbackup::utils::ErrorCode;

namespace {

constexpr unsigned int kBinaryCharset = 63;
constexpr unsigned int kUtf8mb4Charset = 255;

}  // namespace

// ===== ClassifyField =====

TEST(ClassifyFieldTest, NumericTypesAreUnquoted) {
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_TINY, kBinaryCharset), ValueKind::kNumeric);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_LONG, kBinaryCharset), ValueKind::kNumeric);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_LONGLONG, kBinaryCharset), ValueKind::kNumeric);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_NEWDECIMAL, kBinaryCharset), ValueKind::kNumeric);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_DOUBLE, kBinaryCharset), ValueKind::kNumeric);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_YEAR, kBinaryCharset), ValueKind::kNumeric);
}

TEST(ClassifyFieldTest, CharacterDataIsString) {
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_VAR_STRING, kUtf8mb4Charset), ValueKind::kString);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_STRING, kUtf8mb4Charset), ValueKind::kString);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_BLOB, kUtf8mb4Charset), ValueKind::kString);  // TEXT
}

TEST(ClassifyFieldTest, BinaryCollationIsBinary) {
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_VAR_STRING, kBinaryCharset), ValueKind::kBinary);  // VARBINARY
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_BLOB, kBinaryCharset), ValueKind::kBinary);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_BIT, kBinaryCharset), ValueKind::kBinary);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_GEOMETRY, kBinaryCharset), ValueKind::kBinary);
}

TEST(ClassifyFieldTest, TemporalTypesAreQuoted) {
  // Temporal results carry the binary charset but are rendered as strings
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_DATETIME, kBinaryCharset), ValueKind::kString);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_DATE, kBinaryCharset), ValueKind::kString);
  EXPECT_EQ(ClassifyField(MYSQL_TYPE_TIMESTAMP, kBinaryCharset), ValueKind::kString);
}

// ===== ConvertRow =====

TEST(ConvertRowTest, NullPointerBecomesNull) {
  std::array<MYSQL_FIELD, 3> fields{};
  fields[0].type = MYSQL_TYPE_LONG;
  fields[0].charsetnr = kBinaryCharset;
  fields[1].type = MYSQL_TYPE_VAR_STRING;
  fields[1].charsetnr = kUtf8mb4Charset;
  fields[2].type = MYSQL_TYPE_VAR_STRING;
  fields[2].charsetnr = kUtf8mb4Charset;

  std::string id = "42";
  std::string name = "alice";
  std::array<char*, 3> values{id.data(), name.data(), nullptr};
  std::array<unsigned long, 3> lengths{id.size(), name.size(), 0};  // NOLINT(google-runtime-int)

  Row row = ConvertRow(values.data(), lengths.data(), fields.data(), 3);

  ASSERT_EQ(row.size(), 3U);
  EXPECT_EQ(row[0], FieldValue::Numeric("42"));
  EXPECT_EQ(row[1], FieldValue::String("alice"));
  EXPECT_TRUE(row[2].IsNull());
}

TEST(ConvertRowTest, EmptyStringIsNotNull) {
  std::array<MYSQL_FIELD, 1> fields{};
  fields[0].type = MYSQL_TYPE_VAR_STRING;
  fields[0].charsetnr = kUtf8mb4Charset;

  std::string empty;
  std::array<char*, 1> values{empty.data()};
  std::array<unsigned long, 1> lengths{0};  // NOLINT(google-runtime-int)

  Row row = ConvertRow(values.data(), lengths.data(), fields.data(), 1);

  ASSERT_EQ(row.size(), 1U);
  EXPECT_EQ(row[0], FieldValue::String(""));
}

TEST(ConvertRowTest, BinaryValueKeepsEmbeddedNul) {
  std::array<MYSQL_FIELD, 1> fields{};
  fields[0].type = MYSQL_TYPE_BLOB;
  fields[0].charsetnr = kBinaryCharset;

  std::string bytes("\x01\x00\xff", 3);
  std::array<char*, 1> values{bytes.data()};
  std::array<unsigned long, 1> lengths{bytes.size()};  // NOLINT(google-runtime-int)

  Row row = ConvertRow(values.data(), lengths.data(), fields.data(), 1);

  ASSERT_EQ(row.size(), 1U);
  EXPECT_EQ(row[0].kind, ValueKind::kBinary);
  EXPECT_EQ(row[0].data.size(), 3U);
  EXPECT_EQ(row[0].data, bytes);
}

// ===== Connection without a server =====

TEST(ConnectionTest, UnconnectedSessionRefusesStatements) {
  Connection conn(Connection::Config{});
  EXPECT_FALSE(conn.IsConnected());

  auto query = conn.Query("SELECT 1");
  ASSERT_FALSE(query);
  EXPECT_EQ(query.error().code(), ErrorCode::kMySQLDisconnected);

  auto execute = conn.Execute("SET NAMES utf8mb4");
  ASSERT_FALSE(execute);
  EXPECT_EQ(execute.error().code(), ErrorCode::kMySQLDisconnected);

  auto cursor = conn.OpenStreamingCursor("SELECT 1");
  ASSERT_FALSE(cursor);
  EXPECT_EQ(cursor.error().code(), ErrorCode::kMySQLDisconnected);
}

TEST(ConnectionTest, DatabaseComesFromConfig) {
  Connection::Config config;
  config.database = "shop";
  Connection conn(config);
  EXPECT_EQ(conn.Database(), "shop");
}

TEST(ConnectionTest, CloseIsIdempotentAndMoveTransfersHandle) {
  Connection::Config config;
  config.database = "shop";
  Connection source(config);
  Connection target(std::move(source));
  EXPECT_EQ(target.Database(), "shop");

  target.Close();
  target.Close();
  EXPECT_FALSE(target.IsConnected());
}
