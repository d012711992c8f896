/*
 * Copyright (C) 2025 Aless Microsystems
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, version 3 of the License, or under
 * alternative licensing terms as granted by Aless Microsystems.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 */

#include <gtest/gtest.h>

#include "symbols/symbol-table.h"

TEST(SymbolTable, encodes_only_nucleotides)
{
  for (int byte = 0; byte < 256; byte++) {
    const uint8_t code = encode_base(static_cast<uint8_t>(byte));
    switch (byte) {
      case 'A':
      case 'a':
        EXPECT_EQ(code, 0b00);
        break;
      case 'C':
      case 'c':
        EXPECT_EQ(code, 0b01);
        break;
      case 'G':
      case 'g':
        EXPECT_EQ(code, 0b10);
        break;
      case 'T':
      case 't':
        EXPECT_EQ(code, 0b11);
        break;
      default:
        EXPECT_EQ(code, INVALID_BASE) << "byte " << byte;
    }
  }
}

TEST(SymbolTable, decodes_to_uppercase)
{
  EXPECT_EQ(decode_base(0b00), 'A');
  EXPECT_EQ(decode_base(0b01), 'C');
  EXPECT_EQ(decode_base(0b10), 'G');
  EXPECT_EQ(decode_base(0b11), 'T');
}

TEST(SymbolTable, decode_inverts_encode)
{
  for (const char base : {'A', 'C', 'G', 'T', 'a', 'c', 'g', 't'}) {
    const char upper = (base >= 'a') ? static_cast<char>(base - 32) : base;
    EXPECT_EQ(decode_base(encode_base(static_cast<uint8_t>(base))), upper);
  }
}

/* The vector backends validate through the nibble tables, so they must agree
 * with the full table on every byte value. */
TEST(SymbolTable, nibble_tables_match_full_table)
{
  for (int byte = 0; byte < 256; byte++) {
    const uint8_t b = static_cast<uint8_t>(byte);
    const uint8_t nibble = b & 0x0F;
    const bool nibble_valid = static_cast<uint8_t>(b | 0x20) == nibble_letter_lut[nibble];
    EXPECT_EQ(nibble_valid, encode_base(b) != INVALID_BASE) << "byte " << byte;
    if (nibble_valid) {
      EXPECT_EQ(nibble_code_lut[nibble], encode_base(b)) << "byte " << byte;
    }
  }
}
