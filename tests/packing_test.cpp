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

#include <vector>

#include "nucleotide_test_helpers.h"
#include "packing/include/packer.h"

TEST(Packing, known_vectors)
{
  EXPECT_EQ(as_2bit("ACGT"), 0b11100100u);
  EXPECT_EQ(as_2bit("AAAA"), 0b00000000u);
  EXPECT_EQ(as_2bit("TTTT"), 0b11111111u);
  EXPECT_EQ(as_2bit("GGGG"), 0b10101010u);
  EXPECT_EQ(as_2bit("CCCC"), 0b01010101u);
}

TEST(Packing, alignment)
{
  EXPECT_EQ(as_2bit("ACTGGAAAATTTTAAGG"), 0b1010000011111111000000001010110100ull);
  EXPECT_EQ(as_2bit("GATTACA"), 0x4f2u);
}

TEST(Packing, empty_sequence)
{
  EXPECT_EQ(as_2bit(""), 0u);
  EXPECT_EQ(as_2bit(std::vector<uint8_t>()), 0u);
}

TEST(Packing, lowercase)
{
  EXPECT_EQ(as_2bit("acgt"), as_2bit("ACGT"));
  EXPECT_EQ(as_2bit("aCgT"), as_2bit("ACGT"));

  std::mt19937 rng(7);
  for (size_t length = 0; length <= MAX_PACKED_BASES; length++) {
    const std::string seq = random_sequence(length, rng, "ACGTacgt");
    EXPECT_EQ(as_2bit(seq), as_2bit(to_upper(seq))) << seq;
  }
}

TEST(Packing, byte_vector_overload)
{
  const std::vector<uint8_t> seq = {'A', 'C', 'G', 'T'};
  EXPECT_EQ(as_2bit(seq), 0b11100100u);
}

TEST(Packing, full_capacity)
{
  EXPECT_EQ(as_2bit(std::string(32, 'T')), 0xFFFFFFFFFFFFFFFFull);
  EXPECT_EQ(as_2bit(std::string(32, 'A')), 0u);

  std::string acgt;
  for (int i = 0; i < 8; i++) {
    acgt += "ACGT";
  }
  EXPECT_EQ(as_2bit(acgt), 0xe4e4e4e4e4e4e4e4ull);
}

TEST(Packing, invalid_base)
{
  expect_nucleotide_error([]() { as_2bit("ACGN"); }, NucleotideErrorKind::InvalidBase, 'N');
  expect_nucleotide_error([]() { as_2bit("N"); }, NucleotideErrorKind::InvalidBase, 'N');
  expect_nucleotide_error([]() { as_2bit(std::string("AC\0T", 4)); }, NucleotideErrorKind::InvalidBase, 0);
  expect_nucleotide_error([]() { as_2bit("ACGU"); }, NucleotideErrorKind::InvalidBase, 'U');
}

TEST(Packing, invalid_base_reports_first_position)
{
  try {
    as_2bit("ACXGTN");
    FAIL() << "expected NucleotideError";
  }
  catch (const NucleotideError &e) {
    EXPECT_EQ(e.kind(), NucleotideErrorKind::InvalidBase);
    EXPECT_EQ(e.value(), static_cast<size_t>('X'));
    EXPECT_EQ(e.position(), 2u);
    EXPECT_NE(std::string(e.what()).find("'X'"), std::string::npos);
  }
}

TEST(Packing, sequence_too_long)
{
  expect_nucleotide_error(
      []() { as_2bit(std::string(33, 'A')); }, NucleotideErrorKind::SequenceTooLong, 33);
  expect_nucleotide_error(
      []() { as_2bit(std::vector<uint8_t>(100, 'C')); }, NucleotideErrorKind::SequenceTooLong, 100);
}

TEST(Packing, length_checked_before_bases)
{
  expect_nucleotide_error(
      []() { as_2bit(std::string(33, 'N')); }, NucleotideErrorKind::SequenceTooLong, 33);
}

TEST(Packing, error_kind_names)
{
  EXPECT_STREQ(nucleotide_error_kind_name(NucleotideErrorKind::InvalidBase), "InvalidBase");
  EXPECT_STREQ(nucleotide_error_kind_name(NucleotideErrorKind::SequenceTooLong), "SequenceTooLong");
  EXPECT_STREQ(nucleotide_error_kind_name(NucleotideErrorKind::InvalidLength), "InvalidLength");
}
