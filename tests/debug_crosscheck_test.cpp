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

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "nucleotide_test_helpers.h"
#include "packing/include/packer.h"
#include "packing/include/scalar-pack.h"

/* Registered with BITNUC_DEBUG=1 and BITNUC_DEBUG_FILE in its environment, so
 * every pack below also runs the scalar comparison inside the dispatcher. */
class DebugCrossCheck : public testing::TestWithParam<PackBackend> {
 protected:
  void SetUp() override
  {
    ASSERT_TRUE(is_debug_enabled()) << "run this suite with BITNUC_DEBUG=1";
  }
};

TEST_P(DebugCrossCheck, valid_inputs_agree)
{
  std::mt19937 rng(0x2b17u);
  testing::internal::CaptureStdout();
  for (size_t len = 0; len <= MAX_PACKED_BASES; len++) {
    const std::string seq = random_sequence(len, rng, "ACGTacgt");
    const PackResult reference = scalar_pack_2bit(reinterpret_cast<const uint8_t *>(seq.data()),
                                                  seq.size());
    EXPECT_EQ(as_2bit_with(GetParam(), seq), reference.packed) << seq;
  }
  const std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out.find("MISMATCH DETECTED"), std::string::npos) << out;
  EXPECT_NE(out.find(std::string("Explicit ") + backend_name(GetParam()) + " pack"),
            std::string::npos)
      << out;
}

TEST_P(DebugCrossCheck, invalid_inputs_agree)
{
  testing::internal::CaptureStdout();
  for (size_t pos = 0; pos < MAX_PACKED_BASES; pos++) {
    std::string seq(MAX_PACKED_BASES, 'C');
    seq[pos] = 'N';
    try {
      as_2bit_with(GetParam(), seq);
      ADD_FAILURE() << "expected InvalidBase at " << pos;
    }
    catch (const NucleotideError &e) {
      EXPECT_EQ(e.kind(), NucleotideErrorKind::InvalidBase);
      EXPECT_EQ(e.value(), static_cast<size_t>('N'));
      EXPECT_EQ(e.position(), pos);
    }
  }
  const std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out.find("MISMATCH DETECTED"), std::string::npos) << out;
}

INSTANTIATE_TEST_SUITE_P(RunnableBackends,
                         DebugCrossCheck,
                         testing::ValuesIn(runnable_backends()),
                         [](const testing::TestParamInfo<PackBackend> &info) {
                           return std::string(backend_name(info.param));
                         });

TEST(DebugLog, file_sink_receives_lines)
{
  const char *path = std::getenv("BITNUC_DEBUG_FILE");
  if (path == nullptr) {
    GTEST_SKIP() << "BITNUC_DEBUG_FILE is not set";
  }
  ASSERT_STREQ(debug_log_path(), path);

  testing::internal::CaptureStdout();
  EXPECT_EQ(as_2bit_with(PackBackend::Scalar, "ACGT"), 0b11100100u);
  testing::internal::GetCapturedStdout();

  std::ifstream logfile(path);
  ASSERT_TRUE(logfile.is_open()) << path;
  std::stringstream contents;
  contents << logfile.rdbuf();
  EXPECT_NE(contents.str().find("DEBUG bitnuc: Explicit scalar pack of 4 bytes"), std::string::npos);
}
