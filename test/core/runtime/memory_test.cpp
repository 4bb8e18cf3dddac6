/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/memory.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/runtime/memory.hpp"

using lapphost::Buffer;
using lapphost::common::toBuffer;
using lapphost::runtime::kMemoryPageSize;
using lapphost::runtime::MemoryError;
using lapphost::runtime::PtrSize;
using lapphost::runtime::TestMemory;
using lapphost::runtime::WasmSize;

TEST(PtrSizeTest, PointerInHighBits) {
  PtrSize ptr_size{0x11223344, 0x55};
  EXPECT_EQ(ptr_size.combine(), 0x1122334400000055ull);
  EXPECT_EQ(PtrSize{0x1122334400000055ull}, ptr_size);
}

/**
 * @given lapp memory
 * @when a buffer is stored and loaded back
 * @then the same bytes are returned
 */
TEST(MemoryTest, StoreLoad) {
  TestMemory test;
  auto bytes = toBuffer("some payload");
  EXPECT_OUTCOME_TRUE(span, test.memory().storeBuffer(bytes));
  EXPECT_EQ(PtrSize{span}.size, bytes.size());
  EXPECT_OUTCOME_TRUE(loaded, test.memory().load(span));
  EXPECT_EQ(loaded, bytes);
}

TEST(MemoryTest, StoreEmpty) {
  TestMemory test;
  EXPECT_OUTCOME_TRUE(span, test.memory().storeBuffer(Buffer{}));
  EXPECT_OUTCOME_TRUE(loaded, test.memory().load(span));
  EXPECT_TRUE(loaded.empty());
}

/**
 * @given lapp memory of one page
 * @when a region crossing its end is read
 * @then OUT_OF_BOUNDS is returned
 */
TEST(MemoryTest, OutOfBounds) {
  TestMemory test;
  auto size = static_cast<WasmSize>(test.memory().size());
  EXPECT_EQ(size, kMemoryPageSize);
  EXPECT_EC(test.memory().loadN(size - 4, 8), MemoryError::OUT_OF_BOUNDS);
  EXPECT_EC(test.memory().load(PtrSize{0xFFFFFFF0, 0x20}.combine()),
            MemoryError::OUT_OF_BOUNDS);
  EXPECT_EC(test.memory().storeBuffer(size, toBuffer("x")),
            MemoryError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_TRUE_1(test.memory().loadN(size - 8, 8));
}

/**
 * @given a buffer allocated in lapp memory
 * @when the host takes it
 * @then the region is handed back to the lapp allocator
 */
TEST(MemoryTest, TakeDeallocates) {
  TestMemory test;
  auto span = test.store(toBuffer("result"));
  EXPECT_EQ(test.allocated.size(), 1);
  EXPECT_OUTCOME_TRUE(taken, test.memory().take(span));
  EXPECT_EQ(taken, toBuffer("result"));
  EXPECT_TRUE(test.allocated.empty());
}

TEST(MemoryTest, TakeWithoutDealloc) {
  TestMemory test{false};
  auto span = test.store(toBuffer("result"));
  EXPECT_OUTCOME_TRUE_1(test.memory().take(span));
  EXPECT_EQ(test.allocated.size(), 1);
}

TEST(MemoryTest, AllocatorFailure) {
  TestMemory test;
  test.fail_allocation = true;
  EXPECT_EC(test.memory().storeBuffer(toBuffer("data")),
            MemoryError::ALLOCATOR_FAILED);
}

TEST(MemoryTest, DecodeFailure) {
  TestMemory test;
  // compact length prefix of 63 bytes with nothing after it
  auto span = test.store(Buffer{0xFC});
  EXPECT_EC(test.memory().loadDecoded<std::string>(span),
            MemoryError::DECODE_FAILED);
}

TEST(MemoryTest, EncodedRoundTrip) {
  TestMemory test;
  std::optional<std::string> value{"error message"};
  auto span = test.storeEncoded(value);
  EXPECT_OUTCOME_TRUE(decoded,
                      test.memory().takeDecoded<std::optional<std::string>>(span));
  EXPECT_EQ(decoded, value);
}

/**
 * @given a provider whose memory was reset, as after instance teardown
 * @when the bridge is requested
 * @then MEMORY_NOT_READY is returned
 */
TEST(MemoryTest, ProviderReset) {
  TestMemory test;
  EXPECT_TRUE(test.provider->getCurrentMemory());
  test.provider->resetMemory();
  EXPECT_FALSE(test.provider->getCurrentMemory());
  EXPECT_EC(test.provider->memory(), MemoryError::MEMORY_NOT_READY);
}
