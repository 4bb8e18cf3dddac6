/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/module_factory_impl.hpp"

#include <gtest/gtest.h>

#include "runtime/common/memory_error.hpp"
#include "runtime/memory_provider.hpp"
#include "runtime/module.hpp"
#include "runtime/module_instance.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using lapphost::Buffer;
using lapphost::runtime::HostFunction;
using lapphost::runtime::HostImports;
using lapphost::runtime::kMemoryPageSize;
using lapphost::runtime::MemoryError;
using lapphost::runtime::MemoryProvider;
using lapphost::runtime::ModuleInstance;
using lapphost::runtime::PtrSize;
using lapphost::runtime::WasmSpan;
using lapphost::runtime::WasmValue;
using lapphost::runtime::wasm_edge::ModuleFactoryImpl;

namespace {
  // (module (import "env" "db_execute" (func (param i64) (result i64))))
  const Buffer kImportsDbExecute{
      0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,  // header
      0x01, 0x06, 0x01, 0x60, 0x01, 0x7e, 0x01, 0x7e,  // type
      0x02, 0x12, 0x01, 0x03, 0x65, 0x6e, 0x76, 0x0a,  // import
      0x64, 0x62, 0x5f, 0x65, 0x78, 0x65, 0x63, 0x75,
      0x74, 0x65, 0x00, 0x00,
  };

  // (module (memory (export "memory") 1)
  //         (func (export "answer") (result i64) i64.const 42))
  const Buffer kAnswer{
      0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,  // header
      0x01, 0x05, 0x01, 0x60, 0x00, 0x01, 0x7e,        // type
      0x03, 0x02, 0x01, 0x00,                          // function
      0x05, 0x03, 0x01, 0x00, 0x01,                    // memory
      0x07, 0x13, 0x02, 0x06, 0x6d, 0x65, 0x6d, 0x6f,  // export
      0x72, 0x79, 0x02, 0x00, 0x06, 0x61, 0x6e, 0x73,
      0x77, 0x65, 0x72, 0x00, 0x00,
      0x0a, 0x06, 0x01, 0x04, 0x00, 0x42, 0x2a, 0x0b,  // code
  };
}  // namespace

class WasmEdgeModuleFactoryTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  ModuleFactoryImpl factory_;
  std::shared_ptr<MemoryProvider> provider_ =
      std::make_shared<MemoryProvider>();
};

TEST_F(WasmEdgeModuleFactoryTest, InvalidCode) {
  auto res = factory_.make(Buffer{0x00, 0x61, 0x73, 0x6d, 0xff});
  EXPECT_FALSE(res);
}

/**
 * @given a module exporting memory and a function
 * @when it is instantiated and the function is invoked
 * @then the result is returned and the memory bridge lives as long as the
 * instance
 */
TEST_F(WasmEdgeModuleFactoryTest, InstantiateAndInvoke) {
  EXPECT_OUTCOME_TRUE(wasm_module, factory_.make(kAnswer));
  {
    EXPECT_OUTCOME_TRUE(instance, wasm_module->instantiate({}, provider_));
    EXPECT_TRUE(instance->hasExport("answer"));
    EXPECT_FALSE(instance->hasExport("alloc"));
    EXPECT_OUTCOME_TRUE(result, instance->invoke("answer", {}));
    EXPECT_EQ(result, std::optional<WasmValue>{42});

    const std::array<WasmValue, 1> extra{1};
    EXPECT_EC(instance->invoke("answer", extra),
              ModuleInstance::Error::INVALID_SIGNATURE);
    EXPECT_EC(instance->invoke("absent", {}),
              ModuleInstance::Error::EXPORT_NOT_FOUND);

    auto memory = provider_->getCurrentMemory();
    ASSERT_TRUE(memory);
    EXPECT_EQ(memory->get().size(), kMemoryPageSize);
    EXPECT_OUTCOME_TRUE(tail, memory->get().loadN(kMemoryPageSize - 4, 4));
    EXPECT_EQ(tail.size(), 4);
    EXPECT_EC(memory->get().loadN(kMemoryPageSize - 4, 8),
              MemoryError::OUT_OF_BOUNDS);
    EXPECT_EC(memory->get().load(PtrSize{0xFFFFFFF0, 0x20}.combine()),
              MemoryError::OUT_OF_BOUNDS);
  }
  EXPECT_FALSE(provider_->getCurrentMemory());
}

/**
 * @given a module importing `db_execute`
 * @when it is instantiated without that import
 * @then instantiation fails instead of a later call
 */
TEST_F(WasmEdgeModuleFactoryTest, MissingImportFailsInstantiation) {
  EXPECT_OUTCOME_TRUE(wasm_module, factory_.make(kImportsDbExecute));
  EXPECT_FALSE(wasm_module->instantiate({}, provider_));

  HostImports imports;
  imports.functions.push_back(HostFunction::make<WasmSpan, WasmSpan>(
      "db_execute", [](WasmSpan span) { return span; }));
  EXPECT_OUTCOME_TRUE_1(wasm_module->instantiate(std::move(imports), provider_));
}
