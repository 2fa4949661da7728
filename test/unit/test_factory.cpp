#include <gtest/gtest.h>

#include "chips/factory.h"
#include "chips/gate.h"
#include "chips/generator.h"
#include "chips/memory.h"

using namespace breadsim;
using std::chrono::nanoseconds;

TEST(ChipFactory, BuildsEveryCatalogType) {
  for (const GateSpec* spec : GateCatalog()) {
    auto chip = BuildBuiltinChip(spec->type_tag);
    ASSERT_NE(chip, nullptr) << spec->type_tag;
    EXPECT_EQ(chip->TypeTag(), spec->type_tag);
  }
  for (auto tag :
       {Generator::kTypeTag, Ram256B::kTypeTag, Rom256B::kTypeTag}) {
    auto chip = BuildBuiltinChip(tag);
    ASSERT_NE(chip, nullptr) << tag;
    EXPECT_EQ(chip->TypeTag(), tag);
  }
}

TEST(ChipFactory, UnknownTagBuildsNothing) {
  EXPECT_EQ(BuildBuiltinChip("vendor::Mystery"), nullptr);
  EXPECT_EQ(BuildBuiltinChip(""), nullptr);
  EXPECT_EQ(MakeBuiltinChipFactory(1)("vendor::Mystery"), nullptr);
}

TEST(ChipFactory, SeededFactoryIsReproducible) {
  auto first = MakeBuiltinChipFactory(99);
  auto second = MakeBuiltinChipFactory(99);
  auto a = first(Ram256B::kTypeTag);
  auto b = second(Ram256B::kTypeTag);
  for (auto* chip : {a.get(), b.get()}) {
    chip->GetPin(ram256b::kGnd)->state = State::kLow;
    chip->GetPin(ram256b::kVcc)->state = State::kHigh;
    chip->Run(nanoseconds(1));
  }
  EXPECT_EQ(static_cast<Ram256B*>(a.get())->Contents(),
            static_cast<Ram256B*>(b.get())->Contents());
}
