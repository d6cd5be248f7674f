// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string.h>

#include <map>
#include <string>

#include <base/json/json_writer.h>
#include <base/values.h>
#include <gtest/gtest.h>

#include "middrag/include/activity_log.h"
#include "middrag/include/prop_registry.h"

using base::DictionaryValue;
using std::map;
using std::string;

namespace middrag {

class PropRegistryTest : public ::testing::Test {};

class PropRegistryTestDelegate : public PropertyDelegate {
 public:
  PropRegistryTestDelegate() : call_cnt_(0) {}
  virtual void BoolWasWritten(BoolProperty* prop) { call_cnt_++; };
  virtual void DoubleWasWritten(DoubleProperty* prop) { call_cnt_++; };
  virtual void IntWasWritten(IntProperty* prop) { call_cnt_++; }

  int call_cnt_;
};

namespace {
string ValueForProperty(const Property& prop) {
  DictionaryValue temp;
  temp.Set("tempkey", prop.NewValue());
  string ret;
  base::JSONWriter::Write(temp, &ret);
  return ret;
}

// A host settings store that overrides "Override Me" and remembers what it
// was asked to create and free.
struct FakeStore {
  FakeStore() : handler_data(NULL), handler(NULL), free_cnt(0) {}
  map<string, double*> reals;
  void* handler_data;
  MiddragPropSetHandler handler;
  int free_cnt;
};

MiddragProp* FakeCreateReal(void* data, const char* name, double* loc,
                            const double init) {
  FakeStore* store = reinterpret_cast<FakeStore*>(data);
  store->reals[name] = loc;
  if (strcmp(name, "Override Me") == 0)
    *loc = 42.0;
  return reinterpret_cast<MiddragProp*>(loc);
}

void FakeRegisterHandlers(void* data, MiddragProp* prop, void* handler_data,
                          MiddragPropSetHandler setter) {
  FakeStore* store = reinterpret_cast<FakeStore*>(data);
  store->handler_data = handler_data;
  store->handler = setter;
}

void FakeFree(void* data, MiddragProp* prop) {
  reinterpret_cast<FakeStore*>(data)->free_cnt++;
}
}  // namespace {}

TEST(PropRegistryTest, SimpleTest) {
  PropRegistry reg;
  PropRegistryTestDelegate delegate;

  int expected_call_cnt = 0;
  BoolProperty bp1(&reg, "hi", false, &delegate);
  EXPECT_TRUE(strstr(ValueForProperty(bp1).c_str(), "false"));
  bp1.HandleMiddragPropWritten();
  EXPECT_EQ(++expected_call_cnt, delegate.call_cnt_);

  BoolProperty bp2(&reg, "hi", true);
  EXPECT_TRUE(strstr(ValueForProperty(bp2).c_str(), "true"));
  bp2.HandleMiddragPropWritten();
  EXPECT_EQ(expected_call_cnt, delegate.call_cnt_);

  DoubleProperty dp1(&reg, "hi", 2721.0, &delegate);
  EXPECT_TRUE(strstr(ValueForProperty(dp1).c_str(), "2721"));
  dp1.HandleMiddragPropWritten();
  EXPECT_EQ(++expected_call_cnt, delegate.call_cnt_);

  DoubleProperty dp2(&reg, "hi", 3.1);
  EXPECT_TRUE(strstr(ValueForProperty(dp2).c_str(), "3.1"));
  dp2.HandleMiddragPropWritten();
  EXPECT_EQ(expected_call_cnt, delegate.call_cnt_);

  IntProperty ip1(&reg, "hi", 567, &delegate);
  EXPECT_TRUE(strstr(ValueForProperty(ip1).c_str(), "567"));
  ip1.HandleMiddragPropWritten();
  EXPECT_EQ(++expected_call_cnt, delegate.call_cnt_);

  IntProperty ip2(&reg, "hi", 568);
  EXPECT_TRUE(strstr(ValueForProperty(ip2).c_str(), "568"));
  ip2.HandleMiddragPropWritten();
  EXPECT_EQ(expected_call_cnt, delegate.call_cnt_);
}

TEST(PropRegistryTest, SetValueTest) {
  PropRegistry reg;
  BoolProperty bp(&reg, "bool", false);
  DoubleProperty dp(&reg, "double", 1.0);
  IntProperty ip(&reg, "int", 1);

  EXPECT_TRUE(bp.SetValue(base::Value(true)));
  EXPECT_TRUE(bp.val_);
  EXPECT_FALSE(bp.SetValue(base::Value(3)));

  EXPECT_TRUE(dp.SetValue(base::Value(2.5)));
  EXPECT_DOUBLE_EQ(2.5, dp.val_);
  // Integers are accepted for doubles.
  EXPECT_TRUE(dp.SetValue(base::Value(4)));
  EXPECT_DOUBLE_EQ(4.0, dp.val_);
  EXPECT_FALSE(dp.SetValue(base::Value(true)));

  EXPECT_TRUE(ip.SetValue(base::Value(7)));
  EXPECT_EQ(7, ip.val_);
  EXPECT_FALSE(ip.SetValue(base::Value(7.5)));
  EXPECT_EQ(7, ip.val_);
}

TEST(PropRegistryTest, PropChangeTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  reg.set_activity_log(&log);

  DoubleProperty dp(&reg, "hi", 1234.0, NULL);
  EXPECT_EQ(0, log.size());
  dp.HandleMiddragPropWritten();
  EXPECT_EQ(1, log.size());
  ActivityLog::Entry* entry = log.GetEntry(0);
  EXPECT_EQ(ActivityLog::kPropChange, entry->type);
  EXPECT_EQ(ActivityLog::PropChangeEntry::kDoubleProp,
            entry->details.prop_change.type);
  EXPECT_DOUBLE_EQ(1234.0, entry->details.prop_change.value.double_val);
}

TEST(PropRegistryTest, PropProviderTest) {
  FakeStore store;
  MiddragPropProvider provider = {
    NULL,  // create_int_fn
    NULL,  // create_bool_fn
    FakeCreateReal,
    FakeRegisterHandlers,
    FakeFree
  };
  PropRegistry reg;
  PropRegistryTestDelegate delegate;
  DoubleProperty plain(&reg, "Plain", 1.0, &delegate);
  DoubleProperty overridden(&reg, "Override Me", 2.0, &delegate);
  EXPECT_TRUE(store.reals.empty());

  reg.SetPropProvider(&provider, &store);
  ASSERT_EQ(2, store.reals.size());
  EXPECT_EQ(&plain.val_, store.reals["Plain"]);
  // The store's value replaces the initial one and counts as a write.
  EXPECT_DOUBLE_EQ(42.0, overridden.val_);
  EXPECT_EQ(1, delegate.call_cnt_);

  // The host writes through the location, then calls the handler.
  ASSERT_TRUE(store.handler);
  *store.reals["Override Me"] = 7.0;
  store.handler(store.handler_data);
  EXPECT_EQ(2, delegate.call_cnt_);

  reg.SetPropProvider(NULL, NULL);
  EXPECT_EQ(2, store.free_cnt);
}

}  // namespace middrag
