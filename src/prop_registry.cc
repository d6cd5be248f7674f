// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/prop_registry.h"

#include <set>
#include <string>

#include <base/values.h>

#include "middrag/include/activity_log.h"
#include "middrag/include/middrag.h"

using base::Value;
using std::set;
using std::string;
using std::unique_ptr;

namespace middrag {

void PropRegistry::Register(Property* prop) {
  props_.insert(prop);
  if (prop_provider_)
    prop->CreateProp();
}

void PropRegistry::Unregister(Property* prop) {
  if (props_.erase(prop) != 1)
    Err("Unregister failed?");
  if (prop_provider_)
    prop->DestroyProp();
}

void PropRegistry::SetPropProvider(MiddragPropProvider* prop_provider,
                                   void* data) {
  if (prop_provider_ == prop_provider)
    return;
  if (prop_provider_) {
    for (set<Property*>::iterator it = props_.begin(), e = props_.end();
         it != e; ++it)
      (*it)->DestroyProp();
  }
  prop_provider_ = prop_provider;
  prop_provider_data_ = data;
  if (prop_provider_)
    for (set<Property*>::iterator it = props_.begin(), e = props_.end();
         it != e; ++it)
      (*it)->CreateProp();
}

void Property::CreateProp() {
  if (gprop_)
    Err("Property already created");
  CreatePropImpl();
  if (parent_ && gprop_ && parent_->PropProvider()->register_handlers_fn) {
    parent_->PropProvider()->register_handlers_fn(
        parent_->PropProviderData(),
        gprop_,
        this,
        &StaticHandleMiddragPropWritten);
  }
}

void Property::DestroyProp() {
  if (!gprop_) {
    Err("gprop_ already freed!");
    return;
  }
  if (parent_->PropProvider()->free_fn)
    parent_->PropProvider()->free_fn(parent_->PropProviderData(), gprop_);
  gprop_ = NULL;
}

void BoolProperty::CreatePropImpl() {
  MiddragPropBool orig_val = val_;
  AssertWithReturn(parent_->PropProvider()->create_bool_fn);
  gprop_ = parent_->PropProvider()->create_bool_fn(
      parent_->PropProviderData(),
      name(),
      &val_,
      val_);
  if (delegate_ && orig_val != val_)
    delegate_->BoolWasWritten(this);
}

unique_ptr<Value> BoolProperty::NewValue() const {
  return unique_ptr<Value>(new Value(val_ != 0));
}

bool BoolProperty::SetValue(const Value& value) {
  if (!value.is_bool())
    return false;
  val_ = static_cast<MiddragPropBool>(value.GetBool());
  return true;
}

void BoolProperty::HandleMiddragPropWritten() {
  if (parent_ && parent_->activity_log()) {
    ActivityLog::PropChangeEntry entry = {
      name(), ActivityLog::PropChangeEntry::kBoolProp, { 0 }
    };
    entry.value.bool_val = val_;
    parent_->activity_log()->LogPropChange(entry);
  }
  if (delegate_)
    delegate_->BoolWasWritten(this);
}

void DoubleProperty::CreatePropImpl() {
  double orig_val = val_;
  AssertWithReturn(parent_->PropProvider()->create_real_fn);
  gprop_ = parent_->PropProvider()->create_real_fn(
      parent_->PropProviderData(),
      name(),
      &val_,
      val_);
  if (delegate_ && orig_val != val_)
    delegate_->DoubleWasWritten(this);
}

unique_ptr<Value> DoubleProperty::NewValue() const {
  return unique_ptr<Value>(new Value(val_));
}

bool DoubleProperty::SetValue(const Value& value) {
  if (!value.is_double() && !value.is_int())
    return false;
  val_ = value.GetDouble();
  return true;
}

void DoubleProperty::HandleMiddragPropWritten() {
  if (parent_ && parent_->activity_log()) {
    ActivityLog::PropChangeEntry entry = {
      name(), ActivityLog::PropChangeEntry::kDoubleProp, { 0 }
    };
    entry.value.double_val = val_;
    parent_->activity_log()->LogPropChange(entry);
  }
  if (delegate_)
    delegate_->DoubleWasWritten(this);
}

void IntProperty::CreatePropImpl() {
  int orig_val = val_;
  AssertWithReturn(parent_->PropProvider()->create_int_fn);
  gprop_ = parent_->PropProvider()->create_int_fn(
      parent_->PropProviderData(),
      name(),
      &val_,
      val_);
  if (delegate_ && orig_val != val_)
    delegate_->IntWasWritten(this);
}

unique_ptr<Value> IntProperty::NewValue() const {
  return unique_ptr<Value>(new Value(val_));
}

bool IntProperty::SetValue(const Value& value) {
  if (!value.is_int())
    return false;
  val_ = value.GetInt();
  return true;
}

void IntProperty::HandleMiddragPropWritten() {
  if (parent_ && parent_->activity_log()) {
    ActivityLog::PropChangeEntry entry = {
      name(), ActivityLog::PropChangeEntry::kIntProp, { 0 }
    };
    entry.value.int_val = val_;
    parent_->activity_log()->LogPropChange(entry);
  }
  if (delegate_)
    delegate_->IntWasWritten(this);
}

}  // namespace middrag
