// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_PROP_REGISTRY_H__
#define MIDDRAG_PROP_REGISTRY_H__

#include <memory>
#include <set>
#include <string>

#include <base/macros.h>
#include <base/values.h>

#include "middrag/include/logging.h"
#include "middrag/include/middrag.h"

namespace middrag {

class ActivityLog;
class Property;

class PropRegistry {
 public:
  PropRegistry()
      : prop_provider_(NULL),
        prop_provider_data_(NULL),
        activity_log_(NULL) {}

  void Register(Property* prop);
  void Unregister(Property* prop);

  void SetPropProvider(MiddragPropProvider* prop_provider, void* data);
  MiddragPropProvider* PropProvider() const { return prop_provider_; }
  void* PropProviderData() const { return prop_provider_data_; }
  const std::set<Property*>& props() const { return props_; }

  void set_activity_log(ActivityLog* activity_log) {
    activity_log_ = activity_log;
  }
  ActivityLog* activity_log() const { return activity_log_; }

 private:
  MiddragPropProvider* prop_provider_;
  void* prop_provider_data_;
  ActivityLog* activity_log_;
  std::set<Property*> props_;

  DISALLOW_COPY_AND_ASSIGN(PropRegistry);
};

class PropertyDelegate;

class Property {
 public:
  Property(PropRegistry* parent, const char* name)
      : gprop_(NULL), parent_(parent), delegate_(NULL), name_(name) {}
  Property(PropRegistry* parent, const char* name, PropertyDelegate* delegate)
      : gprop_(NULL), parent_(parent), delegate_(delegate), name_(name) {}

  virtual ~Property() {
    if (parent_)
      parent_->Unregister(this);
  }

  void CreateProp();
  virtual void CreatePropImpl() = 0;
  void DestroyProp();

  const char* name() const { return name_; }
  // Returns a newly allocated Value object
  virtual std::unique_ptr<base::Value> NewValue() const = 0;
  // Returns true on success
  virtual bool SetValue(const base::Value& value) = 0;

  static void StaticHandleMiddragPropWritten(void* data) {
    reinterpret_cast<Property*>(data)->HandleMiddragPropWritten();
  }
  virtual void HandleMiddragPropWritten() = 0;

 protected:
  MiddragProp* gprop_;
  PropRegistry* parent_;
  PropertyDelegate* delegate_;

 private:
  const char* name_;
};

class BoolProperty : public Property {
 public:
  BoolProperty(PropRegistry* reg, const char* name, MiddragPropBool val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  BoolProperty(PropRegistry* reg, const char* name, MiddragPropBool val,
               PropertyDelegate* delegate)
      : Property(reg, name, delegate), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual void CreatePropImpl();
  virtual std::unique_ptr<base::Value> NewValue() const;
  virtual bool SetValue(const base::Value& value);
  virtual void HandleMiddragPropWritten();

  MiddragPropBool val_;
};

class DoubleProperty : public Property {
 public:
  DoubleProperty(PropRegistry* reg, const char* name, double val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  DoubleProperty(PropRegistry* reg, const char* name, double val,
                 PropertyDelegate* delegate)
      : Property(reg, name, delegate), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual void CreatePropImpl();
  virtual std::unique_ptr<base::Value> NewValue() const;
  virtual bool SetValue(const base::Value& value);
  virtual void HandleMiddragPropWritten();

  double val_;
};

class IntProperty : public Property {
 public:
  IntProperty(PropRegistry* reg, const char* name, int val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  IntProperty(PropRegistry* reg, const char* name, int val,
              PropertyDelegate* delegate)
      : Property(reg, name, delegate), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual void CreatePropImpl();
  virtual std::unique_ptr<base::Value> NewValue() const;
  virtual bool SetValue(const base::Value& value);
  virtual void HandleMiddragPropWritten();

  int val_;
};

class PropertyDelegate {
 public:
  virtual ~PropertyDelegate() {}
  virtual void BoolWasWritten(BoolProperty* prop) {};
  virtual void DoubleWasWritten(DoubleProperty* prop) {};
  virtual void IntWasWritten(IntProperty* prop) {};
};

}  // namespace middrag

#endif  // MIDDRAG_PROP_REGISTRY_H__
