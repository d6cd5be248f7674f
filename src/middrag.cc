// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/middrag.h"

#include <vector>

#include <base/strings/stringprintf.h>

#include "middrag/include/activity_log.h"
#include "middrag/include/arbiter_snapshot.h"
#include "middrag/include/contact_filter.h"
#include "middrag/include/drag_delta.h"
#include "middrag/include/event_arbiter.h"
#include "middrag/include/gesture_configuration.h"
#include "middrag/include/gesture_properties.h"
#include "middrag/include/gesture_recognizer.h"
#include "middrag/include/logging.h"
#include "middrag/include/processing_queue.h"
#include "middrag/include/prop_registry.h"
#include "middrag/include/util.h"

using base::StringPrintf;
using std::string;
using std::vector;

// C API:

static const int kMinSupportedVersion = 1;
static const int kMaxSupportedVersion = 1;

// Normalized surface units to pixels for synthesized drags.
static const double kDragPixelScale = 1600.0;

stime_t StimeFromTimeval(const struct timeval* tv) {
  return static_cast<stime_t>(tv->tv_sec) +
      static_cast<stime_t>(tv->tv_usec) / 1000000.0;
}

stime_t StimeFromTimespec(const struct timespec* ts) {
  return static_cast<stime_t>(ts->tv_sec) +
      static_cast<stime_t>(ts->tv_nsec) / 1000000000.0;
}

string Contact::String() const {
  return StringPrintf("(%f, %f) v(%f, %f) z %f axes %f/%f phase %u id %d",
                      position_x, position_y, velocity_x, velocity_y,
                      z_total, major_axis, minor_axis, phase, identifier);
}

string TouchFrame::String() const {
  string ret = StringPrintf("(%f, modifiers 0x%x, %d contacts",
                            timestamp, modifiers, contact_cnt);
  for (int i = 0; contacts && i < contact_cnt; i++) {
    ret += ", ";
    ret += contacts[i].String();
  }
  ret += ")";
  return ret;
}

string GestureEvent::String() const {
  switch (type) {
    case kGestureEventStart:
      return StringPrintf("(GestureEvent type: start time: %f at: %f, %f)",
                          timestamp, details.start.position.x,
                          details.start.position.y);
    case kGestureEventTap:
      return StringPrintf("(GestureEvent type: tap time: %f)", timestamp);
    case kGestureEventBeginDragging:
      return StringPrintf("(GestureEvent type: beginDragging time: %f)",
                          timestamp);
    case kGestureEventUpdateDragging:
      return StringPrintf("(GestureEvent type: updateDragging time: %f "
                          "centroid: %f, %f last: %f, %f fingers: %d)",
                          timestamp, details.drag.centroid.x,
                          details.drag.centroid.y,
                          details.drag.last_position.x,
                          details.drag.last_position.y,
                          details.drag.finger_cnt);
    case kGestureEventEndDragging:
      return StringPrintf("(GestureEvent type: endDragging time: %f)",
                          timestamp);
    case kGestureEventCancel:
      return StringPrintf("(GestureEvent type: cancel time: %f)", timestamp);
    case kGestureEventCancelDragging:
      return StringPrintf("(GestureEvent type: cancelDragging time: %f)",
                          timestamp);
  }
  return "(GestureEvent type: unknown)";
}

bool GestureEvent::operator==(const GestureEvent& that) const {
  if (type != that.type || !middrag::DoubleEq(timestamp, that.timestamp))
    return false;
  switch (type) {
    case kGestureEventStart:
      return middrag::FloatEq(details.start.position.x,
                              that.details.start.position.x) &&
          middrag::FloatEq(details.start.position.y,
                           that.details.start.position.y);
    case kGestureEventUpdateDragging:
      return middrag::FloatEq(details.drag.centroid.x,
                              that.details.drag.centroid.x) &&
          middrag::FloatEq(details.drag.centroid.y,
                           that.details.drag.centroid.y) &&
          middrag::FloatEq(details.drag.last_position.x,
                           that.details.drag.last_position.x) &&
          middrag::FloatEq(details.drag.last_position.y,
                           that.details.drag.last_position.y) &&
          details.drag.finger_cnt == that.details.drag.finger_cnt;
    default:
      return true;
  }
}

bool GestureEvent::IsTerminal() const {
  return type == kGestureEventTap || type == kGestureEventEndDragging ||
      type == kGestureEventCancel || type == kGestureEventCancelDragging;
}

string PointerEvent::String() const {
  return StringPrintf("(PointerEvent type: %d time: %f button: %d "
                      "user-data: 0x%llx modifiers: 0x%x)",
                      type, timestamp, button,
                      static_cast<unsigned long long>(user_data), modifiers);
}

MiddragEngine* NewMiddragEngineImpl(int version) {
  if (version < kMinSupportedVersion) {
    Err("Client too old. It's using version %d"
        ", but library has min supported version %d",
        version,
        kMinSupportedVersion);
    return NULL;
  }
  if (version > kMaxSupportedVersion) {
    Err("Client too new. It's using version %d"
        ", but library has max supported version %d",
        version,
        kMaxSupportedVersion);
    return NULL;
  }
  return new middrag::MiddragEngine(version);
}

void DeleteMiddragEngine(MiddragEngine* obj) {
  delete obj;
}

void MiddragEngineSupplyFrame(MiddragEngine* obj,
                              const struct TouchFrame* frame) {
  AssertWithReturn(obj && frame);
  obj->SupplyFrame(*frame);
}

void MiddragEngineContactFrameCallback(void* user_data,
                                       const struct Contact* contacts,
                                       int contact_cnt,
                                       stime_t timestamp,
                                       unsigned modifiers) {
  MiddragEngine* obj = reinterpret_cast<MiddragEngine*>(user_data);
  AssertWithReturn(obj);
  TouchFrame frame;
  frame.timestamp = timestamp;
  frame.contact_cnt = contact_cnt;
  frame.modifiers = modifiers;
  // The frame is copied before this call returns.
  frame.contacts = const_cast<Contact*>(contacts);
  obj->SupplyFrame(frame);
}

enum ArbiterDecision MiddragEngineArbitratePointerEvent(
    MiddragEngine* obj,
    const struct PointerEvent* event,
    int* reenable_interception) {
  if (reenable_interception)
    *reenable_interception = 0;
  AssertWithReturnValue(obj && event, kArbiterPassThrough);
  bool reenable = false;
  ArbiterDecision ret = obj->ArbitratePointerEvent(*event, &reenable);
  if (reenable_interception)
    *reenable_interception = reenable ? 1 : 0;
  return ret;
}

void MiddragEngineSetCallback(MiddragEngine* obj,
                              MiddragGestureReadyFunction fn,
                              void* client_data) {
  obj->set_callback(fn, client_data);
}

void MiddragEngineSetDragSink(MiddragEngine* obj,
                              const MiddragDragSink* sink,
                              void* data) {
  obj->SetDragSink(sink, data);
}

void MiddragEngineSetHostProvider(MiddragEngine* obj,
                                  const MiddragHostProvider* host,
                                  void* data) {
  obj->SetHostProvider(host, data);
}

void MiddragEngineSetPropProvider(MiddragEngine* obj,
                                  MiddragPropProvider* pp,
                                  void* data) {
  obj->SetPropProvider(pp, data);
}

void MiddragEngineSetEnabled(MiddragEngine* obj, int enabled) {
  obj->SetEnabled(enabled != 0);
}

void MiddragEngineReset(MiddragEngine* obj) {
  obj->Reset();
}

void MiddragEngineForceReleaseStuckDrag(MiddragEngine* obj) {
  obj->ForceReleaseStuckDrag();
}

// C++ API:

namespace middrag {

// Routes queue work and property writes back into the engine, so the engine
// itself exposes neither interface.
class EngineTaskHandler : public ProcessingQueue::Handler,
                          public GestureProperties::Observer {
 public:
  explicit EngineTaskHandler(MiddragEngine* engine) : engine_(engine) {}
  virtual ~EngineTaskHandler() {}

  virtual void HandleTask(const ProcessingTask& task) {
    engine_->HandleTask(task);
  }

  virtual void ConfigurationWritten(const GestureConfiguration& config) {
    engine_->PostConfiguration(config);
  }

 private:
  MiddragEngine* engine_;

  DISALLOW_COPY_AND_ASSIGN(EngineTaskHandler);
};

MiddragEngine::MiddragEngine(int version)
    : callback_(NULL),
      callback_data_(NULL),
      sink_(NULL),
      sink_data_(NULL),
      host_(NULL),
      host_data_(NULL),
      enabled_(true),
      sink_dragging_(false) {
  prop_reg_.reset(new PropRegistry);
  activity_log_.reset(new ActivityLog(prop_reg_.get()));
  prop_reg_->set_activity_log(activity_log_.get());
  snapshot_.reset(new ArbiterSnapshot);
  arbiter_.reset(new EventArbiter);
  config_.reset(new GestureConfiguration);
  contact_filter_.reset(new ContactFilter);
  recognizer_.reset(new GestureRecognizer);
  task_handler_.reset(new EngineTaskHandler(this));
  properties_.reset(new GestureProperties(prop_reg_.get(),
                                          task_handler_.get()));
  queue_.reset(new ProcessingQueue(task_handler_.get(), "MiddragProcessing"));
  queue_->Start();
}

MiddragEngine::~MiddragEngine() {
  queue_->Stop();
  SetPropProvider(NULL, NULL);
  prop_reg_->set_activity_log(NULL);
}

void MiddragEngine::SupplyFrame(const TouchFrame& frame) {
  if (!enabled_.load(std::memory_order_acquire))
    return;
  snapshot_->set_finger_count(frame.contact_cnt > 0 ? frame.contact_cnt : 0);
  queue_->Post(ProcessingTask::FromFrame(frame));
}

ArbiterDecision MiddragEngine::ArbitratePointerEvent(
    const PointerEvent& event,
    bool* reenable_interception) {
  if (!enabled_.load(std::memory_order_acquire)) {
    if (reenable_interception)
      *reenable_interception = false;
    return kArbiterPassThrough;
  }
  ArbiterDecision ret = arbiter_->Arbitrate(event, snapshot_.get(),
                                            reenable_interception);
  if (ret == kArbiterConvertToClick && sink_ && sink_->click_fn)
    sink_->click_fn(sink_data_);
  return ret;
}

void MiddragEngine::SetConfiguration(const GestureConfiguration& config) {
  properties_->FromConfiguration(config);
  PostConfiguration(config);
}

void MiddragEngine::PostConfiguration(const GestureConfiguration& config) {
  snapshot_->SetModifierRequirement(config.require_modifier_key,
                                    config.modifier_key_type);
  ProcessingTask task(ProcessingTask::kConfiguration);
  task.config = config;
  queue_->Post(task);
}

void MiddragEngine::SetDragSink(const MiddragDragSink* sink, void* data) {
  sink_ = sink;
  sink_data_ = data;
}

void MiddragEngine::SetHostProvider(const MiddragHostProvider* host,
                                    void* data) {
  host_ = host;
  host_data_ = data;
}

void MiddragEngine::SetPropProvider(MiddragPropProvider* pp, void* data) {
  prop_reg_->SetPropProvider(pp, data);
}

void MiddragEngine::SetEnabled(bool enabled) {
  if (enabled_.exchange(enabled, std::memory_order_acq_rel) == enabled)
    return;
  Log("Engine %s", enabled ? "enabled" : "disabled");
  snapshot_->Clear();
  snapshot_->set_finger_count(0);
  queue_->Post(ProcessingTask(ProcessingTask::kReset));
}

bool MiddragEngine::enabled() const {
  return enabled_.load(std::memory_order_acquire);
}

void MiddragEngine::Reset() {
  snapshot_->Clear();
  queue_->Post(ProcessingTask(ProcessingTask::kReset));
}

void MiddragEngine::ForceReleaseStuckDrag() {
  Log("Force releasing stuck drag");
  snapshot_->Clear();
  queue_->Post(ProcessingTask(ProcessingTask::kForceRelease));
}

void MiddragEngine::WaitForIdle() {
  queue_->WaitForIdle();
}

string MiddragEngine::EncodeActivityLog() {
  return activity_log_->Encode();
}

void MiddragEngine::HandleTask(const ProcessingTask& task) {
  switch (task.type) {
    case ProcessingTask::kFrame:
      ProcessFrame(task);
      return;
    case ProcessingTask::kConfiguration:
      ApplyConfiguration(task.config);
      return;
    case ProcessingTask::kReset:
      ResetSession();
      return;
    case ProcessingTask::kForceRelease:
      recognizer_->Reset();
      snapshot_->Clear();
      sink_dragging_ = false;
      if (sink_ && sink_->force_release_fn)
        sink_->force_release_fn(sink_data_);
      return;
  }
  Err("Unknown task type %d", static_cast<int>(task.type));
}

void MiddragEngine::ProcessFrame(const ProcessingTask& task) {
  activity_log_->LogTouchFrame(task.timestamp, task.reported_cnt,
                               task.modifiers,
                               task.contacts.empty() ? NULL :
                               &task.contacts[0],
                               task.contacts.size());
  FilteredContacts filtered;
  contact_filter_->Filter(task.contacts.empty() ? NULL : &task.contacts[0],
                          static_cast<int>(task.contacts.size()),
                          *config_, &filtered);
  vector<GestureEvent> events;
  recognizer_->Process(filtered, *config_, task.timestamp, task.modifiers,
                       &events);
  for (size_t i = 0; i < events.size(); i++)
    HandleGestureEvent(events[i]);
}

void MiddragEngine::HandleGestureEvent(const GestureEvent& event) {
  activity_log_->LogGestureEvent(event);
  switch (event.type) {
    case kGestureEventStart:
      HandleStart(event);
      break;
    case kGestureEventTap:
      HandleTap(event);
      break;
    case kGestureEventBeginDragging:
      HandleBeginDragging(event);
      break;
    case kGestureEventUpdateDragging:
      HandleUpdateDragging(event);
      break;
    case kGestureEventEndDragging:
      HandleEndDragging(event);
      break;
    case kGestureEventCancel:  // fall through
    case kGestureEventCancelDragging:
      HandleCancel(event);
      break;
  }
  if (callback_)
    callback_(callback_data_, &event);
}

void MiddragEngine::HandleStart(const GestureEvent& event) {
  if (config_->pass_through_title_bar &&
      OriginInReservedRegion(CursorLocation())) {
    Log("Gesture began in a reserved region, passing through");
    recognizer_->set_pass_through(true);
    snapshot_->set_pass_through(true);
    return;
  }
  snapshot_->set_in_gesture(true);
}

void MiddragEngine::HandleTap(const GestureEvent& event) {
  // The recognizer has already closed the session, so the pass-through flag
  // is read back from the snapshot.
  bool perform = !snapshot_->pass_through() &&
      config_->tap_to_click_enabled &&
      HostAllowsGesture(CursorLocation());
  if (sink_dragging_ && sink_ && sink_->cancel_drag_fn)
    sink_->cancel_drag_fn(sink_data_);
  if (perform && sink_ && sink_->click_fn)
    sink_->click_fn(sink_data_);
  EndSession(event.timestamp, perform);
}

void MiddragEngine::HandleBeginDragging(const GestureEvent& event) {
  // A pass-through session stays flagged until its terminal event, so the
  // arbiter keeps leaving its clicks to the host.
  if (recognizer_->pass_through())
    return;
  if (!config_->middle_drag_enabled) {
    EndSession(event.timestamp, false);
    return;
  }
  GesturePoint at = CursorLocation();
  if (!HostAllowsGesture(at)) {
    Log("Host filters rejected drag at %f, %f", at.x, at.y);
    EndSession(event.timestamp, false);
    return;
  }
  snapshot_->set_actively_dragging(true);
  sink_dragging_ = true;
  if (sink_ && sink_->begin_drag_fn)
    sink_->begin_drag_fn(sink_data_, at);
}

void MiddragEngine::HandleUpdateDragging(const GestureEvent& event) {
  if (!sink_dragging_ || !config_->middle_drag_enabled)
    return;
  double dx = 0.0, dy = 0.0;
  FrameDelta(event.details.drag, *config_, &dx, &dy);
  // Surface y grows upward, screen y grows downward.
  dx *= kDragPixelScale * config_->sensitivity;
  dy *= -kDragPixelScale * config_->sensitivity;
  if ((dx != 0.0 || dy != 0.0) && sink_ && sink_->update_drag_fn)
    sink_->update_drag_fn(sink_data_, dx, dy);
}

void MiddragEngine::HandleEndDragging(const GestureEvent& event) {
  bool was_dragging = sink_dragging_;
  if (was_dragging && sink_ && sink_->end_drag_fn)
    sink_->end_drag_fn(sink_data_);
  EndSession(event.timestamp, was_dragging);
}

void MiddragEngine::HandleCancel(const GestureEvent& event) {
  if (event.type == kGestureEventCancelDragging && sink_dragging_ &&
      sink_ && sink_->cancel_drag_fn)
    sink_->cancel_drag_fn(sink_data_);
  EndSession(event.timestamp, false);
}

void MiddragEngine::EndSession(stime_t when, bool was_active) {
  snapshot_->PublishGestureEnd(when, was_active);
  sink_dragging_ = false;
}

void MiddragEngine::ApplyConfiguration(const GestureConfiguration& config) {
  *config_ = config;
  Log("Configuration: %s", config_->String().c_str());
  activity_log_->LogConfiguration(config);
}

void MiddragEngine::ResetSession() {
  recognizer_->Reset();
  // Frames queued ahead of the reset may have republished session flags.
  snapshot_->Clear();
  if (sink_dragging_ && sink_ && sink_->cancel_drag_fn)
    sink_->cancel_drag_fn(sink_data_);
  sink_dragging_ = false;
}

GesturePoint MiddragEngine::CursorLocation() const {
  if (!host_ || !host_->cursor_location_fn)
    return MakePoint(0.0, 0.0);
  return host_->cursor_location_fn(host_data_);
}

bool MiddragEngine::OriginInReservedRegion(GesturePoint point) const {
  if (!host_ || !host_->in_reserved_region_fn)
    return false;
  return host_->in_reserved_region_fn(host_data_, point,
                                      config_->title_bar_height) != 0;
}

bool MiddragEngine::MeetsMinimumWindowSize(GesturePoint point) const {
  if (!host_ || !host_->meets_minimum_window_size_fn)
    return true;
  return host_->meets_minimum_window_size_fn(
      host_data_, point, config_->minimum_window_width,
      config_->minimum_window_height) != 0;
}

bool MiddragEngine::OverDesktop(GesturePoint point) const {
  if (!host_ || !host_->over_desktop_fn)
    return false;
  return host_->over_desktop_fn(host_data_, point) != 0;
}

bool MiddragEngine::HostAllowsGesture(GesturePoint point) const {
  if (config_->ignore_desktop && OverDesktop(point))
    return false;
  if (config_->minimum_window_size_filter_enabled &&
      !MeetsMinimumWindowSize(point))
    return false;
  return true;
}

}  // namespace middrag
