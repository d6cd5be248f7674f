// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_MIDDRAG_H__
#define MIDDRAG_MIDDRAG_H__

#include <stdint.h>
#include <sys/time.h>

#ifdef __cplusplus
#include <atomic>
#include <memory>
#include <string>

#include <base/macros.h>

extern "C" {
#endif

// C API:

// external logging interface
#define MIDDRAG_LOG_ERROR 0
#define MIDDRAG_LOG_INFO 1

// this function has to be provided by the user of the library.
void middrag_log(int verb, const char* format, ...)
    __attribute__((format(printf, 2, 3)));

typedef double stime_t;  // seconds

stime_t StimeFromTimeval(const struct timeval*);
stime_t StimeFromTimespec(const struct timespec*);

// Touch phases as reported by the sensing hardware. Only TOUCHING and ACTIVE
// contacts are fingers resting on the surface.
#define MIDDRAG_PHASE_NOT_TRACKING 0
#define MIDDRAG_PHASE_STARTING 1
#define MIDDRAG_PHASE_HOVERING 2
#define MIDDRAG_PHASE_TOUCHING 3
#define MIDDRAG_PHASE_ACTIVE 4
#define MIDDRAG_PHASE_LIFTING 5
#define MIDDRAG_PHASE_LINGERING 6
#define MIDDRAG_PHASE_OUT_OF_RANGE 7

// Held modifier keys, as a bit field.
#define MIDDRAG_MODIFIER_NONE 0
#define MIDDRAG_MODIFIER_SHIFT (1 << 0)
#define MIDDRAG_MODIFIER_CONTROL (1 << 1)
#define MIDDRAG_MODIFIER_OPTION (1 << 2)
#define MIDDRAG_MODIFIER_COMMAND (1 << 3)

// position is normalized to [0, 1] in surface space, with y growing upward
// from the bottom edge. velocity is in normalized units per second.
// z_total is the contact size metric reported by the hardware; large values
// are usually a palm. identifier is stable for one physical finger across
// consecutive frames.
struct Contact {
  float position_x;
  float position_y;
  float velocity_x;
  float velocity_y;
  float z_total;
  float major_axis;
  float minor_axis;
  unsigned phase;  // MIDDRAG_PHASE_*
  int identifier;
#ifdef __cplusplus
  std::string String() const;
#endif  // __cplusplus
};

// One frame of touch data. The contacts array is owned by the caller and is
// only valid for the duration of the call it is passed to.
struct TouchFrame {
#ifdef __cplusplus
  std::string String() const;
#endif  // __cplusplus
  stime_t timestamp;
  int contact_cnt;  // A negative count is treated as zero contacts
  unsigned modifiers;  // bit field, use MIDDRAG_MODIFIER_*
  struct Contact* contacts;
};

typedef struct {
  float x, y;
} GesturePoint;

// Gesture sub-structs

typedef struct {
  GesturePoint position;  // centroid of the three fingers
} GestureStart;

typedef struct {
  GesturePoint centroid;
  GesturePoint velocity;  // mean velocity of the valid contacts
  float pressure;  // mean z_total of the valid contacts
  int finger_cnt;
  GesturePoint start_position;
  GesturePoint last_position;  // centroid of the previous processed frame
} GestureData;

enum GestureEventType {
  kGestureEventStart = 0,
  kGestureEventTap,
  kGestureEventBeginDragging,
  kGestureEventUpdateDragging,
  kGestureEventEndDragging,
  kGestureEventCancel,
  kGestureEventCancelDragging,
};

struct GestureEvent {
#ifdef __cplusplus
  GestureEvent() : timestamp(0), type(kGestureEventCancel) {
    details.drag = GestureData();
  }
  GestureEvent(enum GestureEventType type_in, stime_t when)
      : timestamp(when), type(type_in) {
    details.drag = GestureData();
  }
  GestureEvent(const GestureStart& start, stime_t when)
      : timestamp(when), type(kGestureEventStart) {
    details.drag = GestureData();
    details.start = start;
  }
  GestureEvent(const GestureData& data, stime_t when)
      : timestamp(when), type(kGestureEventUpdateDragging) {
    details.drag = data;
  }
  std::string String() const;
  bool operator==(const GestureEvent& that) const;
  bool operator!=(const GestureEvent& that) const { return !(*this == that); }
  // True for tap, endDragging, cancel and cancelDragging.
  bool IsTerminal() const;
#endif  // __cplusplus

  stime_t timestamp;
  enum GestureEventType type;
  union {
    GestureStart start;
    GestureData drag;  // kGestureEventUpdateDragging
  } details;
};

typedef void (*MiddragGestureReadyFunction)(void* client_data,
                                            const struct GestureEvent* event);

// Pointer events as seen by the interception layer.

// Button numbers of the host input stack.
#define MIDDRAG_BUTTON_LEFT 0
#define MIDDRAG_BUTTON_RIGHT 1
#define MIDDRAG_BUTTON_MIDDLE 2

// Marker the drag-synthesis collaborator writes into the user-data field of
// every event it posts ('MD').
#define MIDDRAG_EVENT_TAG 0x4D44

enum PointerEventType {
  kPointerEventButtonDown = 0,
  kPointerEventButtonUp,
  kPointerEventDragged,
  kPointerEventMoved,
  // The host disabled the interception layer.
  kPointerEventInterceptionDisabledByTimeout,
  kPointerEventInterceptionDisabledByUserInput,
};

struct PointerEvent {
#ifdef __cplusplus
  std::string String() const;
#endif  // __cplusplus
  stime_t timestamp;  // same clock as TouchFrame::timestamp
  enum PointerEventType type;
  int button;  // MIDDRAG_BUTTON_* or another host button number
  int64_t user_data;  // MIDDRAG_EVENT_TAG for our own events
  unsigned modifiers;  // bit field, use MIDDRAG_MODIFIER_*
};

enum ArbiterDecision {
  kArbiterPassThrough = 0,
  kArbiterSuppress,
  // The event is suppressed and a middle click was synthesized in its place.
  kArbiterConvertToClick,
};

// Drag Synthesis Sink Interface
// All functions are called from the processing context, except click_fn,
// which is also called from the arbitration context for force clicks.
typedef void (*MiddragSinkBeginDrag)(void* data, GesturePoint at);
typedef void (*MiddragSinkUpdateDrag)(void* data, double dx, double dy);
typedef void (*MiddragSinkAction)(void* data);

typedef struct {
  MiddragSinkBeginDrag begin_drag_fn;
  MiddragSinkUpdateDrag update_drag_fn;
  MiddragSinkAction end_drag_fn;
  MiddragSinkAction cancel_drag_fn;
  MiddragSinkAction click_fn;
  MiddragSinkAction force_release_fn;
} MiddragDragSink;

// Host Environment Interface
// Predicates return non-zero for true. They are queried synchronously from
// the processing context.
typedef GesturePoint (*MiddragHostCursorLocation)(void* data);
typedef int (*MiddragHostInReservedRegion)(void* data, GesturePoint point,
                                           double title_bar_height);
typedef int (*MiddragHostMeetsMinimumWindowSize)(void* data,
                                                 GesturePoint point,
                                                 double min_width,
                                                 double min_height);
typedef int (*MiddragHostOverDesktop)(void* data, GesturePoint point);

typedef struct {
  MiddragHostCursorLocation cursor_location_fn;
  MiddragHostInReservedRegion in_reserved_region_fn;
  MiddragHostMeetsMinimumWindowSize meets_minimum_window_size_fn;
  MiddragHostOverDesktop over_desktop_fn;
} MiddragHostProvider;

// Property Provider Interface
struct MiddragProp;
typedef struct MiddragProp MiddragProp;

typedef int MiddragPropBool;

// These functions create a named property of given type.
//   data - data used by PropProvider
//   loc - location of a variable to be updated by PropProvider.
//   init - initial value for the property.
//          If the PropProvider has an alternate configuration source, it may
//          override this initial value, in which case *loc returns the
//          value from the configuration source.
typedef MiddragProp* (*MiddragPropCreateInt)(void* data, const char* name,
                                             int* loc, const int init);

typedef MiddragProp* (*MiddragPropCreateBool)(void* data, const char* name,
                                              MiddragPropBool* loc,
                                              const MiddragPropBool init);

typedef MiddragProp* (*MiddragPropCreateReal)(void* data, const char* name,
                                              double* loc, const double init);

// A function to call just after a property's value is updated.
// |handler_data| is a local context pointer that can be used by the handler.
typedef void (*MiddragPropSetHandler)(void* handler_data);

// Register a handler to be called right after the host writes a property.
typedef void (*MiddragPropRegisterHandlers)(void* data, MiddragProp* prop,
                                            void* handler_data,
                                            MiddragPropSetHandler setter);

// Free a property.
typedef void (*MiddragPropFree)(void* data, MiddragProp* prop);

typedef struct MiddragPropProvider {
  MiddragPropCreateInt create_int_fn;
  MiddragPropCreateBool create_bool_fn;
  MiddragPropCreateReal create_real_fn;
  MiddragPropRegisterHandlers register_handlers_fn;
  MiddragPropFree free_fn;
} MiddragPropProvider;

#ifdef __cplusplus
// C++ API:

namespace middrag {

class ActivityLog;
class ArbiterSnapshot;
class ContactFilter;
class EngineTaskHandler;
class EventArbiter;
class GestureProperties;
class GestureRecognizer;
class ProcessingQueue;
class PropRegistry;
struct GestureConfiguration;
struct ProcessingTask;

struct MiddragEngine {
 public:
  explicit MiddragEngine(int version);
  ~MiddragEngine();

  // Capture context. Copies the frame, publishes its contact count and
  // queues it for processing. Never blocks on gesture processing.
  void SupplyFrame(const TouchFrame& frame);

  // Arbitration context. Decides what happens to one intercepted pointer
  // event. |reenable_interception| is set to true when the host disabled the
  // interception layer and it must be turned back on.
  ArbiterDecision ArbitratePointerEvent(const PointerEvent& event,
                                        bool* reenable_interception);

  // Replaces the configuration wholesale. Takes effect before the next frame
  // the processing queue handles.
  void SetConfiguration(const GestureConfiguration& config);

  void set_callback(MiddragGestureReadyFunction callback, void* client_data) {
    callback_ = callback;
    callback_data_ = client_data;
  }
  // Collaborator tables are read from the processing and arbitration
  // contexts. Install them before frames and pointer events start flowing.
  void SetDragSink(const MiddragDragSink* sink, void* data);
  void SetHostProvider(const MiddragHostProvider* host, void* data);
  void SetPropProvider(MiddragPropProvider* pp, void* data);

  void SetEnabled(bool enabled);
  bool enabled() const;

  // Returns the session to idle without emitting events.
  void Reset();
  // Clears all gesture flags and asks the sink to release a stuck drag.
  void ForceReleaseStuckDrag();

  // Blocks until every task queued so far has been processed.
  void WaitForIdle();

  const ArbiterSnapshot& snapshot() const { return *snapshot_; }
  PropRegistry* prop_reg() const { return prop_reg_.get(); }

  std::string EncodeActivityLog();

 private:
  friend class EngineTaskHandler;

  // Processing context:
  void HandleTask(const ProcessingTask& task);
  void ProcessFrame(const ProcessingTask& task);
  void HandleGestureEvent(const GestureEvent& event);
  void HandleStart(const GestureEvent& event);
  void HandleTap(const GestureEvent& event);
  void HandleBeginDragging(const GestureEvent& event);
  void HandleUpdateDragging(const GestureEvent& event);
  void HandleEndDragging(const GestureEvent& event);
  void HandleCancel(const GestureEvent& event);
  void EndSession(stime_t when, bool was_active);
  void ApplyConfiguration(const GestureConfiguration& config);
  void ResetSession();

  // Any context. Publishes the hot-path fields of |config| and queues it.
  void PostConfiguration(const GestureConfiguration& config);

  // Host queries with the documented fallbacks for missing providers.
  GesturePoint CursorLocation() const;
  bool OriginInReservedRegion(GesturePoint point) const;
  bool MeetsMinimumWindowSize(GesturePoint point) const;
  bool OverDesktop(GesturePoint point) const;
  // True if the host-side filters allow a tap or drag at |point|.
  bool HostAllowsGesture(GesturePoint point) const;

  MiddragGestureReadyFunction callback_;
  void* callback_data_;

  const MiddragDragSink* sink_;
  void* sink_data_;
  const MiddragHostProvider* host_;
  void* host_data_;

  std::unique_ptr<PropRegistry> prop_reg_;
  std::unique_ptr<GestureProperties> properties_;
  std::unique_ptr<ActivityLog> activity_log_;
  std::unique_ptr<ArbiterSnapshot> snapshot_;
  std::unique_ptr<EventArbiter> arbiter_;
  std::atomic<bool> enabled_;

  // Owned by the processing context.
  std::unique_ptr<GestureConfiguration> config_;
  std::unique_ptr<ContactFilter> contact_filter_;
  std::unique_ptr<GestureRecognizer> recognizer_;
  bool sink_dragging_;

  // Declared last so the worker stops before the state it touches goes away.
  std::unique_ptr<EngineTaskHandler> task_handler_;
  std::unique_ptr<ProcessingQueue> queue_;

  DISALLOW_COPY_AND_ASSIGN(MiddragEngine);
};

}  // namespace middrag

typedef middrag::MiddragEngine MiddragEngine;
#else
struct MiddragEngine;
typedef struct MiddragEngine MiddragEngine;
#endif  // __cplusplus

#define MIDDRAG_VERSION 1
MiddragEngine* NewMiddragEngineImpl(int);
#define NewMiddragEngine() NewMiddragEngineImpl(MIDDRAG_VERSION)

void DeleteMiddragEngine(MiddragEngine*);

void MiddragEngineSupplyFrame(MiddragEngine*, const struct TouchFrame*);

// Signature suitable for hardware APIs whose callback carries a user-data
// pointer. Pass the engine as |user_data|.
void MiddragEngineContactFrameCallback(void* user_data,
                                       const struct Contact* contacts,
                                       int contact_cnt,
                                       stime_t timestamp,
                                       unsigned modifiers);

// Returns an ArbiterDecision. *reenable_interception is set to non-zero when
// the interception layer must be turned back on.
enum ArbiterDecision MiddragEngineArbitratePointerEvent(
    MiddragEngine*, const struct PointerEvent*, int* reenable_interception);

void MiddragEngineSetCallback(MiddragEngine*,
                              MiddragGestureReadyFunction,
                              void*);

// The engine holds a reference to passed tables. Pass NULL to tell the
// engine to stop holding a reference.
void MiddragEngineSetDragSink(MiddragEngine*, const MiddragDragSink*, void*);
void MiddragEngineSetHostProvider(MiddragEngine*,
                                  const MiddragHostProvider*,
                                  void*);
void MiddragEngineSetPropProvider(MiddragEngine*, MiddragPropProvider*, void*);

void MiddragEngineSetEnabled(MiddragEngine*, int enabled);
void MiddragEngineReset(MiddragEngine*);
void MiddragEngineForceReleaseStuckDrag(MiddragEngine*);

#ifdef __cplusplus
}
#endif

#endif  // MIDDRAG_MIDDRAG_H__
