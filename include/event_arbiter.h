// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_EVENT_ARBITER_H_
#define MIDDRAG_EVENT_ARBITER_H_

#include <base/macros.h>

#include "middrag/include/arbiter_snapshot.h"
#include "middrag/include/middrag.h"

namespace middrag {

// Decides, for each pointer event the interception layer sees, whether it
// reaches the rest of the system. Runs on the arbitration context, reads
// only the snapshot and never waits.
//
// In order:
//  - Events telling us the host disabled interception pass, and ask for the
//    interception to be turned back on.
//  - Our own synthesized middle-button events pass.
//  - A physical left click made while three or more fingers rest on the
//    surface becomes a synthesized middle click: the down is converted and
//    the up is suppressed. Not during an active drag or a pass-through
//    session.
//  - Non-middle events are suppressed while a gesture is active, and for a
//    short window after a gesture that ended in a tap or a completed drag.
//  - Everything else passes.

class EventArbiter {
 public:
  EventArbiter() {}

  // Records the conversion time in |snapshot| when it returns
  // kArbiterConvertToClick; the caller synthesizes the click. A NULL
  // |snapshot| passes the event through.
  ArbiterDecision Arbitrate(const PointerEvent& event,
                            ArbiterSnapshot* snapshot,
                            bool* reenable_interception) const;

  static const stime_t kPostGestureSuppressWindow;

 private:
  DISALLOW_COPY_AND_ASSIGN(EventArbiter);
};

const char* ArbiterDecisionName(ArbiterDecision decision);

}  // namespace middrag

#endif  // MIDDRAG_EVENT_ARBITER_H_
