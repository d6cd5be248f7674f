// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_CONTACT_FILTER_H_
#define MIDDRAG_CONTACT_FILTER_H_

#include <vector>

#include <base/macros.h>

#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"

namespace middrag {

// The contacts of one frame that count as fingers, plus the aggregates the
// state machine needs. Aggregates are zero when there are no contacts.
struct FilteredContacts {
  FilteredContacts();

  int count() const { return static_cast<int>(contacts.size()); }

  std::vector<Contact> contacts;
  GesturePoint centroid;
  GesturePoint velocity;  // mean
  float pressure;  // mean z_total
};

// This filter decides which raw contacts are fingers resting on the surface.
// A contact survives if its phase is touching or active, and it is outside
// the exclusion zone and no larger than the maximum contact size when those
// filters are enabled. The filters are independent.

class ContactFilter {
 public:
  ContactFilter() {}

  // Fills |out| from |contact_cnt| entries of |contacts|. A negative count or
  // a NULL array yields an empty result.
  void Filter(const Contact* contacts,
              int contact_cnt,
              const GestureConfiguration& config,
              FilteredContacts* out) const;

  static bool IsTouchingPhase(unsigned phase);
  // Returns true if |contact| is inside the bottom exclusion band.
  static bool InExclusionZone(const Contact& contact,
                              const GestureConfiguration& config);
  // Returns true if |contact| is too large to be a finger.
  static bool TooLarge(const Contact& contact,
                       const GestureConfiguration& config);

 private:
  DISALLOW_COPY_AND_ASSIGN(ContactFilter);
};

}  // namespace middrag

#endif  // MIDDRAG_CONTACT_FILTER_H_
