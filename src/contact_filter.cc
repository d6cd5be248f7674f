// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/contact_filter.h"

#include "middrag/include/logging.h"
#include "middrag/include/util.h"

namespace middrag {

FilteredContacts::FilteredContacts()
    : centroid(MakePoint(0.0, 0.0)),
      velocity(MakePoint(0.0, 0.0)),
      pressure(0.0) {}

bool ContactFilter::IsTouchingPhase(unsigned phase) {
  return phase == MIDDRAG_PHASE_TOUCHING || phase == MIDDRAG_PHASE_ACTIVE;
}

bool ContactFilter::InExclusionZone(const Contact& contact,
                                    const GestureConfiguration& config) {
  return config.exclusion_zone_enabled &&
      contact.position_y < config.exclusion_zone_size;
}

bool ContactFilter::TooLarge(const Contact& contact,
                             const GestureConfiguration& config) {
  return config.contact_size_filter_enabled &&
      contact.z_total > config.max_contact_size;
}

void ContactFilter::Filter(const Contact* contacts,
                           int contact_cnt,
                           const GestureConfiguration& config,
                           FilteredContacts* out) const {
  out->contacts.clear();
  out->centroid = MakePoint(0.0, 0.0);
  out->velocity = MakePoint(0.0, 0.0);
  out->pressure = 0.0;
  if (contact_cnt < 0) {
    Err("Negative contact count %d, treating as empty frame", contact_cnt);
    return;
  }
  if (contact_cnt > 0 && !contacts) {
    Err("Have contact_cnt %d but contacts is NULL!", contact_cnt);
    return;
  }
  for (int i = 0; i < contact_cnt; i++) {
    const Contact& contact = contacts[i];
    if (!IsTouchingPhase(contact.phase))
      continue;
    if (InExclusionZone(contact, config))
      continue;
    if (TooLarge(contact, config))
      continue;
    out->contacts.push_back(contact);
  }
  if (out->contacts.empty())
    return;

  float sum_x = 0.0, sum_y = 0.0, sum_vx = 0.0, sum_vy = 0.0, sum_z = 0.0;
  for (size_t i = 0; i < out->contacts.size(); i++) {
    const Contact& contact = out->contacts[i];
    sum_x += contact.position_x;
    sum_y += contact.position_y;
    sum_vx += contact.velocity_x;
    sum_vy += contact.velocity_y;
    sum_z += contact.z_total;
  }
  float count = static_cast<float>(out->contacts.size());
  out->centroid = MakePoint(sum_x / count, sum_y / count);
  out->velocity = MakePoint(sum_vx / count, sum_vy / count);
  out->pressure = sum_z / count;
}

}  // namespace middrag
