#ifndef ENCODER_MANAGER_H
#define ENCODER_MANAGER_H

#include <stdint.h>
#include "MenuState.h"

/* one knob sample: button level and detents since the last sample */
struct KnobSample {
  bool    click;
  int32_t delta;
};

KnobSample readKnob(MenuContext& ctx);

/* move the highlight by delta items, clamped to the menu (no wrap) */
void selectBy(MenuContext& ctx, int32_t delta);

/* threshold += delta, clamped to THRESH_MIN..THRESH_MAX */
void nudgeThreshold(MenuContext& ctx, int32_t delta);

#endif
