#include "EncoderManager.h"

KnobSample readKnob(MenuContext& ctx)
{
  KnobSample s;
  s.click = ctx.knob.clicked();
  s.delta = ctx.knob.delta();
  return s;
}

void selectBy(MenuContext& ctx, int32_t delta)
{
  if (ctx.itemCount == 0) return;

  int64_t limit = ctx.itemCount - 1;
  int64_t sel   = (int64_t)ctx.state.selection + delta;
  if (sel < 0)     sel = 0;
  if (sel > limit) sel = limit;
  ctx.state.selection = (uint8_t)sel;
}

void nudgeThreshold(MenuContext& ctx, int32_t delta)
{
  ctx.state.threshold = clampThreshold((int64_t)ctx.state.threshold + delta);
}
