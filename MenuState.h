#ifndef MENU_STATE_H
#define MENU_STATE_H

#include <stdint.h>
#include "Config.h"
#include "Devices.h"

#define ANSI_INVERSE  "\x1b[7m"
#define ANSI_NORMAL   "\x1b[0m"

enum MenuIdx : uint8_t {
  MENU_SHOW_PROX = 0,
  MENU_SHOW_LUX,
  MENU_SET_THRESH,
  MENU_COUNT
};

struct MenuContext;

typedef void (*MenuAction)(MenuContext& ctx);

struct MenuItem {
  const char* name;
  MenuAction  action;
};

extern const MenuItem menuItems[MENU_COUNT];   // ActionManager.cpp

struct MenuState {
  uint8_t selection = MENU_SHOW_PROX;
  int32_t threshold = THRESH_DEFAULT;   // THRESH_MIN..THRESH_MAX
  bool    newline   = true;             // next redraw starts a fresh line
};

/* knob push switch, fires once per click on the pressed -> released edge */
struct ClickEdge {
  bool prev = false;

  bool released(bool click) {
    bool edge = !click && prev;
    prev = click;
    return edge;
  }
};

struct MenuContext {
  MenuContext(KnobDevice& k, ProxSensor& s, StatusPixel& p,
              Console& c, Pacer& pc)
    : knob(k), sensor(s), pixel(p), console(c), pacer(pc) {}

  KnobDevice&  knob;
  ProxSensor&  sensor;
  StatusPixel& pixel;
  Console&     console;
  Pacer&       pacer;

  const MenuItem* items = menuItems;
  uint8_t         itemCount = MENU_COUNT;

  MenuState state;
  ClickEdge mainClick;                  // persists across menuTick() calls
};

inline int32_t clampThreshold(int64_t v) {
  if (v < THRESH_MIN) return THRESH_MIN;
  if (v > THRESH_MAX) return THRESH_MAX;
  return (int32_t)v;
}

#endif
