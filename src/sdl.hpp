#pragma once

// Single SDL include point. LevelForge only uses SDL surfaces for BMP output,
// so SDL never owns main(); SDL_MAIN_HANDLED keeps SDLmain out of the link.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
