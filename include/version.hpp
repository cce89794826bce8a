#ifndef DIRTY_VERSION_HPP
#define DIRTY_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define DIRTY_VERSION_MAJOR 0
#define DIRTY_VERSION_MINOR 3
#define DIRTY_VERSION_PATCH 0

#define DIRTY_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* DIRTY_VERSION = DIRTY_VERSION_STR;

#endif /* DIRTY_VERSION_HPP */
