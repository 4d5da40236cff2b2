#ifndef GITGLOBAL_VERSION_HPP
#define GITGLOBAL_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GITGLOBAL_VERSION_MAJOR 0
#define GITGLOBAL_VERSION_MINOR 6
#define GITGLOBAL_VERSION_PATCH 7

/*
 * Release tag; overridden by the build when packaging.
 */
#ifndef GITGLOBAL_VERSION_STR
#define GITGLOBAL_VERSION_STR "0.6.7"
#endif
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITGLOBAL_VERSION = GITGLOBAL_VERSION_STR;

#endif /* GITGLOBAL_VERSION_HPP */
