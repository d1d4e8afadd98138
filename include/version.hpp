#ifndef GITPET_VERSION_HPP
#define GITPET_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GITPET_VERSION_MAJOR 0
#define GITPET_VERSION_MINOR 3
#define GITPET_VERSION_PATCH 0

/*
 * Release tag injected by the release workflow.
 * Example format: "2026.10.17-1".
 */
#define GITPET_VERSION_STR "rolling"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITPET_VERSION = GITPET_VERSION_STR;

#endif /* GITPET_VERSION_HPP */
