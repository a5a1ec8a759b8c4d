#pragma once

// NEJ_VERSION_STRING is set via CMake from the project version.
#ifndef NEJ_VERSION_STRING
#define NEJ_VERSION_STRING "0.1.0"
#endif
