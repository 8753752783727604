/* Copyright 2023 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
// Simple printf() logging module.
//
// Before including this header, the module should #define modname_MODULE to be its filename.
// For example debug_mailbox.cpp has this:
//  #define MAILBOX_MODULE "debug_mailbox.cpp"
//  #include "logging.h"
// The currently supported modules are:
//  PIPELINE_MODULE (task_pipeline.cpp)
//  ACCESS_PORT_MODULE (access_port.cpp)
//  MAILBOX_MODULE (debug_mailbox.cpp)
//  FLASH_MODULE (flash_aware_memory.cpp)
//  RESET_MODULE (reset_catch.cpp, reset_sequencer.cpp)
//  CPU_CORE_MODULE (cpu_core.cpp, hardware_watchpoints.cpp)
//  TARGET_MODULE (target.cpp, session.cpp)
//  DEVICE_MODULE (devices/*.cpp)
//
// config.h is used to enable/disable error and/or debug logging for each of the modules.
// Example config.h lines which enable all logging for the debug mailbox module:
// #define LOGGING_MAILBOX_ERROR_ENABLED 1
// #define LOGGING_MAILBOX_DEBUG_ENABLED 1
//
// Messages are formatted with the <inttypes.h> PRIu32/PRIX32 macros so that the same format strings work for the
// firmware and host (unit test) builds.
#ifndef LOGGING_H_
#define LOGGING_H_

#include <inttypes.h>
#include <stdio.h>
#include "config.h"

#if defined(PIPELINE_MODULE)
    #define LOGGING_MODULE_FILENAME PIPELINE_MODULE

    #if LOGGING_PIPELINE_ERROR_ENABLED
        #define logError  logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_PIPELINE_DEBUG_ENABLED
        #define logDebug  logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (ACCESS_PORT_MODULE)
    #define LOGGING_MODULE_FILENAME ACCESS_PORT_MODULE

    #if LOGGING_ACCESS_PORT_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_ACCESS_PORT_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (MAILBOX_MODULE)
    #define LOGGING_MODULE_FILENAME MAILBOX_MODULE

    #if LOGGING_MAILBOX_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_MAILBOX_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (FLASH_MODULE)
    #define LOGGING_MODULE_FILENAME FLASH_MODULE

    #if LOGGING_FLASH_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_FLASH_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (RESET_MODULE)
    #define LOGGING_MODULE_FILENAME RESET_MODULE

    #if LOGGING_RESET_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_RESET_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (CPU_CORE_MODULE)
    #define LOGGING_MODULE_FILENAME CPU_CORE_MODULE

    #if LOGGING_CPU_CORE_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_CPU_CORE_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (TARGET_MODULE)
    #define LOGGING_MODULE_FILENAME TARGET_MODULE

    #if LOGGING_TARGET_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_TARGET_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (DEVICE_MODULE)
    #define LOGGING_MODULE_FILENAME DEVICE_MODULE

    #if LOGGING_DEVICE_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_DEVICE_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#endif // PIPELINE_MODULE


#define logError_(X) g_logErrorF("error: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logErrorF_(X, ...) g_logErrorF("error: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)
#define logDebug_(X) g_logDebugF("debug: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logDebugF_(X, ...) g_logDebugF("debug: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)
#define logInfo(X) printf(" info: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logInfoF(X, ...) printf(" info: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)

static int (*g_logErrorF)(const char* format, ...) = printf;
static int (*g_logDebugF)(const char* format, ...) = printf;

static int dummyf(const char* format, ...)
{
    return 0;
}

static inline void logErrorDisable()
{
    g_logErrorF = dummyf;
}

static inline void logErrorEnable()
{
    g_logErrorF = printf;
}

static inline void logDebugDisable()
{
    g_logDebugF = dummyf;
}

static inline void logDebugEnable()
{
    g_logDebugF = printf;
}

#endif // LOGGING_H_
