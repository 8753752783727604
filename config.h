/* Copyright 2024 Adam Green (https://github.com/adamgreen/)

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
// Configuration settings for swd-bringup. Most of the timing values here are only defaults and can be overridden at
// runtime through the SessionOptions of a Session object.
#ifndef CONFIG_H_
#define CONFIG_H_


// Should the debugger halt the CPU as soon as it attaches? This is useful to break out of an infinite reset loop.
#define HALT_ON_ATTACH false

// Maximum number of access ports to probe during discovery. Probing stops at the first absent AP before this.
#define MAX_AP_COUNT 8

// Number of milliseconds a core is given to leave reset (DHCSR.S_RESET_ST cleared) before the reset is considered to
// have failed.
#define RESET_EXIT_TIMEOUT_MS 2000

// Delay in milliseconds between attempts to read DHCSR after the read failed with a fault while leaving reset.
#define RESET_RETRY_DELAY_MS 10

// Number of milliseconds that the nRESET pin is held low for a hardware reset.
#define HARDWARE_RESET_PULSE_MS 20

// Maximum number of milliseconds to wait for the flash controller to complete a margin check.
#define FLASH_PROBE_TIMEOUT_MS 5000

// Delay in milliseconds between polls of the flash controller's status register during a margin check.
#define FLASH_PROBE_POLL_INTERVAL_MS 10

// Delay in microseconds between polls of the debug mailbox registers. 0 polls back to back.
#define DM_AP_POLL_INTERVAL_US 0

// Session wide timeout in milliseconds which bounds the debug mailbox polls that have no timeout of their own.
// 0 means that those polls are only bounded by cancellation of the session.
#define SESSION_TIMEOUT_MS 0

// Timeout in milliseconds to use when reading the DHCSR to obtain the halt and reset state.
#define READ_DHCSR_TIMEOUT_MS 1000

// Timeout in milliseconds to wait for a core register transfer through DCRSR/DCRDR to complete.
#define REGISTER_TRANSFER_TIMEOUT_MS 100


// Set each of these to 1 or 0 to enable or disable error/debug logging for each of the modules.
// task_pipeline.cpp logging
#define LOGGING_PIPELINE_ERROR_ENABLED 1
#define LOGGING_PIPELINE_DEBUG_ENABLED 0

// access_port.cpp logging
#define LOGGING_ACCESS_PORT_ERROR_ENABLED 1
#define LOGGING_ACCESS_PORT_DEBUG_ENABLED 0

// debug_mailbox.cpp logging
#define LOGGING_MAILBOX_ERROR_ENABLED 1
#define LOGGING_MAILBOX_DEBUG_ENABLED 1

// flash_aware_memory.cpp logging
#define LOGGING_FLASH_ERROR_ENABLED 1
#define LOGGING_FLASH_DEBUG_ENABLED 0

// reset_catch.cpp and reset_sequencer.cpp logging
#define LOGGING_RESET_ERROR_ENABLED 1
#define LOGGING_RESET_DEBUG_ENABLED 1

// cpu_core.cpp and hardware_watchpoints.cpp logging
#define LOGGING_CPU_CORE_ERROR_ENABLED 1
#define LOGGING_CPU_CORE_DEBUG_ENABLED 0

// target.cpp and session.cpp logging
#define LOGGING_TARGET_ERROR_ENABLED 1
#define LOGGING_TARGET_DEBUG_ENABLED 1

// Modules under the devices/ directory
#define LOGGING_DEVICE_ERROR_ENABLED 1
#define LOGGING_DEVICE_DEBUG_ENABLED 1

#endif // CONFIG_H_
