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
// Error code helpers.
#include "errors.h"


const char* errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ERROR_NONE:
        return "None";
    case ERROR_TRANSFER_FAULT:
        return "TransferFault";
    case ERROR_TRANSFER_TIMEOUT:
        return "TransferTimeout";
    case ERROR_TRANSPORT:
        return "OtherTransportError";
    case ERROR_STEP_NOT_FOUND:
        return "StepNotFound";
    case ERROR_DUPLICATE_STEP:
        return "DuplicateStep";
    case ERROR_PIPELINE_LOCKED:
        return "PipelineLocked";
    case ERROR_RESET_TIMEOUT:
        return "ResetTimeout";
    case ERROR_PROBE_TIMEOUT:
        return "ProbeTimeout";
    case ERROR_SESSION_TIMEOUT:
        return "SessionTimeout";
    case ERROR_CANCELLED:
        return "Cancelled";
    case ERROR_AP_NOT_FOUND:
        return "ApNotFound";
    case ERROR_INVALID_ARGUMENT:
        return "InvalidArgument";
    case ERROR_NO_FREE_COMPARATOR:
        return "NoFreeComparator";
    default:
        return "Unknown";
    }
}
