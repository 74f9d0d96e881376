#pragma once

#include "callbridge/callbridge_abi.h"

#ifdef __cplusplus
extern "C" {
#endif

// In-tree native runtime behind the callbridge ABI. Work runs on the libuv
// thread pool, so results arrive on worker threads like a real runtime's.
// The shared module build exports the same table as callbridge_native_api_v1.
const callbridge_native_api* callbridge_loopback_api(void);

#ifdef __cplusplus
}
#endif
