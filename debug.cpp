#include "debug.h"

std::unordered_map<std::string, int> keywordsToDebugFlags = {
    {"state", DEBUG_STATE},
    {"asm", DEBUG_ASM},
    {"draw", DEBUG_DRAW},
    {"fault", DEBUG_FAIL_ON_FAULT},
    {"keys", DEBUG_KEYS},
    {"timing", DEBUG_TIMING},
};

int debug = 0;
