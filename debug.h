#ifndef PHOSPHOR8_DEBUG_H
#define PHOSPHOR8_DEBUG_H

#include <string>
#include <unordered_map>

constexpr int DEBUG_STATE = 0x01;
constexpr int DEBUG_ASM = 0x02;
constexpr int DEBUG_DRAW = 0x04;
constexpr int DEBUG_FAIL_ON_FAULT = 0x08;
constexpr int DEBUG_KEYS = 0x10;
constexpr int DEBUG_TIMING = 0x20;

extern std::unordered_map<std::string, int> keywordsToDebugFlags;
extern int debug;

#endif // PHOSPHOR8_DEBUG_H
