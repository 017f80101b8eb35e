#pragma once
#include <cstdint>
#include <string>

std::string seconds2human(uint64_t seconds, size_t maxUnits = 2);
