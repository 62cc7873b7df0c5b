#pragma once

#include "types.h"
#include <string>

std::string formatScore(int score);
std::string formatInfo(const SearchInfo& info);

void uci_loop();
